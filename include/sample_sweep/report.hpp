#pragma once
#include <string>
#include "sample_sweep/types.hpp"

namespace sample_sweep {
    void record_outcome(RunReport& report, const ActionOutcome& outcome);
    void record_purge(RunReport& report, const PurgeResult& purge);

    // Derives the final disposition from the collected counters.
    void finalize_report(RunReport& report, bool precondition_failed);

    std::string disposition_name(RunDisposition disposition);
    std::string summary_line(const RunReport& report);
    std::string render_json(const RunReport& report);
}
