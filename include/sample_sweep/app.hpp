#pragma once
#include <ostream>
#include "sample_sweep/types.hpp"
#include "sample_sweep/options.hpp"

namespace sample_sweep {
    // Assembles options (YAML file, environment, command line), runs one sweep
    // and writes the log and the optional JSON report to `out`.
    RunReport run_application(const CliParseResult& cli, const EnvLookup& environment, std::ostream& out);

    // NZBGet post-processing exit code for a run disposition.
    int exit_code(RunDisposition disposition);
}
