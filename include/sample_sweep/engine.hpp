#pragma once
#include <string>
#include "sample_sweep/log.hpp"
#include "sample_sweep/types.hpp"

namespace sample_sweep {
    // One complete run: precondition check, scan, classify and act per item,
    // quarantine purge, final disposition. Logs the summary line.
    RunReport run_engine(const Configuration& config, Logger& log);

    // Report for a run that stopped on an invalid configuration before scanning.
    RunReport configuration_failure(const std::string& message, Logger& log);

    std::string run_mode(const Configuration& config);
}
