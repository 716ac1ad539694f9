#include <string>
#include <utility>
#include "sample_sweep/app.hpp"
#include "sample_sweep/log.hpp"
#include "sample_sweep/engine.hpp"
#include "sample_sweep/report.hpp"

namespace sample_sweep {

    // NZBGet post-processing exit codes.
    namespace {
        constexpr int kPostProcessSuccess = 93;
        constexpr int kPostProcessError = 94;
        constexpr int kPostProcessNone = 95;
    }

    int exit_code(RunDisposition disposition) {
        switch (disposition) {
            case RunDisposition::Success: return kPostProcessSuccess;
            case RunDisposition::NoAction: return kPostProcessNone;
            case RunDisposition::Error:
            case RunDisposition::PartialError: return kPostProcessError;
        }
        return kPostProcessError;
    }

    RunReport run_application(const CliParseResult& cli, const EnvLookup& environment, std::ostream& out) {
        Logger log(out, cli.verbose);
        log.detail("RemoveSamples extension started");

        std::string option_file_error;
        RawOptions raw;
        if (cli.config_path) {
            auto file = load_option_file(*cli.config_path);
            if (file.valid) {
                raw = std::move(file.options);
            } else {
                option_file_error = file.error_message;
            }
        }
        merge_options(raw, collect_environment_options(environment));
        if (cli.directory) {
            raw["NZBPP_DIRECTORY"] = *cli.directory;
        }
        if (cli.dry_run) {
            raw["NZBPO_TESTMODE"] = "yes";
        }

        auto parsed = parse_configuration(raw);
        // A failed download is skipped even when its options are broken.
        const bool download_failed = parsed.valid && !parsed.config.status_succeeded;

        RunReport report;
        if (!download_failed && !option_file_error.empty()) {
            report = configuration_failure(option_file_error, log);
        } else if (!parsed.valid) {
            report = configuration_failure(parsed.error_message, log);
        } else {
            if (parsed.config.debug) {
                log.set_debug_enabled(true);
            }
            report = run_engine(parsed.config, log);
        }

        if (cli.json_output) {
            out << render_json(report) << "\n";
        }
        if (report.disposition == RunDisposition::Success) {
            log.detail("RemoveSamples extension completed successfully");
        }
        return report;
    }
}
