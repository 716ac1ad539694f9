#include <vector>
#include <iostream>
#include "sample_sweep/cli.hpp"

namespace sample_sweep {

    namespace {
        void append_usage(std::ostream& out, const std::string& program_name) {
            out << "Usage: " << program_name << " [options] [directory]\n"
                << "\n"
                << "Remove sample clips and release junk from a completed download:\n"
                << "  - Protected and deny patterns, sample name tokens and size thresholds\n"
                << "  - Relative size detection against the largest video in each folder\n"
                << "  - Test mode (simulate only) and quarantine mode (move instead of delete)\n"
                << "  - Age-based cleanup of the quarantine folder\n"
                << "\n"
                << "Options are read from NZBPO_* environment variables (NZBGet extension mode)\n"
                << "and optionally from a YAML file; the environment wins.\n"
                << "\n"
                << "Options:\n"
                << "  -h, -help, --help    Show this help message and exit\n"
                << "  -c, --config FILE    Read options from a YAML file\n"
                << "  -v, --verbose        Log every classification decision\n"
                << "  -n, --dry-run        Force test mode (no file is touched)\n"
                << "  --json               Print the run report as JSON after the summary\n";
        }
    }

    void print_help(const std::string& program_name) {
        append_usage(std::cout, program_name);
    }

    CliParseResult parse_cli(int argc, char* argv[]) {
        CliParseResult result;
        bool literal_mode = false;
        std::vector<std::string> positional;

        for (int index = 1; index < argc; ++index) {
            std::string argument = argv[index];
            if (!literal_mode) {
                if (argument == "--") {
                    literal_mode = true;
                    continue;
                }
                if (argument == "-h" || argument == "--help" || argument == "-help") {
                    result.show_help = true;
                    continue;
                }
                if (argument == "--json") {
                    result.json_output = true;
                    continue;
                }
                if (argument == "-v" || argument == "--verbose") {
                    result.verbose = true;
                    continue;
                }
                if (argument == "-n" || argument == "--dry-run") {
                    result.dry_run = true;
                    continue;
                }
                if (argument == "-c" || argument == "--config") {
                    if (index + 1 >= argc) {
                        result.valid = false;
                        result.error_message = "Missing value for " + argument;
                        return result;
                    }
                    result.config_path = std::string(argv[++index]);
                    continue;
                }
                if (argument.rfind("--config=", 0) == 0) {
                    result.config_path = argument.substr(9);
                    continue;
                }
                if (!argument.empty() && argument.front() == '-') {
                    result.valid = false;
                    result.error_message = "Unknown option: " + argument;
                    return result;
                }
            }
            positional.push_back(argument);
        }

        if (positional.size() > 1) {
            result.valid = false;
            result.error_message = "Unexpected extra argument: " + positional[1];
        } else if (!positional.empty()) {
            result.directory = positional.front();
        }

        return result;
    }
}
