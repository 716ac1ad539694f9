#include <iostream>
#include "sample_sweep/app.hpp"
#include "sample_sweep/cli.hpp"

int main(int argc, char* argv[]) {
    auto options = sample_sweep::parse_cli(argc, argv);

    if (!options.valid) {
        std::cerr << "\033[1;31m" << options.error_message << "\033[0m\n";
        std::cerr << "\033[1;31mUsage: " << argv[0] << " [options] [directory]\033[0m\n";
        return sample_sweep::exit_code(sample_sweep::RunDisposition::Error);
    }

    if (options.show_help) {
        sample_sweep::print_help(argv[0]);
        return 0;
    }

    const auto report = sample_sweep::run_application(options, sample_sweep::process_environment(), std::cout);
    return sample_sweep::exit_code(report.disposition);
}
