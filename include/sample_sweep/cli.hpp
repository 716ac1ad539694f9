#pragma once
#include <string>
#include "sample_sweep/types.hpp"

namespace sample_sweep {
    void print_help(const std::string& program_name);
    CliParseResult parse_cli(int argc, char* argv[]);
}
