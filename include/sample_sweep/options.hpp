#pragma once
#include <map>
#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include "sample_sweep/types.hpp"

namespace sample_sweep {
    // Raw option values keyed by their NZBGet variable name (NZBPO_* / NZBPP_*).
    using RawOptions = std::map<std::string, std::string>;
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    struct OptionFileResult {
        bool valid = true;
        RawOptions options;
        std::string error_message;
    };

    struct CategoryParseResult {
        bool valid = true;
        std::map<std::string, CategoryOverride> overrides;
        std::string error_message;
    };

    EnvLookup process_environment();
    RawOptions collect_environment_options(const EnvLookup& lookup);
    OptionFileResult load_option_file(const std::filesystem::path& path);
    void merge_options(RawOptions& base, const RawOptions& overrides);

    CategoryParseResult parse_category_thresholds(const std::string& value);
    ConfigParseResult parse_configuration(const RawOptions& options);
}
