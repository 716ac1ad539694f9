#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace sample_sweep {
    std::string to_lowercase(std::string value);
    std::string trim(const std::string& value);
    std::string format_size(uintmax_t size);
    std::string format_megabytes(uintmax_t size);
    std::string json_escape(const std::string& input);

    // Lower-cased with a leading dot; empty input stays empty.
    std::string normalize_extension(const std::string& extension);

    // Splits on commas, semicolons and newlines, dropping empty entries.
    std::vector<std::string> split_list(const std::string& value);

    std::optional<bool> parse_bool(const std::string& value);
    std::optional<unsigned long long> parse_unsigned(const std::string& value);

    // Case-insensitive shell glob; '*' also crosses '/' so "*.srt" matches nested paths.
    bool glob_match(const std::string& pattern, const std::string& text);

    std::string relative_generic(const std::filesystem::path& root, const std::filesystem::path& path);
}
