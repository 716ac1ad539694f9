#include <cctype>
#include <cerrno>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include <fnmatch.h>
#include <algorithm>
#include <fmt/core.h>
#include "sample_sweep/utils.hpp"

namespace sample_sweep {

    namespace {
        constexpr std::size_t kUnitCount = 5;

        bool is_list_separator(char c) {
            return c == ',' || c == ';' || c == '\n' || c == '\r';
        }
    }

    std::string to_lowercase(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string& value) {
        auto begin = std::find_if_not(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isspace(c) != 0; });
        auto end = std::find_if_not(value.rbegin(), value.rend(),
                                    [](unsigned char c) { return std::isspace(c) != 0; }).base();
        if (begin >= end) {
            return {};
        }
        return std::string(begin, end);
    }

    std::string format_size(uintmax_t size) {
        static const char* kUnits[kUnitCount] = {"B", "KB", "MB", "GB", "TB"};
        std::size_t unit_index = 0;
        double value = static_cast<double>(size);
        while (value >= 1024.0 && unit_index < kUnitCount - 1) {
            value /= 1024.0;
            ++unit_index;
        }

        if (unit_index == 0) {
            return fmt::format("{:.0f} {}", value, kUnits[unit_index]);
        }
        return fmt::format("{:.2f} {}", value, kUnits[unit_index]);
    }

    std::string format_megabytes(uintmax_t size) {
        return fmt::format("{:.1f} MB", static_cast<double>(size) / (1024.0 * 1024.0));
    }

    std::string json_escape(const std::string& input) {
        std::ostringstream oss;
        for (unsigned char c : input) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (c < 0x20 || c > 0x7E) {
                        oss << "\\u"
                            << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c)
                            << std::dec << std::nouppercase;
                    } else {
                        oss << static_cast<char>(c);
                    }
            }
        }
        return oss.str();
    }

    std::string normalize_extension(const std::string& extension) {
        std::string lowered = to_lowercase(trim(extension));
        if (lowered.empty() || lowered.front() == '.') {
            return lowered;
        }
        return "." + lowered;
    }

    std::vector<std::string> split_list(const std::string& value) {
        std::vector<std::string> entries;
        std::string current;
        for (char c : value) {
            if (is_list_separator(c)) {
                if (auto entry = trim(current); !entry.empty()) {
                    entries.push_back(entry);
                }
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        if (auto entry = trim(current); !entry.empty()) {
            entries.push_back(entry);
        }
        return entries;
    }

    std::optional<bool> parse_bool(const std::string& value) {
        const std::string lowered = to_lowercase(trim(value));
        if (lowered == "yes" || lowered == "y" || lowered == "true" || lowered == "1" ||
            lowered == "on" || lowered == "enabled") {
            return true;
        }
        if (lowered == "no" || lowered == "n" || lowered == "false" || lowered == "0" ||
            lowered == "off" || lowered == "disabled") {
            return false;
        }
        return std::nullopt;
    }

    std::optional<unsigned long long> parse_unsigned(const std::string& value) {
        const std::string trimmed = trim(value);
        if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(),
                                            [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }

        errno = 0;
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(trimmed.c_str(), &end, 10);
        if (errno == ERANGE || end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return parsed;
    }

    bool glob_match(const std::string& pattern, const std::string& text) {
        const std::string lowered_pattern = to_lowercase(pattern);
        const std::string lowered_text = to_lowercase(text);
        return fnmatch(lowered_pattern.c_str(), lowered_text.c_str(), 0) == 0;
    }

    std::string relative_generic(const std::filesystem::path& root, const std::filesystem::path& path) {
        return path.lexically_relative(root).generic_string();
    }
}
