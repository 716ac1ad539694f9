#include <array>
#include <cctype>
#include <limits>
#include <cstdlib>
#include <algorithm>
#include <string_view>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>
#include "sample_sweep/utils.hpp"
#include "sample_sweep/options.hpp"

namespace sample_sweep {

    namespace {
        constexpr std::array<std::string_view, 19> kOptionNames = {
            "NZBPO_REMOVEDIRECTORIES", "NZBPO_REMOVEFILES", "NZBPO_DEBUG",
            "NZBPO_VIDEOSIZETHRESHOLDMB", "NZBPO_VIDEOEXTS", "NZBPO_AUDIOSIZETHRESHOLDMB",
            "NZBPO_AUDIOEXTS", "NZBPO_TESTMODE", "NZBPO_BLOCKIMPORTDURINGTEST",
            "NZBPO_RELATIVESIZE", "NZBPO_RELATIVEPERCENT", "NZBPO_PROTECTEDPATHS",
            "NZBPO_DENYPATTERNS", "NZBPO_JUNKTOKENS", "NZBPO_IMAGESAMPLES",
            "NZBPO_JUNKEXTRAS", "NZBPO_CATEGORYTHRESHOLDS", "NZBPO_QUARANTINEMODE",
            "NZBPO_QUARANTINEMAXAGEDAYS"};
        constexpr std::array<std::string_view, 5> kPostProcessNames = {
            "NZBPP_DIRECTORY", "NZBPP_STATUS", "NZBPP_TOTALSTATUS", "NZBPP_NZBNAME", "NZBPP_CATEGORY"};

        constexpr const char* kDefaultVideoExtensions = ".mkv,.mp4,.avi,.mov,.wmv,.flv,.webm,.ts,.m4v,.vob";
        constexpr const char* kDefaultAudioExtensions = ".wav,.aiff,.mp3,.flac,.m4a,.ogg,.aac,.alac,.ape,.opus,.wma";

        // Largest megabyte value whose byte count still fits in uintmax_t.
        constexpr unsigned long long kMaxMegabytes =
            std::numeric_limits<std::uintmax_t>::max() / kBytesPerMegabyte;

        std::string to_uppercase(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return value;
        }

        std::string option_key(const std::string& name) {
            std::string upper = to_uppercase(trim(name));
            if (upper.rfind("NZBPO_", 0) == 0 || upper.rfind("NZBPP_", 0) == 0) {
                return upper;
            }
            return "NZBPO_" + upper;
        }

        // Strips the NZBPO_ prefix so messages name the option the way the UI does.
        std::string display_name(const std::string& key) {
            return key.rfind("NZBPO_", 0) == 0 ? key.substr(6) : key;
        }

        std::optional<std::string> lookup(const RawOptions& options, const std::string& key) {
            auto it = options.find(key);
            if (it == options.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        class OptionReader {
        public:
            explicit OptionReader(const RawOptions& options) : options_(options) {}

            bool read_bool(const std::string& key, bool fallback) {
                auto raw = lookup(options_, key);
                if (!raw || trim(*raw).empty()) {
                    return fallback;
                }
                if (auto parsed = parse_bool(*raw)) {
                    return *parsed;
                }
                fail(fmt::format("Option {} has invalid boolean value '{}'", display_name(key), *raw));
                return fallback;
            }

            unsigned long long read_unsigned(const std::string& key, unsigned long long fallback,
                                             unsigned long long maximum) {
                auto raw = lookup(options_, key);
                if (!raw || trim(*raw).empty()) {
                    return fallback;
                }
                auto parsed = parse_unsigned(*raw);
                if (!parsed) {
                    fail(fmt::format("Option {} has invalid numeric value '{}'", display_name(key), *raw));
                    return fallback;
                }
                if (*parsed > maximum) {
                    fail(fmt::format("Option {} is out of range: {} (maximum {})", display_name(key), *parsed, maximum));
                    return fallback;
                }
                return *parsed;
            }

            std::string read_string(const std::string& key, const std::string& fallback = "") {
                auto raw = lookup(options_, key);
                return raw ? trim(*raw) : fallback;
            }

            void fail(const std::string& message) {
                if (error_message_.empty()) {
                    error_message_ = message;
                }
            }

            bool failed() const { return !error_message_.empty(); }
            const std::string& error_message() const { return error_message_; }

        private:
            const RawOptions& options_;
            std::string error_message_;
        };

        std::vector<std::string> parse_extensions(const std::string& value) {
            std::vector<std::string> extensions;
            for (const auto& entry : split_list(value)) {
                // Extension lists are also accepted whitespace separated.
                std::string token;
                for (char c : entry + " ") {
                    if (std::isspace(static_cast<unsigned char>(c))) {
                        if (!token.empty()) {
                            std::string normalized = normalize_extension(token);
                            if (std::find(extensions.begin(), extensions.end(), normalized) == extensions.end()) {
                                extensions.push_back(normalized);
                            }
                            token.clear();
                        }
                    } else {
                        token.push_back(c);
                    }
                }
            }
            return extensions;
        }

        std::optional<std::string> yaml_value(const YAML::Node& node) {
            if (node.IsNull()) {
                return std::string();
            }
            if (node.IsScalar()) {
                return node.as<std::string>();
            }
            if (node.IsSequence()) {
                std::string joined;
                for (const auto& element : node) {
                    if (!element.IsScalar()) {
                        return std::nullopt;
                    }
                    if (!joined.empty()) {
                        joined += ",";
                    }
                    joined += element.as<std::string>();
                }
                return joined;
            }
            return std::nullopt;
        }
    }

    EnvLookup process_environment() {
        return [](const std::string& name) -> std::optional<std::string> {
            if (const char* value = std::getenv(name.c_str())) {
                return std::string(value);
            }
            return std::nullopt;
        };
    }

    RawOptions collect_environment_options(const EnvLookup& lookup_env) {
        RawOptions options;
        for (std::string_view name : kOptionNames) {
            if (auto value = lookup_env(std::string(name))) {
                options[std::string(name)] = *value;
            }
        }
        for (std::string_view name : kPostProcessNames) {
            if (auto value = lookup_env(std::string(name))) {
                options[std::string(name)] = *value;
            }
        }
        return options;
    }

    OptionFileResult load_option_file(const std::filesystem::path& path) {
        OptionFileResult result;
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            if (root.IsNull()) {
                return result;
            }
            if (!root.IsMap()) {
                result.valid = false;
                result.error_message = "Option file " + path.string() + " must contain a mapping of option names";
                return result;
            }
            for (const auto& entry : root) {
                const std::string name = entry.first.as<std::string>();
                auto value = yaml_value(entry.second);
                if (!value) {
                    result.valid = false;
                    result.error_message = "Option " + name + " in " + path.string() + " must be a scalar or a list";
                    return result;
                }
                result.options[option_key(name)] = *value;
            }
        } catch (const YAML::Exception& ex) {
            result.valid = false;
            result.error_message = "Unable to read option file " + path.string() + ": " + ex.what();
        }
        return result;
    }

    void merge_options(RawOptions& base, const RawOptions& overrides) {
        for (const auto& [key, value] : overrides) {
            base[key] = value;
        }
    }

    CategoryParseResult parse_category_thresholds(const std::string& value) {
        CategoryParseResult result;
        for (const auto& entry : split_list(value)) {
            const auto equals = entry.find('=');
            if (equals == std::string::npos) {
                result.valid = false;
                result.error_message = "Category threshold '" + entry + "' must look like category=videoMB[/audioMB[/relative%]]";
                return result;
            }

            const std::string category = to_lowercase(trim(entry.substr(0, equals)));
            if (category.empty()) {
                result.valid = false;
                result.error_message = "Category threshold '" + entry + "' has no category name";
                return result;
            }

            std::vector<std::string> fields;
            std::string remainder = entry.substr(equals + 1);
            std::string::size_type start = 0;
            while (true) {
                const auto slash = remainder.find('/', start);
                fields.push_back(trim(remainder.substr(start, slash - start)));
                if (slash == std::string::npos) {
                    break;
                }
                start = slash + 1;
            }
            if (fields.size() > 3) {
                result.valid = false;
                result.error_message = "Category threshold '" + entry + "' has too many fields";
                return result;
            }

            CategoryOverride override_value;
            for (std::size_t index = 0; index < fields.size(); ++index) {
                if (fields[index].empty()) {
                    continue;
                }
                auto parsed = parse_unsigned(fields[index]);
                const unsigned long long maximum = index == 2 ? 100 : kMaxMegabytes;
                if (!parsed || *parsed > maximum) {
                    result.valid = false;
                    result.error_message = "Category threshold '" + entry + "' has invalid value '" + fields[index] + "'";
                    return result;
                }
                if (index == 0) {
                    override_value.video_threshold_bytes = static_cast<std::uintmax_t>(*parsed) * kBytesPerMegabyte;
                } else if (index == 1) {
                    override_value.audio_threshold_bytes = static_cast<std::uintmax_t>(*parsed) * kBytesPerMegabyte;
                } else {
                    override_value.relative_percent = static_cast<int>(*parsed);
                }
            }
            result.overrides[category] = override_value;
        }
        return result;
    }

    ConfigParseResult parse_configuration(const RawOptions& options) {
        ConfigParseResult result;
        Configuration& config = result.config;
        OptionReader reader(options);

        config.nzb_name = reader.read_string("NZBPP_NZBNAME");
        config.category = reader.read_string("NZBPP_CATEGORY");
        config.status_text = reader.read_string("NZBPP_STATUS");
        if (config.status_text.empty()) {
            config.status_text = reader.read_string("NZBPP_TOTALSTATUS");
        }
        config.status_succeeded = config.status_text.empty() ||
                                  to_lowercase(config.status_text).rfind("success", 0) == 0;

        const std::string directory = reader.read_string("NZBPP_DIRECTORY");
        if (!directory.empty()) {
            std::error_code absolute_error;
            config.root = std::filesystem::absolute(directory, absolute_error);
            if (absolute_error) {
                config.root = directory;
            }
        }

        // A failed download is skipped before any other option is validated.
        if (!config.status_succeeded) {
            return result;
        }

        if (directory.empty()) {
            result.valid = false;
            result.error_message = "NZBPP_DIRECTORY missing - script must run in post-processing mode or be given a directory";
            return result;
        }

        config.remove_directories = reader.read_bool("NZBPO_REMOVEDIRECTORIES", true);
        config.remove_files = reader.read_bool("NZBPO_REMOVEFILES", true);
        config.debug = reader.read_bool("NZBPO_DEBUG", false);
        config.test_mode = reader.read_bool("NZBPO_TESTMODE", false);
        config.block_import_during_test = reader.read_bool("NZBPO_BLOCKIMPORTDURINGTEST", false);
        config.relative_size_enabled = reader.read_bool("NZBPO_RELATIVESIZE", false);
        config.image_samples = reader.read_bool("NZBPO_IMAGESAMPLES", false);
        config.junk_extras = reader.read_bool("NZBPO_JUNKEXTRAS", false);
        config.quarantine_mode = reader.read_bool("NZBPO_QUARANTINEMODE", false);

        config.video_threshold_bytes =
            static_cast<std::uintmax_t>(reader.read_unsigned("NZBPO_VIDEOSIZETHRESHOLDMB", 150, kMaxMegabytes)) *
            kBytesPerMegabyte;
        config.audio_threshold_bytes =
            static_cast<std::uintmax_t>(reader.read_unsigned("NZBPO_AUDIOSIZETHRESHOLDMB", 2, kMaxMegabytes)) *
            kBytesPerMegabyte;
        config.relative_percent = static_cast<int>(reader.read_unsigned("NZBPO_RELATIVEPERCENT", 8, 100));
        config.quarantine_max_age_days = static_cast<unsigned int>(
            reader.read_unsigned("NZBPO_QUARANTINEMAXAGEDAYS", 0, 36500));

        config.video_extensions = parse_extensions(reader.read_string("NZBPO_VIDEOEXTS", kDefaultVideoExtensions));
        config.audio_extensions = parse_extensions(reader.read_string("NZBPO_AUDIOEXTS", kDefaultAudioExtensions));
        config.protected_patterns = split_list(reader.read_string("NZBPO_PROTECTEDPATHS"));
        config.deny_patterns = split_list(reader.read_string("NZBPO_DENYPATTERNS"));
        for (const auto& token : split_list(reader.read_string("NZBPO_JUNKTOKENS"))) {
            config.junk_tokens.push_back(to_lowercase(token));
        }

        if (reader.failed()) {
            result.valid = false;
            result.error_message = reader.error_message();
            return result;
        }

        auto categories = parse_category_thresholds(reader.read_string("NZBPO_CATEGORYTHRESHOLDS"));
        if (!categories.valid) {
            result.valid = false;
            result.error_message = categories.error_message;
            return result;
        }
        config.category_overrides = std::move(categories.overrides);

        return result;
    }
}
