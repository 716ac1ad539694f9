#pragma once
#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace sample_sweep {
    constexpr const char* kQuarantineFolderName = "_samples_quarantine";
    constexpr std::uintmax_t kBytesPerMegabyte = 1024 * 1024;

    struct CliParseResult {
        bool valid = true;
        bool show_help = false;
        bool json_output = false;
        bool verbose = false;
        bool dry_run = false;
        std::optional<std::string> config_path;
        std::optional<std::string> directory;
        std::string error_message;
    };

    // Thresholds a category may override; an absent field keeps the global value.
    struct CategoryOverride {
        std::optional<std::uintmax_t> video_threshold_bytes;
        std::optional<std::uintmax_t> audio_threshold_bytes;
        std::optional<int> relative_percent;
    };

    struct Configuration {
        std::filesystem::path root;
        std::string nzb_name;
        std::string category;
        bool status_succeeded = true;
        std::string status_text;

        bool remove_files = true;
        bool remove_directories = true;
        bool debug = false;
        bool test_mode = false;
        bool block_import_during_test = false;
        bool quarantine_mode = false;
        bool image_samples = false;
        bool junk_extras = false;
        bool relative_size_enabled = false;

        std::uintmax_t video_threshold_bytes = 150 * kBytesPerMegabyte;
        std::uintmax_t audio_threshold_bytes = 2 * kBytesPerMegabyte;
        int relative_percent = 8;
        unsigned int quarantine_max_age_days = 0;

        std::vector<std::string> video_extensions;
        std::vector<std::string> audio_extensions;
        std::vector<std::string> protected_patterns;
        std::vector<std::string> deny_patterns;
        std::vector<std::string> junk_tokens;

        // Keys are lower-cased category names.
        std::map<std::string, CategoryOverride> category_overrides;
    };

    struct ConfigParseResult {
        bool valid = true;
        Configuration config;
        std::string error_message;
    };

    struct EffectiveThresholds {
        std::uintmax_t video_threshold_bytes = 0;
        std::uintmax_t audio_threshold_bytes = 0;
        int relative_percent = 0;
        bool category_override = false;
    };

    enum class ItemKind { File, Directory };

    struct CandidateItem {
        std::filesystem::path path;
        std::string relative;
        std::string name;
        ItemKind kind = ItemKind::File;
        std::uintmax_t size_bytes = 0;
        std::string extension;
        std::string parent;
        std::size_t depth = 0;
    };

    enum class GuardStatus { Contained, PathEscape, UnsafeLink };

    struct UnsafeEntry {
        std::filesystem::path path;
        GuardStatus status = GuardStatus::UnsafeLink;
        std::string reason;
    };

    struct ScanResult {
        std::vector<CandidateItem> items;
        std::vector<UnsafeEntry> unsafe;
        std::vector<std::string> warnings;
        std::size_t files_checked = 0;
        std::size_t directories_checked = 0;
    };

    struct VideoSiblingGroup {
        std::uintmax_t max_size_bytes = 0;
        std::size_t member_count = 0;
    };

    enum class Disposition { Keep, Remove };

    enum class RuleId {
        Protected,
        ProtectedDescendant,
        Deny,
        NamePattern,
        InheritedMatch,
        VideoSize,
        RelativeSize,
        AudioSize,
        ImageSample,
        JunkExtra,
        RemovalDisabled,
        NoMatch
    };

    struct Verdict {
        Disposition disposition = Disposition::Keep;
        std::vector<RuleId> rules;
        std::string detail;
    };

    enum class OutcomeKind { Simulated, Removed, Quarantined, KeptProtected, Failed };

    struct ActionOutcome {
        OutcomeKind kind = OutcomeKind::Simulated;
        ItemKind item_kind = ItemKind::File;
        std::string relative;
        std::uintmax_t bytes = 0;
        std::optional<std::filesystem::path> destination;
        std::string reason;
    };

    struct PurgeResult {
        bool enabled = false;
        std::size_t purged = 0;
        std::size_t directories_pruned = 0;
        std::vector<std::string> purged_entries;
        std::vector<std::string> failures;
    };

    enum class RunDisposition { NoAction, Success, Error, PartialError };

    struct RunReport {
        std::size_t files_removed = 0;
        std::size_t directories_removed = 0;
        std::size_t quarantined = 0;
        std::size_t simulated = 0;
        std::size_t kept_protected = 0;
        std::size_t skipped_unsafe = 0;
        std::size_t errors = 0;
        std::size_t purged = 0;
        std::size_t purge_errors = 0;
        std::size_t remove_verdicts = 0;
        std::size_t files_checked = 0;
        std::size_t directories_checked = 0;
        std::uintmax_t bytes_reclaimed = 0;
        std::vector<std::string> failures;
        std::string mode = "LIVE";
        bool configuration_error = false;
        bool import_blocked = false;
        RunDisposition disposition = RunDisposition::Success;
    };
}
