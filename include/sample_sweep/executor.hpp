#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "sample_sweep/types.hpp"
#include "sample_sweep/path_guard.hpp"

namespace sample_sweep {
    // Turns verdicts into filesystem effects. Every failure is reported as a
    // Failed outcome; nothing is retried and nothing is thrown.
    class ActionExecutor {
    public:
        ActionExecutor(const PathGuard& guard, const Configuration& config, std::filesystem::path quarantine_root);

        // No outcome for plain keeps; KeptProtected for rule 1 keeps.
        std::optional<ActionOutcome> apply(const CandidateItem& item, const Verdict& verdict);

        // Quarantine destinations created by this executor.
        const std::vector<std::filesystem::path>& quarantined_paths() const { return quarantined_paths_; }

        // Non-fatal problems noticed while acting (e.g. timestamps not updated).
        std::vector<std::string> take_warnings();

    private:
        ActionOutcome remove_item(const CandidateItem& item, ActionOutcome outcome);
        ActionOutcome quarantine_item(const CandidateItem& item, ActionOutcome outcome);
        void stamp_quarantine_time(const std::filesystem::path& destination);

        const PathGuard& guard_;
        const Configuration& config_;
        std::filesystem::path quarantine_root_;
        std::vector<std::filesystem::path> quarantined_paths_;
        std::vector<std::string> warnings_;
    };

    // Deterministic n-th alternative name for a quarantine destination; 0 is the path itself.
    std::filesystem::path disambiguated_path(const std::filesystem::path& destination, bool is_directory, unsigned int attempt);

    std::uintmax_t directory_size(const std::filesystem::path& path, std::vector<std::string>& warnings);
}
