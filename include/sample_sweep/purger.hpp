#pragma once
#include <vector>
#include <filesystem>
#include "sample_sweep/types.hpp"
#include "sample_sweep/path_guard.hpp"

namespace sample_sweep {
    struct PurgeRequest {
        std::filesystem::path quarantine_root;
        unsigned int max_age_days = 0;
        std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now();
        // Quarantined during the current run; never aged in the same run.
        std::vector<std::filesystem::path> fresh;
        bool test_mode = false;
    };

    // Deletes quarantined files older than max_age_days and prunes the folders
    // they leave empty. A max age of zero disables the purge.
    PurgeResult purge_quarantine(const PathGuard& guard, const PurgeRequest& request);
}
