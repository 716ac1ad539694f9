#include <chrono>
#include <gtest/gtest.h>
#include "test_support.hpp"
#include "sample_sweep/purger.hpp"

using namespace sample_sweep;
using namespace sample_sweep::test_support;

namespace {
    void age(const std::filesystem::path& path, int days) {
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - std::chrono::hours(24 * days));
    }

    PurgeRequest request_for(const TempTree& tree, unsigned int max_age_days) {
        PurgeRequest request;
        request.quarantine_root = tree.path(kQuarantineFolderName);
        request.max_age_days = max_age_days;
        return request;
    }
}

TEST(PurgeQuarantine, DisabledAtZeroDays) {
    TempTree tree;
    age(tree.write_file("_samples_quarantine/old.mkv"), 30);

    const PurgeResult result = purge_quarantine(PathGuard(tree.root()), request_for(tree, 0));

    EXPECT_FALSE(result.enabled);
    EXPECT_EQ(result.purged, 0u);
    EXPECT_TRUE(tree.exists("_samples_quarantine/old.mkv"));
}

TEST(PurgeQuarantine, MissingFolderIsNotAnError) {
    TempTree tree;
    const PurgeResult result = purge_quarantine(PathGuard(tree.root()), request_for(tree, 7));

    EXPECT_FALSE(result.enabled);
    EXPECT_TRUE(result.failures.empty());
}

TEST(PurgeQuarantine, DeletesOnlyEntriesOlderThanMaxAge) {
    TempTree tree;
    age(tree.write_file("_samples_quarantine/Show/old.mkv"), 10);
    age(tree.write_file("_samples_quarantine/young.mkv"), 2);

    const PurgeResult result = purge_quarantine(PathGuard(tree.root()), request_for(tree, 7));

    EXPECT_TRUE(result.enabled);
    EXPECT_EQ(result.purged, 1u);
    EXPECT_EQ(result.purged_entries, (std::vector<std::string>{"Show/old.mkv"}));
    EXPECT_EQ(result.directories_pruned, 1u);
    EXPECT_FALSE(tree.exists("_samples_quarantine/Show"));
    EXPECT_TRUE(tree.exists("_samples_quarantine/young.mkv"));
    EXPECT_TRUE(tree.exists("_samples_quarantine"));
    EXPECT_TRUE(result.failures.empty());
}

TEST(PurgeQuarantine, SkipsEntriesQuarantinedThisRun) {
    TempTree tree;
    const auto moved = tree.write_file("_samples_quarantine/Movie/sample.mkv");
    age(moved, 40);

    PurgeRequest request = request_for(tree, 7);
    request.fresh = {moved};
    const PurgeResult result = purge_quarantine(PathGuard(tree.root()), request);

    EXPECT_EQ(result.purged, 0u);
    EXPECT_TRUE(tree.exists("_samples_quarantine/Movie/sample.mkv"));
}

TEST(PurgeQuarantine, TestModeOnlyCounts) {
    TempTree tree;
    age(tree.write_file("_samples_quarantine/old.mkv"), 30);

    PurgeRequest request = request_for(tree, 7);
    request.test_mode = true;
    const PurgeResult result = purge_quarantine(PathGuard(tree.root()), request);

    EXPECT_EQ(result.purged, 1u);
    EXPECT_TRUE(tree.exists("_samples_quarantine/old.mkv"));
}

TEST(PurgeQuarantine, NeverFollowsLinks) {
    TempTree tree;
    TempTree outside;
    age(outside.write_file("keep/old.mkv"), 90);
    tree.make_dir(kQuarantineFolderName);
    std::filesystem::create_directory_symlink(outside.path("keep"), tree.path("_samples_quarantine/keep"));

    const PurgeResult result = purge_quarantine(PathGuard(tree.root()), request_for(tree, 7));

    EXPECT_EQ(result.purged, 0u);
    EXPECT_TRUE(outside.exists("keep/old.mkv"));
}
