#include <gtest/gtest.h>
#include "test_support.hpp"
#include "sample_sweep/executor.hpp"

using namespace sample_sweep;
using namespace sample_sweep::test_support;

namespace {
    Verdict removal(RuleId rule) {
        return Verdict{Disposition::Remove, {rule}, "test"};
    }

    std::filesystem::path quarantine_of(const TempTree& tree) {
        return tree.path(kQuarantineFolderName);
    }
}

TEST(ActionExecutor, KeepsProduceNoActionUnlessProtected) {
    TempTree tree;
    const Configuration config = default_config(tree.root());
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    const CandidateItem item = file_item("movie.srt", 100, tree.root());
    EXPECT_FALSE(executor.apply(item, Verdict{Disposition::Keep, {RuleId::NoMatch}, ""}).has_value());

    auto protected_outcome = executor.apply(item, Verdict{Disposition::Keep, {RuleId::Protected}, ""});
    ASSERT_TRUE(protected_outcome.has_value());
    EXPECT_EQ(protected_outcome->kind, OutcomeKind::KeptProtected);
}

TEST(ActionExecutor, TestModeNeverTouchesTheTree) {
    TempTree tree;
    tree.write_file("Sample/clip.mkv", 40 * kMB);
    tree.write_file("movie.sample.mkv", 90 * kMB);
    const auto before = tree.snapshot();

    Configuration config = default_config(tree.root());
    config.test_mode = true;
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    auto outcome = executor.apply(dir_item("Sample", tree.root()), removal(RuleId::NamePattern));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Simulated);

    outcome = executor.apply(file_item("movie.sample.mkv", 90 * kMB, tree.root()), removal(RuleId::NamePattern));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Simulated);
    EXPECT_EQ(outcome->bytes, 90 * kMB);

    EXPECT_EQ(tree.snapshot(), before);
}

TEST(ActionExecutor, DeletesFilesAndDirectories) {
    TempTree tree;
    tree.write_file("Sample/clip.mkv", 3000);
    tree.write_file("Sample/nested/more.mkv", 1000);
    tree.write_file("trailer.mp4", 500);
    tree.write_file("movie.mkv", 9000);

    const Configuration config = default_config(tree.root());
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    auto outcome = executor.apply(dir_item("Sample", tree.root()), removal(RuleId::NamePattern));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Removed);
    EXPECT_EQ(outcome->bytes, 4000u);

    outcome = executor.apply(file_item("trailer.mp4", 500, tree.root()), removal(RuleId::VideoSize));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Removed);

    EXPECT_FALSE(tree.exists("Sample"));
    EXPECT_FALSE(tree.exists("trailer.mp4"));
    EXPECT_TRUE(tree.exists("movie.mkv"));
}

TEST(ActionExecutor, VanishedItemIsReportedAsFailure) {
    TempTree tree;
    const Configuration config = default_config(tree.root());
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    auto outcome = executor.apply(file_item("gone.mkv", 10, tree.root()), removal(RuleId::VideoSize));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Failed);
    EXPECT_FALSE(outcome->reason.empty());
}

TEST(ActionExecutor, RefusesLinkedAndOutsidePaths) {
    TempTree tree;
    TempTree outside;
    outside.write_file("precious.mkv", 10);
    std::filesystem::create_symlink(outside.path("precious.mkv"), tree.path("sample.mkv"));

    const Configuration config = default_config(tree.root());
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    auto outcome = executor.apply(file_item("sample.mkv", 10, tree.root()), removal(RuleId::NamePattern));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Failed);

    CandidateItem escaping = file_item("precious.mkv", 10, tree.root());
    escaping.path = outside.path("precious.mkv");
    outcome = executor.apply(escaping, removal(RuleId::VideoSize));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Failed);

    EXPECT_TRUE(outside.exists("precious.mkv"));
}

TEST(ActionExecutor, QuarantinePreservesRelativeLayout) {
    TempTree tree;
    tree.write_file("Sample/clip.mkv", 2048);

    Configuration config = default_config(tree.root());
    config.quarantine_mode = true;
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    auto outcome = executor.apply(file_item("Sample/clip.mkv", 2048, tree.root()), removal(RuleId::InheritedMatch));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Quarantined);
    ASSERT_TRUE(outcome->destination.has_value());
    EXPECT_EQ(*outcome->destination, tree.path("_samples_quarantine/Sample/clip.mkv"));

    EXPECT_FALSE(tree.exists("Sample/clip.mkv"));
    EXPECT_TRUE(tree.exists("_samples_quarantine/Sample/clip.mkv"));
    EXPECT_EQ(executor.quarantined_paths().size(), 1u);
}

TEST(ActionExecutor, QuarantineNeverOverwrites) {
    TempTree tree;
    tree.write_file("_samples_quarantine/sample.mkv", 111);
    tree.write_file("_samples_quarantine/sample.1.mkv", 222);
    tree.write_file("sample.mkv", 333);
    tree.write_file("Sample/a.mkv", 10);
    tree.make_dir("_samples_quarantine/Sample");

    Configuration config = default_config(tree.root());
    config.quarantine_mode = true;
    PathGuard guard(tree.root());
    ActionExecutor executor(guard, config, quarantine_of(tree));

    auto outcome = executor.apply(file_item("sample.mkv", 333, tree.root()), removal(RuleId::NamePattern));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Quarantined);
    EXPECT_EQ(*outcome->destination, tree.path("_samples_quarantine/sample.2.mkv"));
    EXPECT_EQ(std::filesystem::file_size(tree.path("_samples_quarantine/sample.mkv")), 111u);
    EXPECT_EQ(std::filesystem::file_size(tree.path("_samples_quarantine/sample.1.mkv")), 222u);

    outcome = executor.apply(dir_item("Sample", tree.root()), removal(RuleId::NamePattern));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Quarantined);
    EXPECT_EQ(*outcome->destination, tree.path("_samples_quarantine/Sample.1"));
    EXPECT_TRUE(tree.exists("_samples_quarantine/Sample.1/a.mkv"));
}

TEST(DisambiguatedPath, NumbersBeforeTheExtension) {
    EXPECT_EQ(disambiguated_path("/q/clip.mkv", false, 0), std::filesystem::path("/q/clip.mkv"));
    EXPECT_EQ(disambiguated_path("/q/clip.mkv", false, 3), std::filesystem::path("/q/clip.3.mkv"));
    EXPECT_EQ(disambiguated_path("/q/Sample", true, 1), std::filesystem::path("/q/Sample.1"));
}
