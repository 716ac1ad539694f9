#include <sstream>
#include <gtest/gtest.h>
#include "test_support.hpp"
#include "sample_sweep/engine.hpp"

using namespace sample_sweep;
using namespace sample_sweep::test_support;

namespace {
    void populate_release(const TempTree& tree) {
        tree.write_file("Movie.2023.1080p.mkv", 1400 * kMB);
        tree.write_file("Movie.2023.1080p.nfo", 2048);
        tree.write_file("Sample/movie.2023.sample.mkv", 40 * kMB);
        tree.write_file("Proof/proof.jpg", 300 * 1024);
    }
}

TEST(RunEngine, FailedDownloadIsLeftAlone) {
    TempTree tree;
    populate_release(tree);
    const auto before = tree.snapshot();

    Configuration config = default_config(tree.root());
    config.status_succeeded = false;
    config.status_text = "FAILURE/PAR";
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::NoAction);
    EXPECT_EQ(tree.snapshot(), before);
    EXPECT_NE(out.str().find("[INFO] Status FAILURE/PAR; skipping."), std::string::npos);
    EXPECT_NE(out.str().find("[INFO] Summary: 0 removed (nothing processed)"), std::string::npos);
}

TEST(RunEngine, MissingDirectoryIsNoAction) {
    TempTree tree;
    const Configuration config = default_config(tree.path("not-there"));
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::NoAction);
    EXPECT_NE(out.str().find("[ERROR] Destination directory not found"), std::string::npos);
}

TEST(RunEngine, RemovesSamplesAndIsIdempotent) {
    TempTree tree;
    populate_release(tree);
    const Configuration config = default_config(tree.root());
    std::ostringstream out;
    Logger log(out);

    const RunReport first = run_engine(config, log);

    EXPECT_EQ(first.disposition, RunDisposition::Success);
    EXPECT_EQ(first.directories_removed, 1u);
    EXPECT_EQ(first.files_removed, 0u);
    EXPECT_EQ(first.errors, 0u);
    EXPECT_EQ(first.bytes_reclaimed, 40 * kMB);
    EXPECT_FALSE(tree.exists("Sample"));
    EXPECT_TRUE(tree.exists("Movie.2023.1080p.mkv"));
    EXPECT_TRUE(tree.exists("Movie.2023.1080p.nfo"));
    EXPECT_TRUE(tree.exists("Proof/proof.jpg"));
    EXPECT_NE(out.str().find("[INFO] Removed directory: Sample (40.0 MB)"), std::string::npos);

    const auto after_first = tree.snapshot();
    const RunReport second = run_engine(config, log);

    EXPECT_EQ(second.disposition, RunDisposition::Success);
    EXPECT_EQ(second.remove_verdicts, 0u);
    EXPECT_EQ(tree.snapshot(), after_first);
}

TEST(RunEngine, TestModeOnlyReports) {
    TempTree tree;
    populate_release(tree);
    tree.write_file("trailer.mp4", 30 * kMB);
    const auto before = tree.snapshot();

    Configuration config = default_config(tree.root());
    config.test_mode = true;
    config.quarantine_mode = true;
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::Success);
    EXPECT_EQ(report.simulated, 2u);
    EXPECT_EQ(report.remove_verdicts, 2u);
    EXPECT_EQ(report.mode, "TEST");
    EXPECT_EQ(tree.snapshot(), before);
    EXPECT_NE(out.str().find("[INFO] [TEST] Would remove file: trailer.mp4 (30.0 MB)"), std::string::npos);
    EXPECT_NE(out.str().find("Heads-up: Quarantine is ignored"), std::string::npos);
}

TEST(RunEngine, BlockImportDuringTestTurnsCandidatesIntoError) {
    TempTree tree;
    populate_release(tree);
    const auto before = tree.snapshot();

    Configuration config = default_config(tree.root());
    config.test_mode = true;
    config.block_import_during_test = true;
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_TRUE(report.import_blocked);
    EXPECT_EQ(report.disposition, RunDisposition::Error);
    EXPECT_EQ(tree.snapshot(), before);
}

TEST(RunEngine, BlockImportWithoutCandidatesSucceeds) {
    TempTree tree;
    tree.write_file("Movie.2023.1080p.mkv", 1400 * kMB);

    Configuration config = default_config(tree.root());
    config.test_mode = true;
    config.block_import_during_test = true;
    std::ostringstream out;
    Logger log(out);

    EXPECT_EQ(run_engine(config, log).disposition, RunDisposition::Success);
}

TEST(RunEngine, ProtectedSubtitlesSurviveInsideSampleFolder) {
    TempTree tree;
    tree.write_file("Movie.mkv", 1400 * kMB);
    tree.write_file("Sample/clip.mkv", 40 * kMB);
    tree.write_file("Sample/subs/movie.srt", 40 * 1024);

    Configuration config = default_config(tree.root());
    config.protected_patterns = {"*.srt"};
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::Success);
    EXPECT_EQ(report.kept_protected, 1u);
    EXPECT_EQ(report.files_removed, 1u);
    EXPECT_EQ(report.directories_removed, 0u);
    EXPECT_TRUE(tree.exists("Sample/subs/movie.srt"));
    EXPECT_FALSE(tree.exists("Sample/clip.mkv"));
}

TEST(RunEngine, ProtectedDirectoryInsideSampleFolderSurvives) {
    TempTree tree;
    tree.write_file("Movie.mkv", 1400 * kMB);
    tree.write_file("Sample/clip.mkv", 40 * kMB);
    tree.write_file("Sample/Subs/english.idx", 20 * 1024);
    tree.write_file("Sample/Subs/english.sub", 2 * kMB);

    Configuration config = default_config(tree.root());
    config.protected_patterns = {"Subs"};
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::Success);
    EXPECT_EQ(report.files_removed, 1u);
    EXPECT_EQ(report.directories_removed, 0u);
    EXPECT_EQ(report.errors, 0u);
    EXPECT_FALSE(tree.exists("Sample/clip.mkv"));
    EXPECT_TRUE(tree.exists("Sample/Subs/english.idx"));
    EXPECT_TRUE(tree.exists("Sample/Subs/english.sub"));
}

TEST(RunEngine, ProtectedSamplesFolderKeepsLargeVideo) {
    TempTree tree;
    tree.write_file("Movie.mkv", 1400 * kMB);
    tree.write_file("Samples/keep_me.mkv", 400 * kMB);
    const auto before = tree.snapshot();

    Configuration config = default_config(tree.root());
    config.protected_patterns = {"Samples"};
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::Success);
    EXPECT_EQ(report.remove_verdicts, 0u);
    EXPECT_EQ(tree.snapshot(), before);
}

TEST(RunEngine, QuarantineMovesInsteadOfDeleting) {
    TempTree tree;
    populate_release(tree);

    Configuration config = default_config(tree.root());
    config.quarantine_mode = true;
    config.quarantine_max_age_days = 30;
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.disposition, RunDisposition::Success);
    EXPECT_EQ(report.quarantined, 1u);
    EXPECT_EQ(report.purged, 0u);
    EXPECT_EQ(report.mode, "LIVE+QUARANTINE");
    EXPECT_FALSE(tree.exists("Sample"));
    EXPECT_TRUE(tree.exists("_samples_quarantine/Sample/movie.2023.sample.mkv"));

    // The quarantine folder is never scanned as part of the download.
    const RunReport again = run_engine(config, log);
    EXPECT_EQ(again.remove_verdicts, 0u);
    EXPECT_TRUE(tree.exists("_samples_quarantine/Sample/movie.2023.sample.mkv"));
}

TEST(RunEngine, SkipsLinksAndReportsThem) {
    TempTree tree;
    TempTree outside;
    outside.write_file("library/sample.mkv", 10 * kMB);
    tree.write_file("Movie.mkv", 1400 * kMB);
    std::filesystem::create_directory_symlink(outside.path("library"), tree.path("Sample"));

    const Configuration config = default_config(tree.root());
    std::ostringstream out;
    Logger log(out);

    const RunReport report = run_engine(config, log);

    EXPECT_EQ(report.skipped_unsafe, 1u);
    EXPECT_EQ(report.disposition, RunDisposition::Success);
    EXPECT_TRUE(outside.exists("library/sample.mkv"));
    EXPECT_NE(out.str().find("[WARNING] Skipped Sample"), std::string::npos);
}

TEST(ConfigurationFailure, ReportsError) {
    std::ostringstream out;
    Logger log(out);

    const RunReport report = configuration_failure("Invalid VIDEOSIZETHRESHOLDMB: lots", log);

    EXPECT_EQ(report.disposition, RunDisposition::Error);
    EXPECT_NE(out.str().find("[ERROR] Invalid VIDEOSIZETHRESHOLDMB: lots"), std::string::npos);
}

TEST(RunEngine, DebugLoggingExplainsEachDecision) {
    TempTree tree;
    tree.write_file("Movie.mkv", 1400 * kMB);
    tree.write_file("trailer.mp4", 30 * kMB);

    Configuration config = default_config(tree.root());
    config.test_mode = true;
    std::ostringstream out;
    Logger log(out, true);

    run_engine(config, log);

    EXPECT_NE(out.str().find("[DEBUG] file trailer.mp4 [30.00 MB]: remove via VideoSize"), std::string::npos);
    EXPECT_NE(out.str().find("[DEBUG] file Movie.mkv [1.37 GB]: keep via NoMatch"), std::string::npos);
}
