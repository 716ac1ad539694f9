#include <vector>
#include <fmt/core.h>
#include "sample_sweep/rules.hpp"
#include "sample_sweep/utils.hpp"
#include "sample_sweep/engine.hpp"
#include "sample_sweep/purger.hpp"
#include "sample_sweep/report.hpp"
#include "sample_sweep/scanner.hpp"
#include "sample_sweep/executor.hpp"
#include "sample_sweep/path_guard.hpp"

namespace sample_sweep {

    namespace {
        using Path = std::filesystem::path;

        const char* kind_label(ItemKind kind) {
            return kind == ItemKind::Directory ? "directory" : "file";
        }

        bool is_inside(const std::string& relative, const std::vector<std::string>& directories) {
            for (const auto& directory : directories) {
                if (relative.size() > directory.size() && relative.compare(0, directory.size(), directory) == 0 &&
                    relative[directory.size()] == '/') {
                    return true;
                }
            }
            return false;
        }

        std::string join(const std::vector<std::string>& values) {
            std::string joined;
            for (const auto& value : values) {
                if (!joined.empty()) {
                    joined += ",";
                }
                joined += value;
            }
            return joined;
        }

        void log_configuration(const Configuration& config, const EffectiveThresholds& thresholds, Logger& log) {
            if (!log.debug_enabled()) {
                return;
            }
            log.debug(fmt::format("dirs={}, files={}, video<{}, audio<{}, relative={}",
                                  config.remove_directories, config.remove_files,
                                  format_megabytes(thresholds.video_threshold_bytes),
                                  format_megabytes(thresholds.audio_threshold_bytes),
                                  config.relative_size_enabled ? std::to_string(thresholds.relative_percent) + "%"
                                                               : std::string("disabled")));
            log.debug(fmt::format("vExt={} aExt={}", join(config.video_extensions), join(config.audio_extensions)));
            log.debug(fmt::format("protected=[{}] deny=[{}] tokens=[{}]", join(config.protected_patterns),
                                  join(config.deny_patterns), join(config.junk_tokens)));
            log.debug(fmt::format("test={} blockImport={} quarantine={} maxAgeDays={} images={} junkExtras={}",
                                  config.test_mode, config.block_import_during_test, config.quarantine_mode,
                                  config.quarantine_max_age_days, config.image_samples, config.junk_extras));
        }

        void log_outcome(const ActionOutcome& outcome, Logger& log) {
            const char* kind = kind_label(outcome.item_kind);
            switch (outcome.kind) {
                case OutcomeKind::Simulated:
                    if (outcome.item_kind == ItemKind::Directory) {
                        log.info(fmt::format("[TEST] Would remove directory: {}", outcome.relative));
                    } else {
                        log.info(fmt::format("[TEST] Would remove file: {} ({})", outcome.relative,
                                             format_megabytes(outcome.bytes)));
                    }
                    break;
                case OutcomeKind::Removed:
                    log.info(fmt::format("Removed {}: {} ({})", kind, outcome.relative, format_megabytes(outcome.bytes)));
                    break;
                case OutcomeKind::Quarantined:
                    log.info(fmt::format("[QUARANTINE] {} ({}) -> {}", outcome.relative, format_megabytes(outcome.bytes),
                                         outcome.destination ? outcome.destination->string() : std::string("?")));
                    break;
                case OutcomeKind::KeptProtected:
                    log.debug(fmt::format("Protected {}: {}", kind, outcome.relative));
                    break;
                case OutcomeKind::Failed:
                    log.error(fmt::format("Failed to remove {}: {} - {}", kind, outcome.relative, outcome.reason));
                    break;
            }
        }

        void run_purge(const PathGuard& guard, const Configuration& config, const Path& quarantine_root,
                       const ActionExecutor& executor, RunReport& report, Logger& log) {
            PurgeRequest request;
            request.quarantine_root = quarantine_root;
            request.max_age_days = config.quarantine_max_age_days;
            request.fresh = executor.quarantined_paths();
            request.test_mode = config.test_mode;

            const PurgeResult purge = purge_quarantine(guard, request);
            if (!purge.enabled) {
                if (!purge.failures.empty()) {
                    for (const auto& failure : purge.failures) {
                        log.error(failure);
                    }
                    record_purge(report, purge);
                }
                return;
            }

            for (const auto& entry : purge.purged_entries) {
                if (config.test_mode) {
                    log.info(fmt::format("[TEST] Would purge quarantined file: {}", entry));
                } else {
                    log.info(fmt::format("Purged quarantined file: {}", entry));
                }
            }
            for (const auto& failure : purge.failures) {
                log.error(failure);
            }
            log.debug(fmt::format("Quarantine purge: {} file(s), {} folder(s) pruned, older than {} day(s)",
                                  purge.purged, purge.directories_pruned, config.quarantine_max_age_days));
            record_purge(report, purge);
        }
    }

    std::string run_mode(const Configuration& config) {
        if (config.test_mode) {
            return "TEST";
        }
        return config.quarantine_mode ? "LIVE+QUARANTINE" : "LIVE";
    }

    RunReport configuration_failure(const std::string& message, Logger& log) {
        RunReport report;
        report.configuration_error = true;
        log.error(message);
        finalize_report(report, false);
        log.info(summary_line(report));
        return report;
    }

    RunReport run_engine(const Configuration& config, Logger& log) {
        RunReport report;
        report.mode = run_mode(config);

        if (!config.status_succeeded) {
            log.info(fmt::format("Status {}; skipping.", config.status_text));
            finalize_report(report, true);
            log.info(summary_line(report));
            return report;
        }

        std::error_code root_error;
        const Path root = PathGuard::resolve_root(config.root, root_error);
        if (root_error) {
            log.error(fmt::format("Destination directory not found: {} ({})", config.root.string(), root_error.message()));
            finalize_report(report, true);
            log.info(summary_line(report));
            return report;
        }

        log.info(fmt::format("Processing \"{}\" in {}", config.nzb_name, root.string()));

        const PathGuard guard(root);
        const Path quarantine_root = root / kQuarantineFolderName;

        ScanResult scan = scan_tree(guard, {quarantine_root});
        report.files_checked = scan.files_checked;
        report.directories_checked = scan.directories_checked;
        report.skipped_unsafe = scan.unsafe.size();
        for (const auto& unsafe : scan.unsafe) {
            log.warning(fmt::format("Skipped {}: {}", relative_generic(root, unsafe.path), unsafe.reason));
        }
        for (const auto& warning : scan.warnings) {
            log.warning(warning);
        }

        const ClassificationContext context = build_context(scan.items, config);
        if (context.thresholds.category_override) {
            log.info(fmt::format("Category override: {} -> video < {}, audio < {}, relative {}%", config.category,
                                 format_megabytes(context.thresholds.video_threshold_bytes),
                                 format_megabytes(context.thresholds.audio_threshold_bytes),
                                 context.thresholds.relative_percent));
        }
        if (config.test_mode && config.quarantine_mode) {
            log.info("Heads-up: Quarantine is ignored while Test Mode is ON.");
        }
        if (config.block_import_during_test && !config.test_mode) {
            log.info("Reminder: BlockImportDuringTest only has an effect in Test Mode.");
        }
        log_configuration(config, context.thresholds, log);

        ActionExecutor executor(guard, config, quarantine_root);
        std::vector<std::string> handled_directories;

        for (const auto& item : scan.items) {
            if (is_inside(item.relative, handled_directories)) {
                continue;
            }

            const Verdict verdict = classify(item, config, context);
            log.debug(fmt::format("{} {}{}: {} via {} ({})", kind_label(item.kind), item.relative,
                                  item.kind == ItemKind::File ? " [" + format_size(item.size_bytes) + "]" : std::string(),
                                  verdict.disposition == Disposition::Remove ? "remove" : "keep",
                                  describe_rules(verdict.rules), verdict.detail));

            if (verdict.disposition == Disposition::Remove) {
                ++report.remove_verdicts;
                if (item.kind == ItemKind::Directory) {
                    handled_directories.push_back(item.relative);
                }
            }

            if (auto outcome = executor.apply(item, verdict)) {
                log_outcome(*outcome, log);
                record_outcome(report, *outcome);
            }
            for (const auto& warning : executor.take_warnings()) {
                log.warning(warning);
            }
        }

        if (config.test_mode && config.block_import_during_test && report.remove_verdicts > 0) {
            report.import_blocked = true;
            log.info("BlockImportDuringTest=ON with candidates; reporting an error to prevent import (no deletions performed).");
        }

        run_purge(guard, config, quarantine_root, executor, report, log);

        finalize_report(report, false);
        log.info(summary_line(report));
        return report;
    }
}
