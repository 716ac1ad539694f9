#include <vector>
#include <sstream>
#include <fmt/core.h>
#include "sample_sweep/utils.hpp"
#include "sample_sweep/report.hpp"

namespace sample_sweep {

    namespace {
        class JsonBuilder {
        public:
            void add_string(const std::string& key, const std::string& value) {
                add_separator();
                stream_ << "\"" << key << "\":\"" << json_escape(value) << "\"";
            }

            void add_number(const std::string& key, uintmax_t value) {
                add_separator();
                stream_ << "\"" << key << "\":" << value;
            }

            void add_bool(const std::string& key, bool value) {
                add_separator();
                stream_ << "\"" << key << "\":" << (value ? "true" : "false");
            }

            void add_array(const std::string& key, const std::vector<std::string>& values) {
                add_separator();
                stream_ << "\"" << key << "\":[";
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (i > 0) {
                        stream_ << ",";
                    }
                    stream_ << "\"" << json_escape(values[i]) << "\"";
                }
                stream_ << "]";
            }

            std::string str() const {
                return stream_.str();
            }

        private:
            void add_separator() {
                if (first_) {
                    first_ = false;
                } else {
                    stream_ << ",";
                }
            }

            bool first_ = true;
            std::ostringstream stream_;
        };
    }

    void record_outcome(RunReport& report, const ActionOutcome& outcome) {
        switch (outcome.kind) {
            case OutcomeKind::Simulated:
                ++report.simulated;
                break;
            case OutcomeKind::Removed:
                if (outcome.item_kind == ItemKind::Directory) {
                    ++report.directories_removed;
                } else {
                    ++report.files_removed;
                }
                report.bytes_reclaimed += outcome.bytes;
                break;
            case OutcomeKind::Quarantined:
                ++report.quarantined;
                report.bytes_reclaimed += outcome.bytes;
                break;
            case OutcomeKind::KeptProtected:
                ++report.kept_protected;
                break;
            case OutcomeKind::Failed:
                ++report.errors;
                report.failures.push_back(outcome.relative + ": " + outcome.reason);
                break;
        }
    }

    void record_purge(RunReport& report, const PurgeResult& purge) {
        report.purged += purge.purged;
        report.purge_errors += purge.failures.size();
    }

    void finalize_report(RunReport& report, bool precondition_failed) {
        if (precondition_failed) {
            report.disposition = RunDisposition::NoAction;
        } else if (report.configuration_error || report.import_blocked) {
            report.disposition = RunDisposition::Error;
        } else if (report.errors > 0) {
            report.disposition = RunDisposition::PartialError;
        } else {
            report.disposition = RunDisposition::Success;
        }
    }

    std::string disposition_name(RunDisposition disposition) {
        switch (disposition) {
            case RunDisposition::NoAction: return "NoAction";
            case RunDisposition::Success: return "Success";
            case RunDisposition::Error: return "Error";
            case RunDisposition::PartialError: return "PartialError";
        }
        return "Unknown";
    }

    std::string summary_line(const RunReport& report) {
        if (report.disposition == RunDisposition::NoAction) {
            return fmt::format("Summary: 0 removed (nothing processed). Mode: {}", report.mode);
        }

        std::string line;
        if (report.mode == "TEST") {
            line = fmt::format("Summary: would remove {} item(s)", report.simulated);
        } else {
            line = fmt::format("Summary: removed {} files / {} dirs, quarantined {} ({})",
                               report.files_removed, report.directories_removed, report.quarantined,
                               format_megabytes(report.bytes_reclaimed));
        }
        line += fmt::format(". Mode: {}. FilesChecked={} DirsChecked={} Candidates={} Protected={}",
                            report.mode, report.files_checked, report.directories_checked,
                            report.remove_verdicts, report.kept_protected);
        if (report.skipped_unsafe > 0) {
            line += fmt::format(" SkippedUnsafe={}", report.skipped_unsafe);
        }
        if (report.purged > 0 || report.purge_errors > 0) {
            line += fmt::format(" Purged={} PurgeErrors={}", report.purged, report.purge_errors);
        }
        line += fmt::format(" Errors={} Result={}", report.errors, disposition_name(report.disposition));
        if (report.import_blocked) {
            line += " (import blocked during test)";
        }
        return line;
    }

    std::string render_json(const RunReport& report) {
        JsonBuilder json;
        json.add_string("disposition", disposition_name(report.disposition));
        json.add_string("mode", report.mode);
        json.add_number("filesRemoved", report.files_removed);
        json.add_number("directoriesRemoved", report.directories_removed);
        json.add_number("quarantined", report.quarantined);
        json.add_number("simulated", report.simulated);
        json.add_number("keptProtected", report.kept_protected);
        json.add_number("skippedUnsafe", report.skipped_unsafe);
        json.add_number("errors", report.errors);
        json.add_number("purged", report.purged);
        json.add_number("purgeErrors", report.purge_errors);
        json.add_number("candidates", report.remove_verdicts);
        json.add_number("filesChecked", report.files_checked);
        json.add_number("directoriesChecked", report.directories_checked);
        json.add_number("bytesReclaimed", report.bytes_reclaimed);
        json.add_bool("importBlocked", report.import_blocked);
        json.add_array("failures", report.failures);
        return '{' + json.str() + '}';
    }
}
