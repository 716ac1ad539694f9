#include <cerrno>
#include <string>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <system_error>
#include <sys/syscall.h>
#include "sample_sweep/utils.hpp"
#include "sample_sweep/executor.hpp"

#if defined(__linux__)
#include <linux/fs.h>
#endif

#if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
#define SAMPLE_SWEEP_HAS_RENAMEAT2 1
#else
#define SAMPLE_SWEEP_HAS_RENAMEAT2 0
#endif

namespace sample_sweep {

    namespace {
        using Path = std::filesystem::path;

        constexpr unsigned int kMaxDisambiguationAttempts = 10000;

        enum class MoveStatus { Moved, TargetExists, Failed };

        std::string errno_message(int error) {
            return std::strerror(error);
        }

        MoveStatus copy_across_devices(const Path& source, const Path& target, std::string& error) {
            std::error_code ec;
            if (std::filesystem::exists(std::filesystem::symlink_status(target, ec))) {
                return MoveStatus::TargetExists;
            }
            std::filesystem::copy(source, target,
                                  std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks,
                                  ec);
            if (ec) {
                error = "copy to quarantine failed: " + ec.message();
                std::error_code cleanup_error;
                std::filesystem::remove_all(target, cleanup_error);
                return MoveStatus::Failed;
            }
            std::filesystem::remove_all(source, ec);
            if (ec) {
                error = "copied to quarantine but original could not be removed: " + ec.message();
                return MoveStatus::Failed;
            }
            return MoveStatus::Moved;
        }

        // Moves without ever replacing an existing target, so concurrent runs
        // sharing one quarantine folder cannot clobber each other.
        MoveStatus move_no_replace(const Path& source, const Path& target, bool is_directory, std::string& error) {
#if SAMPLE_SWEEP_HAS_RENAMEAT2
            if (syscall(SYS_renameat2, AT_FDCWD, source.c_str(), AT_FDCWD, target.c_str(), RENAME_NOREPLACE) == 0) {
                return MoveStatus::Moved;
            }
            const int rename_error = errno;
            if (rename_error == EEXIST) {
                return MoveStatus::TargetExists;
            }
            if (rename_error == EXDEV) {
                return copy_across_devices(source, target, error);
            }
            if (rename_error != EINVAL && rename_error != ENOSYS) {
                error = errno_message(rename_error);
                return MoveStatus::Failed;
            }
#endif
            if (!is_directory) {
                if (link(source.c_str(), target.c_str()) == 0) {
                    if (unlink(source.c_str()) != 0) {
                        error = "linked into quarantine but original could not be removed: " + errno_message(errno);
                        return MoveStatus::Failed;
                    }
                    return MoveStatus::Moved;
                }
                const int link_error = errno;
                if (link_error == EEXIST) {
                    return MoveStatus::TargetExists;
                }
                if (link_error == EXDEV) {
                    return copy_across_devices(source, target, error);
                }
                if (link_error != EPERM && link_error != ENOTSUP) {
                    error = errno_message(link_error);
                    return MoveStatus::Failed;
                }
            }

            std::error_code ec;
            if (std::filesystem::exists(std::filesystem::symlink_status(target, ec))) {
                return MoveStatus::TargetExists;
            }
            std::filesystem::rename(source, target, ec);
            if (ec) {
                if (ec == std::errc::cross_device_link) {
                    return copy_across_devices(source, target, error);
                }
                error = ec.message();
                return MoveStatus::Failed;
            }
            return MoveStatus::Moved;
        }
    }

    Path disambiguated_path(const Path& destination, bool is_directory, unsigned int attempt) {
        if (attempt == 0) {
            return destination;
        }
        const std::string suffix = "." + std::to_string(attempt);
        if (is_directory) {
            return destination.parent_path() / (destination.filename().string() + suffix);
        }
        return destination.parent_path() /
               (destination.stem().string() + suffix + destination.extension().string());
    }

    std::uintmax_t directory_size(const Path& path, std::vector<std::string>& warnings) {
        std::uintmax_t total = 0;

        std::error_code iterator_error;
        std::filesystem::recursive_directory_iterator it(
            path, std::filesystem::directory_options::skip_permission_denied, iterator_error);
        std::filesystem::recursive_directory_iterator end;

        if (iterator_error) {
            warnings.push_back("Unable to measure directory " + path.string() + ": " + iterator_error.message());
            return total;
        }

        while (it != end) {
            const auto& entry = *it;
            std::error_code status_error;
            if (entry.is_symlink(status_error)) {
                it.disable_recursion_pending();
            } else if (entry.is_regular_file(status_error)) {
                std::error_code size_ec;
                std::uintmax_t size = entry.file_size(size_ec);
                if (!size_ec) {
                    total += size;
                }
            }

            it.increment(iterator_error);
            if (iterator_error) {
                warnings.push_back("Directory traversal warning: " + iterator_error.message());
                break;
            }
        }
        return total;
    }

    ActionExecutor::ActionExecutor(const PathGuard& guard, const Configuration& config, Path quarantine_root)
        : guard_(guard), config_(config), quarantine_root_(std::move(quarantine_root)) {}

    std::vector<std::string> ActionExecutor::take_warnings() {
        std::vector<std::string> taken;
        taken.swap(warnings_);
        return taken;
    }

    std::optional<ActionOutcome> ActionExecutor::apply(const CandidateItem& item, const Verdict& verdict) {
        ActionOutcome outcome;
        outcome.item_kind = item.kind;
        outcome.relative = item.relative;
        outcome.bytes = item.size_bytes;

        if (verdict.disposition == Disposition::Keep) {
            if (!verdict.rules.empty() && verdict.rules.front() == RuleId::Protected) {
                outcome.kind = OutcomeKind::KeptProtected;
                return outcome;
            }
            return std::nullopt;
        }

        if (config_.test_mode) {
            outcome.kind = OutcomeKind::Simulated;
            return outcome;
        }

        if (guard_.is_root(item.path)) {
            outcome.kind = OutcomeKind::Failed;
            outcome.reason = "refusing to act on the download directory itself";
            return outcome;
        }
        const GuardStatus status = guard_.check(item.path);
        if (status != GuardStatus::Contained) {
            outcome.kind = OutcomeKind::Failed;
            outcome.reason = describe_guard_status(status);
            return outcome;
        }

        if (item.kind == ItemKind::Directory) {
            outcome.bytes = directory_size(item.path, warnings_);
        }

        if (config_.quarantine_mode) {
            return quarantine_item(item, std::move(outcome));
        }
        return remove_item(item, std::move(outcome));
    }

    ActionOutcome ActionExecutor::remove_item(const CandidateItem& item, ActionOutcome outcome) {
        std::error_code ec;
        if (item.kind == ItemKind::Directory) {
            std::filesystem::remove_all(item.path, ec);
        } else if (!std::filesystem::remove(item.path, ec) && !ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }

        if (ec) {
            outcome.kind = OutcomeKind::Failed;
            outcome.reason = ec.message();
            return outcome;
        }
        outcome.kind = OutcomeKind::Removed;
        return outcome;
    }

    ActionOutcome ActionExecutor::quarantine_item(const CandidateItem& item, ActionOutcome outcome) {
        const Path destination = quarantine_root_ / Path(item.relative);

        const GuardStatus destination_status = guard_.check(destination);
        if (destination_status != GuardStatus::Contained) {
            outcome.kind = OutcomeKind::Failed;
            outcome.reason = "quarantine destination rejected: " + describe_guard_status(destination_status);
            return outcome;
        }

        std::error_code ec;
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            outcome.kind = OutcomeKind::Failed;
            outcome.reason = "unable to create quarantine folder: " + ec.message();
            return outcome;
        }

        const bool is_directory = item.kind == ItemKind::Directory;
        for (unsigned int attempt = 0; attempt < kMaxDisambiguationAttempts; ++attempt) {
            const Path target = disambiguated_path(destination, is_directory, attempt);
            std::string error;
            switch (move_no_replace(item.path, target, is_directory, error)) {
                case MoveStatus::Moved:
                    stamp_quarantine_time(target);
                    quarantined_paths_.push_back(target);
                    outcome.kind = OutcomeKind::Quarantined;
                    outcome.destination = target;
                    return outcome;
                case MoveStatus::TargetExists:
                    continue;
                case MoveStatus::Failed:
                    outcome.kind = OutcomeKind::Failed;
                    outcome.reason = error;
                    return outcome;
            }
        }

        outcome.kind = OutcomeKind::Failed;
        outcome.reason = "no free quarantine name for " + destination.string();
        return outcome;
    }

    // Quarantine age is measured from the move, not from the download.
    void ActionExecutor::stamp_quarantine_time(const Path& destination) {
        const auto now = std::filesystem::file_time_type::clock::now();
        std::error_code ec;
        std::filesystem::last_write_time(destination, now, ec);
        if (ec) {
            warnings_.push_back("Unable to stamp quarantine time on " + destination.string() + ": " + ec.message());
            return;
        }

        if (!std::filesystem::is_directory(std::filesystem::symlink_status(destination, ec))) {
            return;
        }
        std::filesystem::recursive_directory_iterator it(
            destination, std::filesystem::directory_options::skip_permission_denied, ec);
        std::filesystem::recursive_directory_iterator end;
        while (!ec && it != end) {
            std::error_code entry_error;
            if (it->is_symlink(entry_error)) {
                it.disable_recursion_pending();
            } else {
                std::filesystem::last_write_time(it->path(), now, entry_error);
                if (entry_error) {
                    warnings_.push_back("Unable to stamp quarantine time on " + it->path().string() + ": " + entry_error.message());
                }
            }
            it.increment(ec);
        }
        if (ec) {
            warnings_.push_back("Unable to stamp quarantine time below " + destination.string() + ": " + ec.message());
        }
    }
}
