#include <set>
#include <chrono>
#include <algorithm>
#include <system_error>
#include "sample_sweep/utils.hpp"
#include "sample_sweep/purger.hpp"

namespace sample_sweep {

    namespace {
        using Path = std::filesystem::path;

        bool is_fresh(const Path& path, const std::vector<Path>& fresh) {
            return std::find(fresh.begin(), fresh.end(), path) != fresh.end();
        }

        void mark_ancestors(const Path& path, const Path& stop, std::set<Path>& marked) {
            for (Path current = path.parent_path(); current != stop && current.has_relative_path();
                 current = current.parent_path()) {
                if (!marked.insert(current).second) {
                    break;
                }
            }
        }
    }

    PurgeResult purge_quarantine(const PathGuard& guard, const PurgeRequest& request) {
        PurgeResult result;
        if (request.max_age_days == 0) {
            return result;
        }

        const Path root = request.quarantine_root.lexically_normal();
        std::error_code ec;
        if (!std::filesystem::is_directory(std::filesystem::symlink_status(root, ec))) {
            return result;
        }
        if (guard.check(root) != GuardStatus::Contained) {
            result.failures.push_back("Quarantine folder " + root.string() + " rejected: " +
                                      describe_guard_status(guard.check(root)));
            return result;
        }
        result.enabled = true;

        std::vector<Path> fresh;
        for (const auto& path : request.fresh) {
            fresh.push_back(path.lexically_normal());
        }

        const auto cutoff = request.now - std::chrono::hours(24) * request.max_age_days;
        std::vector<Path> directories;
        std::set<Path> emptied;

        std::error_code iterator_error;
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, iterator_error);
        std::filesystem::recursive_directory_iterator end;
        if (iterator_error) {
            result.failures.push_back("Unable to read quarantine folder " + root.string() + ": " + iterator_error.message());
            return result;
        }

        while (it != end) {
            const Path entry = it->path().lexically_normal();
            std::error_code status_error;
            const auto status = it->symlink_status(status_error);

            if (status_error) {
                result.failures.push_back("Unable to inspect " + entry.string() + ": " + status_error.message());
            } else if (is_fresh(entry, fresh) || std::filesystem::is_symlink(status)) {
                it.disable_recursion_pending();
            } else if (std::filesystem::is_directory(status)) {
                directories.push_back(entry);
            } else if (std::filesystem::is_regular_file(status)) {
                std::error_code time_error;
                const auto modified = std::filesystem::last_write_time(entry, time_error);
                if (time_error) {
                    result.failures.push_back("Unable to read age of " + entry.string() + ": " + time_error.message());
                } else if (modified < cutoff) {
                    const std::string relative = relative_generic(root, entry);
                    const GuardStatus entry_status = guard.check(entry);
                    if (entry_status != GuardStatus::Contained) {
                        result.failures.push_back("Refusing to purge " + relative + ": " + describe_guard_status(entry_status));
                    } else if (request.test_mode) {
                        ++result.purged;
                        result.purged_entries.push_back(relative);
                    } else {
                        std::error_code remove_error;
                        if (std::filesystem::remove(entry, remove_error)) {
                            ++result.purged;
                            result.purged_entries.push_back(relative);
                            mark_ancestors(entry, root, emptied);
                        } else {
                            result.failures.push_back("Quarantine purge failed at " + relative + ": " +
                                                      (remove_error ? remove_error.message() : std::string("already gone")));
                        }
                    }
                }
            }

            it.increment(iterator_error);
            if (iterator_error) {
                result.failures.push_back("Quarantine traversal warning: " + iterator_error.message());
                break;
            }
        }

        if (request.test_mode) {
            return result;
        }

        // Pre-order listing reversed visits children before their parents.
        for (auto dir = directories.rbegin(); dir != directories.rend(); ++dir) {
            std::error_code dir_error;
            if (!std::filesystem::is_empty(*dir, dir_error) || dir_error) {
                continue;
            }
            bool aged = emptied.count(*dir) > 0;
            if (!aged) {
                const auto modified = std::filesystem::last_write_time(*dir, dir_error);
                aged = !dir_error && modified < cutoff;
            }
            if (!aged) {
                continue;
            }
            if (std::filesystem::remove(*dir, dir_error)) {
                ++result.directories_pruned;
                mark_ancestors(*dir, root, emptied);
            } else if (dir_error) {
                result.failures.push_back("Unable to prune " + relative_generic(root, *dir) + ": " + dir_error.message());
            }
        }

        return result;
    }
}
