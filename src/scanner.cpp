#include <algorithm>
#include <system_error>
#include "sample_sweep/utils.hpp"
#include "sample_sweep/scanner.hpp"

namespace sample_sweep {

    namespace {
        using Path = std::filesystem::path;

        class TreeWalker {
        public:
            TreeWalker(const PathGuard& guard, const std::vector<Path>& excluded)
                : guard_(guard) {
                for (const auto& path : excluded) {
                    excluded_.push_back(path.lexically_normal());
                }
            }

            ScanResult run() {
                walk(guard_.root(), 0);
                return std::move(result_);
            }

        private:
            bool is_excluded(const Path& path) const {
                return std::find(excluded_.begin(), excluded_.end(), path) != excluded_.end();
            }

            std::vector<Path> list_directory(const Path& directory) {
                std::vector<Path> entries;
                std::error_code iterator_error;
                std::filesystem::directory_iterator it(
                    directory, std::filesystem::directory_options::skip_permission_denied, iterator_error);
                std::filesystem::directory_iterator end;

                if (iterator_error) {
                    result_.warnings.push_back("Unable to read directory " + directory.string() + ": " + iterator_error.message());
                    return entries;
                }

                while (it != end) {
                    entries.push_back(it->path());
                    it.increment(iterator_error);
                    if (iterator_error) {
                        result_.warnings.push_back("Directory traversal warning in " + directory.string() + ": " + iterator_error.message());
                        break;
                    }
                }

                std::sort(entries.begin(), entries.end());
                return entries;
            }

            CandidateItem make_item(const Path& path, ItemKind kind, std::size_t depth) const {
                CandidateItem item;
                item.path = path;
                item.relative = relative_generic(guard_.root(), path);
                item.name = path.filename().string();
                item.kind = kind;
                item.depth = depth;
                item.parent = relative_generic(guard_.root(), path.parent_path());
                if (kind == ItemKind::File) {
                    item.extension = normalize_extension(path.extension().string());
                }
                return item;
            }

            void walk(const Path& directory, std::size_t depth) {
                for (const auto& entry : list_directory(directory)) {
                    if (is_excluded(entry.lexically_normal())) {
                        continue;
                    }

                    const GuardStatus guard_status = guard_.check(entry);
                    if (guard_status != GuardStatus::Contained) {
                        result_.unsafe.push_back({entry, guard_status, describe_guard_status(guard_status)});
                        continue;
                    }

                    std::error_code status_error;
                    const auto status = std::filesystem::symlink_status(entry, status_error);
                    if (status_error) {
                        result_.warnings.push_back("Unable to classify " + entry.string() + ": " + status_error.message());
                        continue;
                    }

                    if (std::filesystem::is_symlink(status)) {
                        result_.unsafe.push_back({entry, GuardStatus::UnsafeLink, describe_guard_status(GuardStatus::UnsafeLink)});
                        continue;
                    }

                    if (std::filesystem::is_directory(status)) {
                        ++result_.directories_checked;
                        result_.items.push_back(make_item(entry, ItemKind::Directory, depth));
                        walk(entry, depth + 1);
                    } else if (std::filesystem::is_regular_file(status)) {
                        ++result_.files_checked;
                        CandidateItem item = make_item(entry, ItemKind::File, depth);
                        std::error_code size_error;
                        item.size_bytes = std::filesystem::file_size(entry, size_error);
                        if (size_error) {
                            result_.warnings.push_back("Unable to read size of " + entry.string() + ": " + size_error.message());
                            continue;
                        }
                        result_.items.push_back(std::move(item));
                    }
                }
            }

            const PathGuard& guard_;
            std::vector<Path> excluded_;
            ScanResult result_;
        };
    }

    ScanResult scan_tree(const PathGuard& guard, const std::vector<std::filesystem::path>& excluded) {
        TreeWalker walker(guard, excluded);
        return walker.run();
    }
}
