#include <cerrno>
#include <sys/stat.h>
#include "sample_sweep/path_guard.hpp"

namespace sample_sweep {

    PathGuard::PathGuard(std::filesystem::path root)
        : root_(std::move(root).lexically_normal()) {
        // lexically_normal keeps a trailing separator as an empty last element.
        if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
            root_ = root_.parent_path();
        }
    }

    std::filesystem::path PathGuard::resolve_root(const std::filesystem::path& directory, std::error_code& ec) {
        ec.clear();
        std::filesystem::path resolved = std::filesystem::canonical(directory, ec);
        if (ec) {
            return {};
        }
        if (!std::filesystem::is_directory(resolved, ec)) {
            if (!ec) {
                ec = std::make_error_code(std::errc::not_a_directory);
            }
            return {};
        }
        return resolved;
    }

    std::filesystem::path PathGuard::absolute_candidate(const std::filesystem::path& candidate) const {
        if (candidate.is_absolute()) {
            return candidate.lexically_normal();
        }
        return (root_ / candidate).lexically_normal();
    }

    GuardStatus PathGuard::check(const std::filesystem::path& candidate) const {
        const std::filesystem::path normalized = absolute_candidate(candidate);
        const std::filesystem::path relative = normalized.lexically_relative(root_);
        if (relative.empty()) {
            return GuardStatus::PathEscape;
        }

        auto first = relative.begin();
        if (first != relative.end() && *first == "..") {
            return GuardStatus::PathEscape;
        }
        if (relative == ".") {
            return GuardStatus::Contained;
        }

        std::filesystem::path current = root_;
        for (const auto& component : relative) {
            if (component.empty() || component == ".") {
                continue;
            }
            current /= component;

            struct stat info {};
            if (lstat(current.c_str(), &info) != 0) {
                // Components that do not exist yet cannot be links.
                if (errno == ENOENT || errno == ENOTDIR) {
                    break;
                }
                return GuardStatus::UnsafeLink;
            }
            if (S_ISLNK(info.st_mode)) {
                return GuardStatus::UnsafeLink;
            }
        }

        return GuardStatus::Contained;
    }

    bool PathGuard::is_root(const std::filesystem::path& candidate) const {
        return absolute_candidate(candidate) == root_;
    }

    std::string describe_guard_status(GuardStatus status) {
        switch (status) {
            case GuardStatus::Contained: return "contained";
            case GuardStatus::PathEscape: return "path escapes the download directory";
            case GuardStatus::UnsafeLink: return "symbolic link or junction";
        }
        return "unknown";
    }
}
