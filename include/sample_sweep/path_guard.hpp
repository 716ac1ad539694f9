#pragma once
#include <string>
#include <filesystem>
#include <system_error>
#include "sample_sweep/types.hpp"

namespace sample_sweep {
    // Confines filesystem access to one root directory. Every candidate path is
    // checked lexically against the root and then component by component with
    // lstat, so a symlink anywhere between the root and the candidate is refused.
    class PathGuard {
    public:
        explicit PathGuard(std::filesystem::path root);

        // Canonical form of the given directory, suitable as a guard root.
        static std::filesystem::path resolve_root(const std::filesystem::path& directory, std::error_code& ec);

        GuardStatus check(const std::filesystem::path& candidate) const;
        bool is_root(const std::filesystem::path& candidate) const;
        const std::filesystem::path& root() const { return root_; }

    private:
        std::filesystem::path absolute_candidate(const std::filesystem::path& candidate) const;

        std::filesystem::path root_;
    };

    std::string describe_guard_status(GuardStatus status);
}
