#pragma once
#include <vector>
#include <filesystem>
#include "sample_sweep/types.hpp"
#include "sample_sweep/path_guard.hpp"

namespace sample_sweep {
    // Walks the guard root once in pre-order (directories before their contents,
    // siblings sorted by name). Links are reported in ScanResult::unsafe and never
    // followed. Paths listed in `excluded` are skipped together with their contents.
    ScanResult scan_tree(const PathGuard& guard, const std::vector<std::filesystem::path>& excluded = {});
}
