#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "core/context.hpp"

namespace sessionizer::scan {

struct ScanOptions {
    bool nested = false;
    std::size_t workers = 0; // 0 = derive from hardware concurrency
};

std::size_t defaultWorkerCount();

// A directory holding a .git entry (directory, gitdir file or symlink).
bool isRepository(const std::filesystem::path &dir);

/**
 * Walks root and returns every repository directory below it.
 *
 * Directories without a .git marker are always descended into. A repository is
 * reported and, unless options.nested is set, not descended into. The root
 * itself is never reported. A missing or non-directory root yields an empty
 * result. Order of the returned paths is not meaningful.
 */
std::vector<std::filesystem::path> scanRepositories(
    const std::filesystem::path &root,
    const ScanOptions &options,
    const sessionizer::Context &ctx
);

// Scans all roots on one shared worker pool. Missing roots are reported and skipped.
std::vector<std::filesystem::path> scanRepositories(
    const std::vector<std::filesystem::path> &roots,
    const ScanOptions &options,
    const sessionizer::Context &ctx
);

} // namespace sessionizer::scan
