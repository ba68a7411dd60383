#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/environment.hpp"

namespace sessionizer::scan {

// "~" and "~/..." become paths under home; anything else is returned as-is.
std::string expandHome(const std::string &raw, const std::filesystem::path &home);

// Purely lexical: never touches the filesystem.
std::filesystem::path cleanPath(const std::filesystem::path &path);

// True when ancestor's components are a strict prefix of path's.
bool isDescendantOf(const std::filesystem::path &path, const std::filesystem::path &ancestor);

/**
 * Turns configured root entries into the set of directories worth scanning.
 *
 * Absent and empty entries are dropped, home shorthand is expanded, relative
 * entries are resolved against env.cwd, and the result is cleaned, sorted and
 * de-duplicated. A path nested under another configured path is removed, so no
 * returned path is an ancestor of another.
 */
std::vector<std::filesystem::path> normalizeRoots(
    const std::vector<std::optional<std::string>> &raw,
    const Environment &env
);

} // namespace sessionizer::scan
