#pragma once

#include "repopath/env.hpp"
#include "repopath/path_utils.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace repopath {

/**
 * Outcome of parsing a multi-line list of repo-relative paths.
 *
 * On success `paths` holds the normalized paths in first-seen order with
 * duplicates removed. On failure `paths` is empty, `error` names the first
 * problem and, for per-path errors, `line_number` (1-based, counted over the
 * non-blank lines) and `line` point at the offending input.
 */
struct PathListResult {
    bool ok = false;
    std::vector<std::string> paths;
    PathError error = PathError::None;
    std::string key;
    size_t line_number = 0;
    std::string line;
};

// Parse a raw multi-line value read from `key`.
// Lines are processed in order and the first invalid line aborts the parse.
PathListResult parse_repo_relative_paths(const std::string& key, const std::string& raw);

// Same as above with the raw value fetched from `env`.
PathListResult parse_repo_relative_paths_env(const std::string& key,
                                             const EnvLookup& env = process_env());

// "<key> is required" or "<key>: line <n> \"<line>\": <message>"
std::string describe(const PathListResult& result);

} // namespace repopath
