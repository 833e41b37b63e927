#pragma once

/**
 * @file repopath.hpp
 * @brief Repo-relative path validation
 *
 * Decides which user-supplied paths are safe relative paths inside a repository
 * root. All checks are lexical; nothing here touches the filesystem.
 *
 * @example
 * ```cpp
 * #include <repopath/repopath.hpp>
 *
 * auto result = repopath::parse_repo_relative_paths_env("LOCALE_PATHS");
 * if (!result.ok) {
 *     std::cerr << repopath::describe(result) << "\n";
 *     return 1;
 * }
 * for (const auto& p : result.paths) {
 *     // p is normalized, relative and glob-free
 * }
 * ```
 */

#include "repopath/env.hpp"
#include "repopath/github_output.hpp"
#include "repopath/path_list.hpp"
#include "repopath/path_utils.hpp"
#include "repopath/tail_ring.hpp"
#include "repopath/text_lines.hpp"

#ifndef REPOPATH_VERSION
#define REPOPATH_VERSION "unknown"
#endif
