#pragma once

#include <string>

namespace repopath {

enum class PathError {
    None,
    RequiredMissing,
    NotRelative,
    DrivePrefixed,
    EscapesRoot,
    GlobCharacter,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized repo-relative path when ok
    PathError error;
};

// Stable identifier for machine-readable output ("ESCAPES_ROOT", ...)
const char* path_error_to_string(PathError e);

// Canonical human-readable text for an error kind.
// Callers and tests match on these substrings, so they must stay stable.
const char* path_error_message(PathError e);

// Normalize a path lexically (string-based, no filesystem access).
// - Converts backslashes to forward slashes and collapses repeated separators
// - Drops "." segments
// - ".." removes the preceding segment, or is kept when there is nothing to
//   remove, so the result may start with ".."
// - A leading drive segment ("C:", "C:foo") is never removed by ".."
// - Strips the trailing separator
// - A rooted path keeps a single leading "/"
// Relative paths whose segments all cancel normalize to ".".
std::string normalize_repo_path(const std::string& path);

// Classify an already-normalized path against the repo root.
// Checks run in a fixed order and the first match is reported:
// NotRelative, DrivePrefixed, EscapesRoot, GlobCharacter.
PathResult validate_repo_path(const std::string& normalized);

// normalize_repo_path followed by validate_repo_path.
PathResult check_repo_relative_path(const std::string& path);

} // namespace repopath
