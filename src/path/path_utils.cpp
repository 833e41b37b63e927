#include "repopath/path_utils.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace repopath {

namespace {

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool has_drive_prefix(const std::string& s) {
    return s.size() >= 2 && is_ascii_letter(s[0]) && s[1] == ':';
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::vector<std::string>& comps) {
    std::string out;
    for (const auto& c : comps) {
        if (!out.empty()) {
            out += '/';
        }
        out += c;
    }
    return out;
}

} // namespace

const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "NONE";
        case PathError::RequiredMissing: return "REQUIRED_MISSING";
        case PathError::NotRelative: return "NOT_RELATIVE";
        case PathError::DrivePrefixed: return "DRIVE_PREFIXED";
        case PathError::EscapesRoot: return "ESCAPES_ROOT";
        case PathError::GlobCharacter: return "GLOB_CHARACTER";
    }
    return "UNKNOWN";
}

const char* path_error_message(PathError e) {
    switch (e) {
        case PathError::None: return "ok";
        case PathError::RequiredMissing: return "is required";
        case PathError::NotRelative: return "path must be relative to repo";
        case PathError::DrivePrefixed: return "drive-prefixed paths are not allowed";
        case PathError::EscapesRoot: return "path escapes repo root";
        case PathError::GlobCharacter: return "glob characters are not allowed";
    }
    return "unknown path error";
}

std::string normalize_repo_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::string portable = path;
    for (char& c : portable) {
        if (c == '\\') c = '/';
    }

    const bool rooted = is_separator(path[0]);

    std::vector<std::string> normalized;
    for (const auto& part : split(portable, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            // A leading drive segment ("C:", "C:foo") acts as a root that ".."
            // cannot remove, so the prefix survives for the validator.
            bool drive_root = normalized.size() == 1 && has_drive_prefix(normalized[0]);
            if (!normalized.empty() && normalized.back() != ".." && !drive_root) {
                normalized.pop_back();
            } else if (!rooted || drive_root) {
                normalized.push_back(part);
            }
            // ".." directly under "/" stays at "/"
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(normalized);
    if (rooted) {
        return "/" + out;
    }
    return out.empty() ? "." : out;
}

PathResult validate_repo_path(const std::string& normalized) {
    // Also covers UNC-style "//server/share" when called on raw input.
    if (normalized.empty() || is_separator(normalized[0])) {
        return {false, {}, PathError::NotRelative};
    }

    // "C:foo" is relative to the current directory of drive C on Windows,
    // so a drive prefix is rejected whether or not a separator follows.
    if (has_drive_prefix(normalized)) {
        return {false, {}, PathError::DrivePrefixed};
    }

    if (normalized == ".." || normalized.compare(0, 3, "../") == 0) {
        return {false, {}, PathError::EscapesRoot};
    }

    if (normalized.find_first_of("*?[]") != std::string::npos) {
        return {false, {}, PathError::GlobCharacter};
    }

    return {true, normalized, PathError::None};
}

PathResult check_repo_relative_path(const std::string& path) {
    return validate_repo_path(normalize_repo_path(path));
}

} // namespace repopath
