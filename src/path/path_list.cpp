#include "repopath/path_list.hpp"
#include "repopath/text_lines.hpp"

#include <unordered_set>

namespace repopath {

namespace {

PathListResult fail(const std::string& key, PathError error,
                    size_t line_number = 0, const std::string& line = {}) {
    PathListResult result;
    result.ok = false;
    result.error = error;
    result.key = key;
    result.line_number = line_number;
    result.line = line;
    return result;
}

} // namespace

PathListResult parse_repo_relative_paths(const std::string& key, const std::string& raw) {
    auto lines = split_lines(raw);
    if (lines.empty()) {
        return fail(key, PathError::RequiredMissing);
    }

    PathListResult result;
    result.key = key;

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto checked = check_repo_relative_path(lines[i]);
        if (!checked.ok) {
            return fail(key, checked.error, i + 1, lines[i]);
        }
        if (seen.insert(checked.path).second) {
            result.paths.push_back(checked.path);
        }
    }

    result.ok = true;
    return result;
}

PathListResult parse_repo_relative_paths_env(const std::string& key, const EnvLookup& env) {
    return parse_repo_relative_paths(key, env(key));
}

std::string describe(const PathListResult& result) {
    if (result.ok) {
        return result.key + ": " + std::to_string(result.paths.size()) + " path(s) accepted";
    }
    if (result.error == PathError::RequiredMissing) {
        return result.key + " " + path_error_message(result.error);
    }
    return result.key + ": line " + std::to_string(result.line_number) + " \"" + result.line +
           "\": " + path_error_message(result.error);
}

} // namespace repopath
