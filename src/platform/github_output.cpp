#include "repopath/github_output.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace repopath {

bool append_output(const std::string& file, const std::string& name, const std::string& value) {
    std::ofstream out(file, std::ios::out | std::ios::app | std::ios::binary);
    if (!out) {
        spdlog::warn("Failed to open output file: {}", file);
        return false;
    }
    out << name << '=' << value << '\n';
    out.flush();
    if (!out.good()) {
        spdlog::warn("Failed to write output '{}' to {}", name, file);
        return false;
    }
    return true;
}

bool write_github_output(const std::string& name, const std::string& value, const EnvLookup& env) {
    std::string file = env(GITHUB_OUTPUT_ENV);
    if (file.empty()) {
        spdlog::debug("{} not set, skipping output '{}'", GITHUB_OUTPUT_ENV, name);
        return false;
    }
    return append_output(file, name, value);
}

} // namespace repopath
