#pragma once

#include "repopath/env.hpp"

#include <string>

namespace repopath {

// Environment variable naming the job output file.
constexpr const char* GITHUB_OUTPUT_ENV = "GITHUB_OUTPUT";

// Append "name=value\n" to file, creating it if needed.
// The value is written as-is; multi-line values are not escaped.
bool append_output(const std::string& file, const std::string& name, const std::string& value);

// Append to the file named by GITHUB_OUTPUT.
// Returns false when the variable is unset or the write fails.
bool write_github_output(const std::string& name, const std::string& value,
                         const EnvLookup& env = process_env());

} // namespace repopath
