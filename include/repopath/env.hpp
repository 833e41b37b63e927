#pragma once

#include <functional>
#include <string>
#include <vector>

namespace repopath {

// ============================================================================
// Environment Lookup
// ============================================================================

// Maps a variable name to its raw value; returns "" when the variable is unset.
// Parsers take a lookup instead of reading the process environment directly.
using EnvLookup = std::function<std::string(const std::string&)>;

// Lookup backed by the process environment.
EnvLookup process_env();

// Read a variable through the process environment ("" when unset).
std::string get_env(const std::string& name);

// ============================================================================
// Typed Coercion
// ============================================================================

struct BoolEnvResult {
    bool ok = true;
    bool value = false;
    std::string error;
};

// Unset or empty is false. Accepts 1/t/T/TRUE/true/True and
// 0/f/F/FALSE/false/False; anything else is an error.
BoolEnvResult parse_bool_env(const std::string& key, const EnvLookup& env = process_env());

// Positive integer, or default_value when unset, malformed or < 1.
int parse_uint_env(const std::string& key, int default_value, const EnvLookup& env = process_env());

// split_lines() applied to the variable's value.
std::vector<std::string> parse_string_list_env(const std::string& key,
                                               const EnvLookup& env = process_env());

} // namespace repopath
