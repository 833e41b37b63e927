#include "repopath/env.hpp"
#include "repopath/text_lines.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace repopath {

std::string get_env(const std::string& name) {
#ifdef _WIN32
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        std::free(val);
        return result;
    }
    return {};
#else
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : std::string();
#endif
}

EnvLookup process_env() {
    return [](const std::string& name) { return get_env(name); };
}

BoolEnvResult parse_bool_env(const std::string& key, const EnvLookup& env) {
    BoolEnvResult result;
    std::string val = env(key);
    if (val.empty()) {
        return result;
    }

    if (val == "1" || val == "t" || val == "T" || val == "TRUE" || val == "true" || val == "True") {
        result.value = true;
        return result;
    }
    if (val == "0" || val == "f" || val == "F" || val == "FALSE" || val == "false" || val == "False") {
        return result;
    }

    result.ok = false;
    result.error = key + ": invalid boolean value '" + val + "'";
    return result;
}

int parse_uint_env(const std::string& key, int default_value, const EnvLookup& env) {
    std::string val = env(key);
    if (val.empty()) {
        return default_value;
    }

    int parsed = 0;
    const char* first = val.data();
    const char* last = val.data() + val.size();
    if (*first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last || first == last) {
        return default_value;
    }
    if (parsed < 1) {
        return default_value;
    }
    return parsed;
}

std::vector<std::string> parse_string_list_env(const std::string& key, const EnvLookup& env) {
    return split_lines(env(key));
}

} // namespace repopath
