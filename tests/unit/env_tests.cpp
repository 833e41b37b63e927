#include <doctest/doctest.h>
#include <repopath/env.hpp>

#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

using repopath::EnvLookup;
using repopath::parse_bool_env;
using repopath::parse_string_list_env;
using repopath::parse_uint_env;

namespace {

EnvLookup single_var(const std::string& name, const std::string& value) {
    return [name, value](const std::string& key) {
        return key == name ? value : std::string();
    };
}

} // namespace

// ============================================================================
// Booleans
// ============================================================================

TEST_CASE("parse_bool_env unset and empty are false") {
    auto r = parse_bool_env("UNSET_ENV", single_var("OTHER", "true"));
    CHECK(r.ok);
    CHECK_FALSE(r.value);

    auto e = parse_bool_env("EMPTY_ENV", single_var("EMPTY_ENV", ""));
    CHECK(e.ok);
    CHECK_FALSE(e.value);
}

TEST_CASE("parse_bool_env accepts true spellings") {
    for (const char* v : {"1", "t", "T", "TRUE", "true", "True"}) {
        CAPTURE(v);
        auto r = parse_bool_env("FLAG", single_var("FLAG", v));
        CHECK(r.ok);
        CHECK(r.value);
    }
}

TEST_CASE("parse_bool_env accepts false spellings") {
    for (const char* v : {"0", "f", "F", "FALSE", "false", "False"}) {
        CAPTURE(v);
        auto r = parse_bool_env("FLAG", single_var("FLAG", v));
        CHECK(r.ok);
        CHECK_FALSE(r.value);
    }
}

TEST_CASE("parse_bool_env rejects other values") {
    for (const char* v : {"invalid", "yes", "tRuE", " true"}) {
        CAPTURE(v);
        auto r = parse_bool_env("FLAG", single_var("FLAG", v));
        CHECK_FALSE(r.ok);
        CHECK_FALSE(r.value);
        CHECK(r.error.find("FLAG") != std::string::npos);
    }
}

// ============================================================================
// Positive integers
// ============================================================================

TEST_CASE("parse_uint_env returns the default when unset or empty") {
    CHECK(parse_uint_env("UNSET_ENV", 10, single_var("OTHER", "3")) == 10);
    CHECK(parse_uint_env("EMPTY_ENV", 5, single_var("EMPTY_ENV", "")) == 5);
}

TEST_CASE("parse_uint_env parses positive values") {
    CHECK(parse_uint_env("N", 10, single_var("N", "42")) == 42);
    CHECK(parse_uint_env("N", 1, single_var("N", "99999")) == 99999);
    CHECK(parse_uint_env("N", 10, single_var("N", "1")) == 1);
    CHECK(parse_uint_env("N", 10, single_var("N", "+7")) == 7);
}

TEST_CASE("parse_uint_env falls back on invalid input") {
    CHECK(parse_uint_env("N", 10, single_var("N", "0")) == 10);
    CHECK(parse_uint_env("N", 15, single_var("N", "-5")) == 15);
    CHECK(parse_uint_env("N", 20, single_var("N", "abc")) == 20);
    CHECK(parse_uint_env("N", 25, single_var("N", "   ")) == 25);
    CHECK(parse_uint_env("N", 30, single_var("N", "12abc")) == 30);
    CHECK(parse_uint_env("N", 35, single_var("N", "99999999999999999999")) == 35);
    CHECK(parse_uint_env("N", 40, single_var("N", "+")) == 40);
}

// ============================================================================
// String lists
// ============================================================================

TEST_CASE("parse_string_list_env splits the variable") {
    auto env = single_var("TEST_ENV", "/path/to/dir\r\n/another/path\n\n  \n");
    CHECK(parse_string_list_env("TEST_ENV", env) ==
          std::vector<std::string>{"/path/to/dir", "/another/path"});
    CHECK(parse_string_list_env("UNSET_ENV", env).empty());
}

TEST_CASE("process_env reads the real environment") {
#ifndef _WIN32
    REQUIRE(setenv("REPOPATH_TEST_PROCESS_ENV", "from-process", 1) == 0);
    CHECK(repopath::process_env()("REPOPATH_TEST_PROCESS_ENV") == "from-process");
    REQUIRE(unsetenv("REPOPATH_TEST_PROCESS_ENV") == 0);
    CHECK(repopath::get_env("REPOPATH_TEST_PROCESS_ENV").empty());
#endif
}
