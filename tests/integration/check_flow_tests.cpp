#include <doctest/doctest.h>
#include <repopath/repopath.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

using namespace repopath;

namespace {

EnvLookup map_env(std::unordered_map<std::string, std::string> vars) {
    return [vars](const std::string& key) {
        auto it = vars.find(key);
        return it == vars.end() ? std::string() : it->second;
    };
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("path list from workflow input is published as job output") {
    std::string out_file = (fs::temp_directory_path() / "repopath_check_flow_output").string();
    fs::remove(out_file);

    auto env = map_env({
        {"INPUT_LOCALES", "./locales/\r\nlocales\r\nassets//i18n/../l10n\r\n"},
        {GITHUB_OUTPUT_ENV, out_file},
    });

    auto result = parse_repo_relative_paths_env("INPUT_LOCALES", env);
    REQUIRE(result.ok);
    REQUIRE(result.paths == std::vector<std::string>{"locales", "assets/l10n"});

    std::string joined;
    for (const auto& p : result.paths) {
        if (!joined.empty()) joined += ",";
        joined += p;
    }
    REQUIRE(write_github_output("paths", joined, env));
    CHECK(read_file(out_file) == "paths=locales,assets/l10n\n");

    fs::remove(out_file);
}

TEST_CASE("rejected list leaves no output and is logged with attribution") {
    TailRing ring(256);
    TeeStreamBuf tee(nullptr, ring);
    std::ostream log_stream(&tee);

    auto previous = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream, true);
    auto logger = std::make_shared<spdlog::logger>("check_flow", sink);
    logger->set_pattern("%v");
    spdlog::set_default_logger(logger);

    auto env = map_env({{"INPUT_LOCALES", "locales\n../../etc\nmore"}});
    auto result = parse_repo_relative_paths_env("INPUT_LOCALES", env);
    REQUIRE_FALSE(result.ok);
    spdlog::error("{}", describe(result));

    // No GITHUB_OUTPUT in this environment: publishing must fail quietly.
    CHECK_FALSE(write_github_output("paths", "", env));

    spdlog::set_default_logger(previous);

    CHECK(result.paths.empty());
    CHECK(result.line_number == 2);
    CHECK(ring.str().find("INPUT_LOCALES: line 2 \"../../etc\": path escapes repo root") != std::string::npos);
}
