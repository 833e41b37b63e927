/**
 * repopath CLI - Common utilities and types
 */

#pragma once

#include <repopath/repopath.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace repopath::cli {

constexpr const char* ENV_VERBOSE = "REPOPATH_VERBOSE";
constexpr const char* ENV_LOG_TAIL_KB = "REPOPATH_LOG_TAIL_KB";
constexpr int DEFAULT_LOG_TAIL_KB = 64;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    int log_tail_kb = 0;           // --log-tail-kb (0 = from environment)
};

/**
 * Log capture: stderr output teed into a bounded ring so failures can
 * report the most recent log lines.
 */
struct LogCapture {
    TailRing ring;
    TeeStreamBuf buf;
    std::ostream stream;

    explicit LogCapture(long kb)
        : ring(TailRing::from_kb(kb)), buf(std::cerr.rdbuf(), ring), stream(&buf) {}
};

inline std::unique_ptr<LogCapture>& get_log_capture() {
    static std::unique_ptr<LogCapture> capture;
    return capture;
}

/**
 * Warnings raised while resolving configuration, before the logger exists.
 */
inline std::vector<std::string>& get_pending_warnings() {
    static std::vector<std::string> pending;
    return pending;
}

/**
 * Resolve options from flags and environment.
 * Priority: flag > environment > default
 * REPOPATH_VERBOSE is only consulted when neither -v nor -q was given.
 */
inline GlobalOptions resolve_options(const GlobalOptions& flags, const EnvLookup& env = process_env()) {
    GlobalOptions resolved = flags;

    if (!resolved.verbose && !resolved.quiet) {
        auto verbose = parse_bool_env(ENV_VERBOSE, env);
        if (!verbose.ok) {
            get_pending_warnings().push_back(verbose.error);
        }
        resolved.verbose = verbose.value;
    }

    if (resolved.log_tail_kb <= 0) {
        resolved.log_tail_kb = parse_uint_env(ENV_LOG_TAIL_KB, DEFAULT_LOG_TAIL_KB, env);
    }

    return resolved;
}

/**
 * Install the default spdlog logger writing to stderr through the capture ring.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto& capture = get_log_capture();
    capture = std::make_unique<LogCapture>(opts.log_tail_kb);

    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(capture->stream, true);
    auto logger = std::make_shared<spdlog::logger>("repopath", sink);
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    for (const auto& w : get_pending_warnings()) {
        spdlog::warn("{}", w);
    }
    get_pending_warnings().clear();
}

inline std::string captured_log() {
    auto& capture = get_log_capture();
    return capture ? capture->ring.str() : std::string();
}

/**
 * Output utilities.
 */

// {"ok": false, "error": msg, ...extra, "log": <captured tail>}
inline nlohmann::json error_json(const std::string& msg, nlohmann::json extra = nlohmann::json::object()) {
    nlohmann::json j = std::move(extra);
    j["ok"] = false;
    j["error"] = msg;
    std::string log = captured_log();
    if (!log.empty()) {
        j["log"] = log;
    }
    return j;
}

inline void print_error(const std::string& msg, bool json_mode,
                        nlohmann::json extra = nlohmann::json::object(),
                        std::ostream& out = std::cout, std::ostream& err = std::cerr) {
    if (json_mode) {
        out << error_json(msg, std::move(extra)).dump(2) << std::endl;
    } else {
        err << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode, std::ostream& out = std::cout) {
    if (!json_mode) {
        out << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j, std::ostream& out = std::cout) {
    out << j.dump(2) << std::endl;
}

/**
 * Path list reporting for the check command.
 */

inline nlohmann::json check_failure_json(const PathListResult& result) {
    nlohmann::json extra = nlohmann::json::object();
    extra["key"] = result.key;
    extra["kind"] = path_error_to_string(result.error);
    if (result.line_number > 0) {
        extra["line"] = result.line_number;
        extra["input"] = result.line;
    }
    return error_json(describe(result), std::move(extra));
}

inline nlohmann::json check_success_json(const PathListResult& result) {
    nlohmann::json j;
    j["ok"] = true;
    j["key"] = result.key;
    j["paths"] = result.paths;
    return j;
}

// Single-line JSON array, the value published as a job output.
inline std::string paths_output_value(const std::vector<std::string>& paths) {
    return nlohmann::json(paths).dump();
}

struct CheckRequest {
    std::string key;
    std::string raw;
    std::string output;   // job output name, empty to skip publishing
};

/**
 * Parse, publish and report a path list. Returns the process exit status.
 */
inline int run_check(const GlobalOptions& opts, const CheckRequest& request, const EnvLookup& env,
                     std::ostream& out, std::ostream& err) {
    spdlog::debug("Checking {} ({} bytes)", request.key, request.raw.size());

    auto result = parse_repo_relative_paths(request.key, request.raw);
    if (!result.ok) {
        if (opts.json) {
            output_json(check_failure_json(result), out);
        } else {
            print_error(describe(result), false, nlohmann::json::object(), out, err);
        }
        return 1;
    }

    spdlog::debug("{}", describe(result));

    if (!request.output.empty()) {
        if (!write_github_output(request.output, paths_output_value(result.paths), env)) {
            spdlog::warn("Could not publish output '{}'", request.output);
        }
    }

    if (opts.json) {
        output_json(check_success_json(result), out);
    } else {
        for (const auto& p : result.paths) {
            print_success(p, false, out);
        }
    }
    return 0;
}

} // namespace repopath::cli
