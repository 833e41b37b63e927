/**
 * repopath CLI - check command
 *
 * Validate a newline-separated list of repo-relative paths taken from an
 * environment variable (or --value) and print the accepted set.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace repopath::cli::commands {

namespace {

struct CheckOptions {
    std::string key;
    std::string value;
    bool has_value = false;
    std::string output;
};

int cmd_check(const GlobalOptions& flags, const CheckOptions& check_opts) {
    GlobalOptions opts = resolve_options(flags);
    init_logging(opts);

    CheckRequest request;
    request.key = check_opts.key;
    request.raw = check_opts.has_value ? check_opts.value : get_env(check_opts.key);
    request.output = check_opts.output;

    spdlog::debug("Reading {} from {}", check_opts.key,
                  check_opts.has_value ? "--value" : "environment");

    return run_check(opts, request, process_env(), std::cout, std::cerr);
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("key", check_opts.key, "Environment variable holding the path list")->required();
    auto* value_opt = app->add_option("--value", check_opts.value, "Use this text instead of the environment");
    app->add_option("--output", check_opts.output, "Publish accepted paths as a job output with this name");

    app->callback([&opts, value_opt]() {
        check_opts.has_value = value_opt->count() > 0;
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace repopath::cli::commands
