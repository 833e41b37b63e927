/**
 * repopath CLI - Entry Point
 *
 * Validates repo-relative path lists from CI configuration.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace repopath::cli::commands {
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_normalize(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace repopath::cli;

    CLI::App app{"repopath - validate repo-relative path lists"};
    app.set_version_flag("-V,--version", REPOPATH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--log-tail-kb", opts.log_tail_kb, "Size of the captured log tail in KiB")
        ->check(CLI::NonNegativeNumber);

    auto* check_cmd = app.add_subcommand("check", "Validate a newline-separated path list");
    commands::setup_check(check_cmd, opts);

    auto* normalize_cmd = app.add_subcommand("normalize", "Normalize and validate single paths");
    commands::setup_normalize(normalize_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
