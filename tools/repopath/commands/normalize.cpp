/**
 * repopath CLI - normalize command
 *
 * Normalize and validate individual paths.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace repopath::cli::commands {

namespace {

struct NormalizeOptions {
    std::vector<std::string> paths;
};

int cmd_normalize(const GlobalOptions& flags, const NormalizeOptions& norm_opts) {
    GlobalOptions opts = resolve_options(flags);
    init_logging(opts);

    bool all_ok = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& input : norm_opts.paths) {
        std::string normalized = normalize_repo_path(input);
        auto verdict = validate_repo_path(normalized);
        spdlog::debug("'{}' normalized to '{}'", input, normalized);

        if (opts.json) {
            nlohmann::json j;
            j["input"] = input;
            j["normalized"] = normalized;
            j["ok"] = verdict.ok;
            if (!verdict.ok) {
                j["kind"] = path_error_to_string(verdict.error);
                j["error"] = path_error_message(verdict.error);
            }
            results.push_back(j);
        } else if (verdict.ok) {
            std::cout << input << " -> " << verdict.path << std::endl;
        } else {
            std::cout << input << ": " << path_error_message(verdict.error) << std::endl;
        }

        all_ok = all_ok && verdict.ok;
    }

    if (opts.json) {
        output_json(results);
    }

    return all_ok ? 0 : 1;
}

} // anonymous namespace

void setup_normalize(CLI::App* app, GlobalOptions& opts) {
    static NormalizeOptions norm_opts;

    app->add_option("paths", norm_opts.paths, "Paths to normalize")->required();

    app->callback([&opts]() {
        std::exit(cmd_normalize(opts, norm_opts));
    });
}

} // namespace repopath::cli::commands
