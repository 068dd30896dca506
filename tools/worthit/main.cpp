/**
 * worthit CLI - Entry Point
 *
 * Stop hook that prices the last turn of a conversation transcript.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <worthit/hook.hpp>

namespace worthit::cli {

namespace {

int cmd_hook(const GlobalOptions& opts) {
    auto location = resolve_config_location(opts.config_path);
    auto loaded = load_config(location);
    if (!loaded.ok) {
        print_error("config", loaded.error, opts.json);
        return 1;
    }

    Config config = loaded.config;
    apply_environment(config, loaded.warnings);
    apply_cli_overrides(config, opts);
    spdlog::set_level(config.log_level);

    for (const auto& warning : loaded.warnings) {
        spdlog::warn("config: {}", warning);
    }
    spdlog::debug("output format {}, root containment {}",
                  output_format_to_string(config.format),
                  config.transcript_root.empty() ? "off" : "on");

    std::string payload = opts.payload.empty() ? read_all_stdin() : opts.payload;

    HookOptions hook_opts;
    hook_opts.transcript_root = config.transcript_root;
    auto outcome = process_hook_text(payload, hook_opts);

    switch (outcome.status) {
        case HookStatus::Failed:
            print_error(outcome.error_category, outcome.message, opts.json);
            return 1;

        case HookStatus::NothingToReport:
            if (opts.json) {
                nlohmann::json j;
                j["ok"] = true;
                j["report"] = nullptr;
                output_json(j);
            }
            return 0;

        case HookStatus::Reported:
            if (opts.json) {
                output_json(report_to_json(outcome.report));
            } else {
                std::cout << render_report(outcome.report, config.format) << std::endl;
            }
            return 0;
    }
    return 1;
}

} // anonymous namespace

} // namespace worthit::cli

int main(int argc, char** argv) {
    using namespace worthit::cli;

    init_logging();

    CLI::App app{"worthit - token usage and cost for the last conversation turn"};
    app.set_version_flag("-V,--version", WORTHIT_VERSION);

    GlobalOptions opts;

    app.add_option("payload", opts.payload, "Hook payload JSON (read from stdin when omitted)");
    app.add_option("--config", opts.config_path, "Config file (default: ~/.config/worthit/config.json)");
    app.add_option("--root", opts.root, "Only accept transcripts under this directory");
    app.add_option("--format", opts.format, "Text output format")
        ->check(CLI::IsMember({"fields", "status"}));
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging on stderr");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors");

    CLI11_PARSE(app, argc, argv);

    return cmd_hook(opts);
}
