/**
 * worthit CLI - Common utilities and types
 */

#pragma once

#include <worthit/config.hpp>
#include <worthit/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <iterator>
#include <string>

namespace worthit::cli {

/**
 * Options collected from the command line.
 * Empty strings mean "not given" so config and environment can fill them.
 */
struct GlobalOptions {
    std::string payload;           // positional; stdin when empty
    std::string config_path;       // --config
    std::string root;              // --root
    std::string format;            // --format
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * stdout belongs to the host, so every log line goes to stderr.
 */
inline void init_logging() {
    auto logger = spdlog::stderr_color_st("worthit");
    logger->set_pattern("[%n] [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
}

/**
 * Fold CLI flags on top of the loaded config.
 * Priority: flag > environment > config file > built-in default.
 */
inline void apply_cli_overrides(Config& config, const GlobalOptions& opts) {
    if (!opts.root.empty()) {
        config.transcript_root = opts.root;
    }
    if (!opts.format.empty()) {
        if (auto parsed = parse_output_format(opts.format)) {
            config.format = *parsed;
        }
    }
    if (opts.verbose) {
        config.log_level = spdlog::level::debug;
    } else if (opts.quiet) {
        config.log_level = spdlog::level::err;
    }
}

inline std::string read_all_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& category, const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = category;
        j["message"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error [" << category << "]: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace worthit::cli
