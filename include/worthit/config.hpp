#pragma once

#include "worthit/types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace worthit {

// ============================================================================
// Configuration
// ============================================================================

inline constexpr const char* kConfigSchema = "worthit.config.v1";

struct Config {
    std::string schema;
    std::string transcript_root;  // empty: no root containment
    OutputFormat format = OutputFormat::Fields;
    spdlog::level::level_enum log_level = spdlog::level::warn;

    // Source path for diagnostics
    std::string source_path;
};

Config get_builtin_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

// Parse a config document. Unknown "format" or "log_level" values keep the
// defaults and add a warning.
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Accepts spdlog's names: trace, debug, info, warn, error, critical, off.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

// Config file location.
// Priority: explicit path > WORTHIT_CONFIG > $XDG_CONFIG_HOME/worthit/config.json
//           > $HOME/.config/worthit/config.json
struct ConfigLocation {
    std::string path;
    bool explicit_path = false;  // a missing explicit file is an error
};

ConfigLocation resolve_config_location(const std::string& override_path);

// Load the file at the resolved location. A missing default file yields the
// built-in config.
ConfigParseResult load_config(const ConfigLocation& location);

// Apply WORTHIT_TRANSCRIPT_ROOT and WORTHIT_LOG_LEVEL on top of config.
void apply_environment(Config& config, std::vector<std::string>& warnings);

} // namespace worthit
