#include "worthit/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace worthit {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string env_or_empty(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

} // namespace

Config get_builtin_config() {
    Config config;
    config.schema = kConfigSchema;
    config.format = OutputFormat::Fields;
    config.log_level = spdlog::level::warn;
    return config;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        if (auto root = get_string(j, "transcript_root")) {
            result.config.transcript_root = trim(*root);
        } else if (j.contains("transcript_root") && !j["transcript_root"].is_null()) {
            result.warnings.push_back("invalid_configuration:transcript_root_not_string");
        }

        if (auto format = get_string(j, "format")) {
            auto parsed = parse_output_format(trim(*format));
            if (parsed) {
                result.config.format = *parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_format");
            }
        }

        if (auto level = get_string(j, "log_level")) {
            auto parsed = parse_log_level(*level);
            if (parsed) {
                result.config.log_level = *parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_log_level");
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigLocation resolve_config_location(const std::string& override_path) {
    // 1. Explicit override
    if (!override_path.empty()) {
        return {override_path, true};
    }

    // 2. Environment variable
    std::string env_path = env_or_empty("WORTHIT_CONFIG");
    if (!env_path.empty()) {
        return {env_path, true};
    }

    // 3. XDG config dir
    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return {xdg + "/worthit/config.json", false};
    }

    // 4. Default: ~/.config/worthit/config.json
    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        return {home + "/.config/worthit/config.json", false};
    }

    return {"", false};
}

ConfigParseResult load_config(const ConfigLocation& location) {
    ConfigParseResult result;

    if (location.path.empty()) {
        result.ok = true;
        result.config = get_builtin_config();
        return result;
    }

    std::error_code ec;
    bool exists = std::filesystem::exists(location.path, ec);
    if (ec) {
        result.error = "cannot access config file " + location.path + ": " + ec.message();
        return result;
    }
    if (!exists) {
        if (location.explicit_path) {
            result.error = "config file not found: " + location.path;
            return result;
        }
        result.ok = true;
        result.config = get_builtin_config();
        return result;
    }

    std::ifstream file(location.path);
    if (!file) {
        result.error = "cannot open config file: " + location.path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    return parse_config(ss.str(), location.path);
}

void apply_environment(Config& config, std::vector<std::string>& warnings) {
    std::string root = env_or_empty("WORTHIT_TRANSCRIPT_ROOT");
    if (!root.empty()) {
        config.transcript_root = root;
    }

    std::string level = env_or_empty("WORTHIT_LOG_LEVEL");
    if (!level.empty()) {
        auto parsed = parse_log_level(level);
        if (parsed) {
            config.log_level = *parsed;
        } else {
            warnings.push_back("invalid_configuration:WORTHIT_LOG_LEVEL");
        }
    }
}

} // namespace worthit
