#include "hookline/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

namespace hookline {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Read a string member; a present value of another type is reported
void read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                 std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_string()) {
        out = j[key].get<std::string>();
    } else {
        warnings.push_back("invalid_configuration:" + key + ":expected_string");
    }
}

void read_string_array(const nlohmann::json& j, const std::string& key,
                       std::vector<std::string>& out, std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (!j[key].is_array()) {
        warnings.push_back("invalid_configuration:" + key + ":expected_array");
        return;
    }
    out.clear();
    for (const auto& elem : j[key]) {
        if (elem.is_string()) {
            out.push_back(elem.get<std::string>());
        } else {
            warnings.push_back("invalid_configuration:" + key + ":non_string_element");
        }
    }
}

std::optional<bool> parse_bool(const std::string& s) {
    std::string value = to_lower(trim(s));
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    return std::nullopt;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

EngineConfigParseResult parse_engine_config(const std::string& json_str,
                                            const std::string& source_path) {
    EngineConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (j.contains("$schema") && j["$schema"].is_string()) {
            result.config.schema = trim(j["$schema"].get<std::string>());
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        read_string(j, "hooks_dir", result.config.hooks_dir, result.warnings);
        read_string(j, "function_prefix", result.config.function_prefix, result.warnings);
        read_string(j, "shell", result.config.shell, result.warnings);
        read_string(j, "path_separator", result.config.path_separator, result.warnings);

        if (j.contains("exec_mode")) {
            std::optional<ExecMode> mode;
            if (j["exec_mode"].is_string()) {
                mode = parse_exec_mode(j["exec_mode"].get<std::string>());
            }
            if (mode) {
                result.config.exec_mode = *mode;
            } else {
                result.warnings.push_back("invalid_configuration:exec_mode:invalid_value");
            }
        }

        if (j.contains("auto_trap")) {
            if (j["auto_trap"].is_boolean()) {
                result.config.auto_trap = j["auto_trap"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:auto_trap:expected_boolean");
            }
        }

        read_string_array(j, "source_patterns", result.config.source_patterns, result.warnings);
        read_string_array(j, "script_patterns", result.config.script_patterns, result.warnings);
        read_string_array(j, "hooks", result.config.hooks, result.warnings);

        // Hook names are validated here so tools fail before running anything
        for (const auto& hook : result.config.hooks) {
            if (!is_valid_hook_name(hook)) {
                result.error = "invalid hook name in hooks: '" + hook + "'";
                return result;
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

EngineConfigParseResult load_engine_config(const std::string& path) {
    if (path.empty() || !file_exists(path)) {
        EngineConfigParseResult result;
        result.ok = true;
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        EngineConfigParseResult result;
        result.error = "cannot read " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_engine_config(ss.str(), path);
}

std::vector<std::string> apply_env_overrides(EngineConfig& config, const Environment& env) {
    std::vector<std::string> warnings;

    if (auto dir = env.get("HOOKS_DIR")) {
        config.hooks_dir = *dir;
    }
    if (auto prefix = env.get("HOOKS_PREFIX")) {
        config.function_prefix = *prefix;
    }
    if (auto mode = env.get("HOOKS_EXEC_MODE")) {
        if (auto parsed = parse_exec_mode(*mode)) {
            config.exec_mode = *parsed;
        } else {
            warnings.push_back("invalid_override:HOOKS_EXEC_MODE:" + *mode);
        }
    }
    if (auto trap = env.get("HOOKS_AUTO_TRAP")) {
        if (auto parsed = parse_bool(*trap)) {
            config.auto_trap = *parsed;
        } else {
            warnings.push_back("invalid_override:HOOKS_AUTO_TRAP:" + *trap);
        }
    }

    return warnings;
}

} // namespace hookline
