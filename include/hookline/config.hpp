#pragma once

#include "hookline/environment.hpp"
#include "hookline/types.hpp"

#include <string>
#include <vector>

namespace hookline {

constexpr const char* CONFIG_SCHEMA = "hookline.config.v1";

// ============================================================================
// Engine Configuration
// ============================================================================

struct EngineConfig {
    std::string schema = CONFIG_SCHEMA;
    std::string source_path;  // empty for built-in defaults

    std::string hooks_dir = "ci-cd";
    std::string function_prefix = "hook:";
    ExecMode exec_mode = ExecMode::Exec;
    bool auto_trap = true;
    std::string shell = "bash";
    std::string path_separator = ":";

    // Glob patterns matched against script file names
    std::vector<std::string> source_patterns;
    std::vector<std::string> script_patterns;

    // Hooks declared up front by tools that load this config
    std::vector<std::string> hooks;
};

struct EngineConfigParseResult {
    bool ok = false;
    std::string error;
    EngineConfig config;
    std::vector<std::string> warnings;
};

/**
 * Parse a configuration document.
 *
 * `$schema` must be "hookline.config.v1". Unknown keys are ignored;
 * values of the wrong type keep their default and add a warning.
 */
EngineConfigParseResult parse_engine_config(const std::string& json_str,
                                            const std::string& source_path = "");

/**
 * Read and parse a configuration file. A missing file yields the
 * defaults; an unreadable or invalid one is an error.
 */
EngineConfigParseResult load_engine_config(const std::string& path);

/**
 * Apply HOOKS_DIR, HOOKS_PREFIX, HOOKS_EXEC_MODE and HOOKS_AUTO_TRAP.
 * Returns warnings for values that could not be used.
 */
std::vector<std::string> apply_env_overrides(EngineConfig& config, const Environment& env);

} // namespace hookline
