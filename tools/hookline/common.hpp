/**
 * hookline CLI - Common utilities and types
 */

#pragma once

#include <hookline/config.hpp>
#include <hookline/environment.hpp>
#include <hookline/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>
#include <optional>
#include <iostream>
#include <vector>

#ifndef HOOKLINE_VERSION
#define HOOKLINE_VERSION "0.0.0"
#endif

namespace hookline::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    std::string hooks_dir;         // --hooks-dir
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the configuration file.
 * Priority: --config flag > HOOKLINE_CONFIG env > ./hookline.json
 */
inline std::string resolve_config_path(const GlobalOptions& opts, const Environment& env) {
    if (!opts.config.empty()) {
        return opts.config;
    }

    auto env_config = env.get("HOOKLINE_CONFIG");
    if (env_config && !env_config->empty()) {
        return *env_config;
    }

    return "hookline.json";
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg, bool /* json_mode */) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * DEBUG drives the log tags; --verbose enables all of them and --quiet
 * silences warnings.
 */
inline void configure_logging(const GlobalOptions& opts, const Environment& env) {
    if (opts.verbose) {
        log::configure("*");
    } else {
        log::configure(env.get("DEBUG").value_or(""));
    }
    if (opts.quiet) {
        log::enable("warn", false);
    }
}

/**
 * Load the engine configuration: file, then HOOKS_* variables, then
 * --hooks-dir. Reports problems and returns nullopt on failure.
 */
inline std::optional<EngineConfig> load_config(const GlobalOptions& opts, const Environment& env) {
    std::string path = resolve_config_path(opts, env);

    if (!opts.config.empty() && !std::ifstream(path)) {
        print_error("configuration file not found: " + path, opts.json);
        return std::nullopt;
    }

    auto parsed = load_engine_config(path);
    if (!parsed.ok) {
        print_error("invalid configuration " + path + ": " + parsed.error, opts.json);
        return std::nullopt;
    }
    for (const auto& warning : parsed.warnings) {
        print_warning(warning, opts.json);
    }

    EngineConfig config = parsed.config;
    for (const auto& warning : apply_env_overrides(config, env)) {
        print_warning(warning, opts.json);
    }

    if (!opts.hooks_dir.empty()) {
        config.hooks_dir = opts.hooks_dir;
    }
    return config;
}

} // namespace hookline::cli
