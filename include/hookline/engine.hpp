#pragma once

/**
 * @file engine.hpp
 * @brief Hook engine: declaration, discovery, ordering and execution
 *
 * A hook runs its implementations in one deterministic order:
 *
 *   1. the inline function `<prefix><hook>` (at most one)
 *   2. registered functions and scripts from the hooks directory, merged
 *      into one ascending sequence by sort key
 *
 * Exec-mode implementations run under the capture harness and their
 * output goes through the hook's middleware. Source-mode implementations
 * share the coordinator's environment and streams directly.
 *
 * @example
 * ```cpp
 * hookline::Environment env = hookline::Environment::from_process();
 * hookline::SignalRegistry signals;
 * hookline::Engine engine(hookline::EngineConfig{}, env, signals);
 *
 * engine.bootstrap();
 * engine.declare({"deploy"});
 * engine.define_function("backup", [](const hookline::HookCall&) { return 0; });
 * engine.register_function("deploy", "10-backup", "backup");
 * auto status = engine.run("deploy", {"production"});
 * ```
 */

#include "hookline/capture.hpp"
#include "hookline/config.hpp"
#include "hookline/contract.hpp"
#include "hookline/environment.hpp"
#include "hookline/middleware.hpp"
#include "hookline/signals.hpp"
#include "hookline/types.hpp"

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hookline {

class Engine;

// ============================================================================
// Implementations
// ============================================================================

/**
 * What an in-process implementation receives.
 * `live_env` is only set for source-mode functions.
 */
struct HookCall {
    const std::string& hook;
    const std::vector<std::string>& args;
    const Environment& env;
    Environment* live_env;
};

using HookFunction = std::function<int(const HookCall& call)>;

struct Registration {
    std::string sort_key;
    std::string function_name;
};

struct ScriptEntry {
    std::string path;       // hooks_dir/file_name
    std::string file_name;
    std::string sort_key;   // file name without "<hook>-"/"<hook>_" and ".sh"
};

// One step of the merged registered + script sequence
struct MergedEntry {
    std::string sort_key;
    ImplKind kind;
    std::string target;  // function name or script path
    std::string label;   // sort key or file name
};

// ============================================================================
// Results
// ============================================================================

struct HookOutcome {
    int status = 0;
    RunState state = RunState::Pending;
    bool terminated = false;
    std::string route;
    std::optional<int> flow_exit_code;
    size_t implementations = 0;
};

struct HookInfo {
    std::string name;
    std::vector<std::string> contexts;
    bool inline_function = false;
    size_t registered = 0;
    size_t scripts = 0;
    std::string middleware;  // label, "default" when unbound
};

/**
 * Applies a terminated outcome. The default handler runs the route (if
 * any) and exits the process through the signal registry.
 */
using FlowHandler = std::function<int(const HookOutcome& outcome, Engine& engine)>;

// ============================================================================
// Engine
// ============================================================================

class Engine {
public:
    Engine(EngineConfig config, Environment& env, SignalRegistry& signals,
           std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ------------------------------------------------------------------
    // Declaration
    // ------------------------------------------------------------------

    /**
     * Declare hooks from a context (a script path, "main", ...).
     * Stops at the first invalid name; earlier names stay declared.
     */
    Result<void> declare(const std::vector<std::string>& names,
                         const std::string& context = "main");

    // Declare begin/end and, with auto_trap, run `end` on exit
    Result<void> bootstrap();

    bool known(const std::string& hook) const;

    // ------------------------------------------------------------------
    // Functions and registrations
    // ------------------------------------------------------------------

    void define_function(const std::string& name, HookFunction fn,
                         ExecMode mode = ExecMode::Exec);
    bool undefine_function(const std::string& name);
    bool has_function(const std::string& name) const;

    Result<void> register_function(const std::string& hook,
                                   const std::string& sort_key,
                                   const std::string& function_name);
    Result<void> unregister_function(const std::string& hook, const std::string& sort_key);

    std::vector<Registration> registrations(const std::string& hook) const;

    // ------------------------------------------------------------------
    // Middleware
    // ------------------------------------------------------------------

    Result<void> set_middleware(const std::string& hook, const std::string& label,
                                Middleware middleware);
    void clear_middleware(const std::string& hook);

    // ------------------------------------------------------------------
    // Script discovery and modes
    // ------------------------------------------------------------------

    void add_source_pattern(const std::string& glob);
    void add_script_pattern(const std::string& glob);

    // Source patterns win over script patterns, which win over the fallback
    ExecMode exec_mode_for(const std::string& file_name) const;
    ExecMode exec_mode_for(const std::string& file_name, ExecMode fallback) const;

    // Executable `<hook>-*` / `<hook>_*` files in hooks_dir, by file name
    std::vector<ScriptEntry> discover_scripts(const std::string& hook) const;

    // Registered functions and scripts in execution order
    std::vector<MergedEntry> merged_sequence(const std::string& hook) const;

    // ------------------------------------------------------------------
    // Execution
    // ------------------------------------------------------------------

    /**
     * Run every implementation of a hook and report the outcome.
     * An undeclared hook is skipped with status 0. Capture failures are
     * returned as errors.
     */
    Result<HookOutcome> invoke(const std::string& hook,
                               const std::vector<std::string>& args = {},
                               std::optional<ExecMode> mode = std::nullopt);

    // invoke(), then apply the flow when middleware requested termination
    Result<int> run(const std::string& hook, const std::vector<std::string>& args = {});

    // Call-level mode overrides; patterns still take precedence
    Result<int> run_source(const std::string& hook, const std::vector<std::string>& args = {});
    Result<int> run_script(const std::string& hook, const std::vector<std::string>& args = {});

    int apply_flow(const HookOutcome& outcome);
    void set_flow_handler(FlowHandler handler);

    // ------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------

    std::vector<HookInfo> list() const;

    // Inline function or at least one script present
    bool runnable(const std::string& hook) const;

    RunState state() const { return state_; }

    // Back to the loaded configuration with nothing declared
    void reset();

    EngineConfig& config() { return config_; }
    const EngineConfig& config() const { return config_; }
    Environment& env() { return env_; }
    FlowState& flow() { return flow_; }
    SignalRegistry& signals() { return signals_; }
    CaptureHarness& capture() { return capture_; }

private:
    struct FunctionEntry {
        HookFunction fn;
        ExecMode mode;
    };

    struct MiddlewareBinding {
        std::string label;
        Middleware fn;
    };

    void set_state(RunState state);
    void install_end_trap();
    void remove_end_trap();

    Result<int> run_function(const std::string& hook, const std::string& name,
                             const FunctionEntry& entry,
                             const std::vector<std::string>& args);
    Result<int> run_script_entry(const std::string& hook, const MergedEntry& entry,
                                 const std::vector<std::string>& args,
                                 std::optional<ExecMode> mode);
    Result<int> run_sourced_script(const MergedEntry& entry,
                                   const std::vector<std::string>& args);
    int apply_middleware(const std::string& hook, const Capture& capture,
                         const std::vector<std::string>& args);

    // Dispatch pending signals, then check for termination
    bool after_implementation(HookOutcome& outcome);

    int default_flow(const HookOutcome& outcome);

    EngineConfig config_;
    EngineConfig loaded_config_;
    Environment& env_;
    SignalRegistry& signals_;
    std::ostream& out_;
    std::ostream& err_;
    CaptureHarness capture_;

    std::map<std::string, std::vector<std::string>> declared_;  // hook -> contexts
    std::map<std::string, FunctionEntry> functions_;
    std::map<std::string, std::vector<Registration>> registrations_;
    std::map<std::string, MiddlewareBinding> middleware_;
    std::vector<std::string> source_patterns_;
    std::vector<std::string> script_patterns_;

    FlowState flow_;
    FlowHandler flow_handler_;
    RunState state_ = RunState::Pending;
    bool end_trap_installed_ = false;
};

} // namespace hookline
