#pragma once

/**
 * @file contract.hpp
 * @brief Contract directives: the narrow channel from an implementation
 *        back to the coordinator
 *
 * Wire format, one directive per stdout line:
 *
 *   contract:env:NAME=VALUE     set
 *   contract:env:NAME+=VALUE    append with the path separator
 *   contract:env:NAME^=VALUE    prepend with the path separator
 *   contract:env:NAME-=VALUE    remove every matching segment
 *   contract:route:/path        run another script, then stop
 *   contract:exit:CODE          stop with CODE (0-255)
 */

#include "hookline/environment.hpp"
#include "hookline/types.hpp"

#include <optional>
#include <string>

namespace hookline {

constexpr const char* CONTRACT_PREFIX = "contract:";

// ============================================================================
// Directives
// ============================================================================

enum class DirectiveKind {
    SetEnv,
    AppendEnv,
    PrependEnv,
    RemoveEnv,
    Route,
    Exit
};

inline const char* directive_kind_to_string(DirectiveKind k) {
    switch (k) {
        case DirectiveKind::SetEnv: return "set_env";
        case DirectiveKind::AppendEnv: return "append_env";
        case DirectiveKind::PrependEnv: return "prepend_env";
        case DirectiveKind::RemoveEnv: return "remove_env";
        case DirectiveKind::Route: return "route";
        case DirectiveKind::Exit: return "exit";
        default: return "set_env";
    }
}

struct Directive {
    DirectiveKind kind = DirectiveKind::SetEnv;
    std::string name;   // env directives
    std::string value;  // env value or route path
    int code = 0;       // exit directive
};

Directive env_directive(const std::string& name, EnvOp op, const std::string& value);
Directive route_directive(const std::string& path);
Directive exit_directive(int code);

// Environment operation behind an env directive
std::optional<EnvOp> directive_env_op(DirectiveKind kind);

// Whether a line is meant for the contract channel at all
bool is_contract_line(const std::string& line);

/**
 * Parse one `contract:` line.
 *
 * Fails with INVALID_DIRECTIVE for unknown directive kinds, env
 * expressions without an operator, invalid variable names, empty routes
 * and exit codes outside 0-255.
 */
Result<Directive> parse_directive(const std::string& line);

// Wire form of a directive, including the `contract:` prefix
std::string format_directive(const Directive& directive);

// ============================================================================
// Flow State
// ============================================================================

/**
 * Control-flow request left by middleware for the engine.
 * Cleared at the start of every run.
 */
struct FlowState {
    bool terminate = false;
    std::string route;
    std::optional<int> exit_code;

    void clear() {
        terminate = false;
        route.clear();
        exit_code.reset();
    }
};

/**
 * Apply a directive to the coordinator.
 *
 * Env directives mutate `env` (a change to DEBUG re-applies the log tag
 * filter); route and exit directives request termination through `flow`.
 */
void apply_directive(const Directive& directive, Environment& env, FlowState& flow);

} // namespace hookline
