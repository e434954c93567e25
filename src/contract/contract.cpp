#include "hookline/contract.hpp"
#include "hookline/log.hpp"

#include <cerrno>
#include <cstdlib>

namespace hookline {

namespace {

constexpr const char* kEnvPrefix = "env:";
constexpr const char* kRoutePrefix = "route:";
constexpr const char* kExitPrefix = "exit:";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

Result<Directive> invalid(const std::string& line, const std::string& reason) {
    return Result<Directive>::err(
        Error(ErrorCode::INVALID_DIRECTIVE, reason + " '" + line + "'"));
}

struct OperatorForm {
    const char* token;
    DirectiveKind kind;
};

// Two-character operators take precedence over a plain "="
const OperatorForm kOperators[] = {
    {"+=", DirectiveKind::AppendEnv},
    {"^=", DirectiveKind::PrependEnv},
    {"-=", DirectiveKind::RemoveEnv},
    {"=", DirectiveKind::SetEnv},
};

const char* operator_token(DirectiveKind kind) {
    for (const auto& form : kOperators) {
        if (form.kind == kind) return form.token;
    }
    return "=";
}

} // namespace

Directive env_directive(const std::string& name, EnvOp op, const std::string& value) {
    Directive d;
    switch (op) {
        case EnvOp::Set: d.kind = DirectiveKind::SetEnv; break;
        case EnvOp::Append: d.kind = DirectiveKind::AppendEnv; break;
        case EnvOp::Prepend: d.kind = DirectiveKind::PrependEnv; break;
        case EnvOp::Remove: d.kind = DirectiveKind::RemoveEnv; break;
    }
    d.name = name;
    d.value = value;
    return d;
}

Directive route_directive(const std::string& path) {
    Directive d;
    d.kind = DirectiveKind::Route;
    d.value = path;
    return d;
}

Directive exit_directive(int code) {
    Directive d;
    d.kind = DirectiveKind::Exit;
    d.code = code;
    return d;
}

std::optional<EnvOp> directive_env_op(DirectiveKind kind) {
    switch (kind) {
        case DirectiveKind::SetEnv: return EnvOp::Set;
        case DirectiveKind::AppendEnv: return EnvOp::Append;
        case DirectiveKind::PrependEnv: return EnvOp::Prepend;
        case DirectiveKind::RemoveEnv: return EnvOp::Remove;
        default: return std::nullopt;
    }
}

bool is_contract_line(const std::string& line) {
    return starts_with(line, CONTRACT_PREFIX);
}

Result<Directive> parse_directive(const std::string& line) {
    if (!is_contract_line(line)) {
        return invalid(line, "not a contract directive");
    }
    std::string body = line.substr(std::string(CONTRACT_PREFIX).size());

    if (starts_with(body, kEnvPrefix)) {
        std::string expr = body.substr(std::string(kEnvPrefix).size());

        // The operator ends at the first '='; anything after it is value
        size_t eq = expr.find('=');
        if (eq != std::string::npos) {
            Directive d;
            d.kind = DirectiveKind::SetEnv;
            size_t name_end = eq;
            if (eq > 0) {
                for (const auto& form : kOperators) {
                    if (form.token[1] != '\0' && expr[eq - 1] == form.token[0]) {
                        d.kind = form.kind;
                        name_end = eq - 1;
                        break;
                    }
                }
            }
            d.name = expr.substr(0, name_end);
            d.value = expr.substr(eq + 1);
            if (!is_valid_env_name(d.name)) {
                return invalid(line, "invalid env var name '" + d.name + "' in");
            }
            return Result<Directive>::ok(std::move(d));
        }
        return invalid(line, "invalid contract env directive");
    }

    if (starts_with(body, kRoutePrefix)) {
        std::string path = body.substr(std::string(kRoutePrefix).size());
        if (path.empty()) {
            return invalid(line, "empty route in");
        }
        return Result<Directive>::ok(route_directive(path));
    }

    if (starts_with(body, kExitPrefix)) {
        std::string text = body.substr(std::string(kExitPrefix).size());
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            return invalid(line, "exit code must be an integer in");
        }
        errno = 0;
        long code = std::strtol(text.c_str(), nullptr, 10);
        if (errno != 0 || code > 255) {
            return invalid(line, "exit code out of range (0-255) in");
        }
        return Result<Directive>::ok(exit_directive(static_cast<int>(code)));
    }

    return invalid(line, "unknown contract directive");
}

std::string format_directive(const Directive& directive) {
    std::string out = CONTRACT_PREFIX;
    switch (directive.kind) {
        case DirectiveKind::SetEnv:
        case DirectiveKind::AppendEnv:
        case DirectiveKind::PrependEnv:
        case DirectiveKind::RemoveEnv:
            out += kEnvPrefix;
            out += directive.name;
            out += operator_token(directive.kind);
            out += directive.value;
            break;
        case DirectiveKind::Route:
            out += kRoutePrefix;
            out += directive.value;
            break;
        case DirectiveKind::Exit:
            out += kExitPrefix;
            out += std::to_string(directive.code);
            break;
    }
    return out;
}

void apply_directive(const Directive& directive, Environment& env, FlowState& flow) {
    if (auto op = directive_env_op(directive.kind)) {
        env.apply(directive.name, *op, directive.value);
        log::modes().format("contract: {} {} {}", directive.name,
                            env_op_to_string(*op), directive.value);

        if (directive.name == "DEBUG") {
            log::configure(env.get("DEBUG").value_or(""));
        }
        return;
    }

    switch (directive.kind) {
        case DirectiveKind::Route:
            flow.route = directive.value;
            flow.terminate = true;
            log::modes().format("contract: route to {}", directive.value);
            break;
        case DirectiveKind::Exit:
            flow.exit_code = directive.code;
            flow.terminate = true;
            log::modes().format("contract: exit with {}", directive.code);
            break;
        default:
            break;
    }
}

} // namespace hookline
