#include "hookline/engine.hpp"
#include "hookline/log.hpp"
#include "hookline/process.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <fnmatch.h>
#include <unistd.h>

namespace hookline {

namespace fs = std::filesystem;

namespace {

constexpr const char* kEndTrapName = "hooks:on_exit";

// Descriptor on which a sourced script reports its final environment
constexpr int kReportFd = 3;

// Sources the script with allexport on, calls hook:run when the script
// defines it, then dumps the environment to the report descriptor.
constexpr const char* kSourceWrapper = R"(__hookline_script="$1"
shift
set -a
. "$__hookline_script"
if declare -F hook:run >/dev/null 2>&1; then
  hook:run "$@"
  __hookline_rc=$?
else
  __hookline_missing_run=1
  __hookline_rc=0
fi
env -0 >&3
exit "$__hookline_rc"
)";

constexpr const char* kInternalPrefix = "__hookline_";

// Maintained by the shell itself; never adopted from a sourced script
const char* const kShellManaged[] = {"_", "SHLVL", "PWD", "OLDPWD"};

bool byte_less(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) { return static_cast<unsigned char>(x) < static_cast<unsigned char>(y); });
}

int kind_rank(ImplKind kind) {
    switch (kind) {
        case ImplKind::Inline: return 0;
        case ImplKind::Registered: return 1;
        case ImplKind::Script: return 2;
    }
    return 2;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool glob_match(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

std::vector<std::string> with_separator(const std::vector<std::string>& args) {
    std::vector<std::string> result;
    result.reserve(args.size() + 1);
    result.push_back(ARGS_SEPARATOR);
    result.insert(result.end(), args.begin(), args.end());
    return result;
}

// NUL-separated NAME=VALUE records as written by `env -0`
std::unordered_map<std::string, std::string> parse_env_report(const std::string& report) {
    std::unordered_map<std::string, std::string> vars;
    size_t start = 0;
    while (start < report.size()) {
        size_t end = report.find('\0', start);
        if (end == std::string::npos) end = report.size();
        std::string entry = report.substr(start, end - start);
        size_t eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            vars[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        start = end + 1;
    }
    return vars;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Engine::Engine(EngineConfig config, Environment& env, SignalRegistry& signals,
               std::ostream& out, std::ostream& err)
    : config_(config),
      loaded_config_(std::move(config)),
      env_(env),
      signals_(signals),
      out_(out),
      err_(err),
      capture_(&signals) {
    env_.set_separator(config_.path_separator);
    source_patterns_ = config_.source_patterns;
    script_patterns_ = config_.script_patterns;

    // Log tag filtering follows DEBUG however it changes
    env_.set_listener([this](const std::string& name) {
        if (name == "DEBUG") {
            log::configure(env_.get("DEBUG").value_or(""));
        }
    });
}

Engine::~Engine() {
    env_.set_listener(nullptr);
    remove_end_trap();
}

void Engine::set_state(RunState state) {
    state_ = state;
    log::hooks().format("  state: {}", run_state_to_string(state));
}

// ============================================================================
// Declaration
// ============================================================================

Result<void> Engine::declare(const std::vector<std::string>& names, const std::string& context) {
    log::hooks().format("Defining hooks from context: {}", context);

    for (const auto& name : names) {
        if (!is_valid_hook_name(name)) {
            log::error().format("invalid hook name '{}'. Only alphanumeric, underscore, and dash allowed.",
                                name);
            return Result<void>::err(Error(ErrorCode::INVALID_HOOK_NAME,
                                           "invalid hook name '" + name + "'"));
        }

        auto it = declared_.find(name);
        if (it == declared_.end()) {
            declared_[name] = {context};
            log::hooks().format("  Registered hook: {} (context: {})", name, context);
            continue;
        }

        auto& contexts = it->second;
        if (std::find(contexts.begin(), contexts.end(), context) != contexts.end()) {
            log::hooks().format("  Hook '{}' already registered from this context, skipping", name);
            continue;
        }

        std::string existing;
        for (const auto& c : contexts) {
            if (!existing.empty()) existing += "|";
            existing += c;
        }
        log::warn().format("Hook '{}' is being defined from multiple contexts:", name);
        log::warn().format("    Existing: {}", existing);
        log::warn().format("    New:      {}", context);
        contexts.push_back(context);
    }

    return Result<void>::ok();
}

Result<void> Engine::bootstrap() {
    auto declared = declare({"begin", "end"});
    if (declared.isErr()) {
        return declared;
    }
    if (config_.auto_trap) {
        install_end_trap();
    }
    return Result<void>::ok();
}

void Engine::install_end_trap() {
    if (end_trap_installed_) return;

    auto registered = signals_.on("EXIT", kEndTrapName, [this](int) {
        std::string status = std::to_string(signals_.exit_status());
        auto ran = run("end", {status});
        if (ran.isErr()) {
            log::error().format("end hook failed: {}", ran.error().message());
            return 1;
        }
        return ran.value();
    });
    if (registered.isErr()) {
        log::error().format("cannot install end hook trap: {}", registered.error().message());
        return;
    }

    signals_.guard_termination();
    end_trap_installed_ = true;
}

void Engine::remove_end_trap() {
    if (!end_trap_installed_) return;

    auto removed = signals_.off("EXIT", kEndTrapName);
    if (removed.isErr()) {
        log::error().line(removed.error().message());
    }
    end_trap_installed_ = false;
}

bool Engine::known(const std::string& hook) const {
    return declared_.count(hook) > 0;
}

// ============================================================================
// Functions and registrations
// ============================================================================

void Engine::define_function(const std::string& name, HookFunction fn, ExecMode mode) {
    functions_[name] = {std::move(fn), mode};
    log::hooks().format("Defined function '{}' ({} mode)", name, exec_mode_to_string(mode));
}

bool Engine::undefine_function(const std::string& name) {
    return functions_.erase(name) > 0;
}

bool Engine::has_function(const std::string& name) const {
    return functions_.count(name) > 0;
}

Result<void> Engine::register_function(const std::string& hook,
                                       const std::string& sort_key,
                                       const std::string& function_name) {
    if (hook.empty() || sort_key.empty() || function_name.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
            "register requires three parameters: <hook_name> <friendly_name> <function_name>"));
    }

    if (!has_function(function_name)) {
        return Result<void>::err(Error(ErrorCode::FUNCTION_NOT_FOUND,
                                       "function '" + function_name + "' does not exist"));
    }

    if (!known(hook)) {
        log::hooks().format("Registering function for undefined hook '{}' (hook should be defined first)",
                            hook);
    }

    auto& entries = registrations_[hook];
    for (const auto& entry : entries) {
        if (entry.sort_key == sort_key) {
            return Result<void>::err(Error(ErrorCode::DUPLICATE_REGISTRATION,
                "friendly name '" + sort_key + "' already registered for hook '" + hook + "'"));
        }
    }

    entries.push_back({sort_key, function_name});
    log::hooks().format("Registered function '{}' as '{}' for hook '{}'", function_name, sort_key, hook);
    return Result<void>::ok();
}

Result<void> Engine::unregister_function(const std::string& hook, const std::string& sort_key) {
    if (hook.empty() || sort_key.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
            "unregister requires two parameters: <hook_name> <friendly_name>"));
    }

    auto it = registrations_.find(hook);
    if (it == registrations_.end() || it->second.empty()) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND,
                                       "no registrations found for hook '" + hook + "'"));
    }

    auto& entries = it->second;
    auto found = std::find_if(entries.begin(), entries.end(),
                              [&](const Registration& r) { return r.sort_key == sort_key; });
    if (found == entries.end()) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND,
            "registration '" + sort_key + "' not found for hook '" + hook + "'"));
    }

    entries.erase(found);
    if (entries.empty()) {
        registrations_.erase(it);
    }
    log::hooks().format("Unregistered '{}' from hook '{}'", sort_key, hook);
    return Result<void>::ok();
}

std::vector<Registration> Engine::registrations(const std::string& hook) const {
    auto it = registrations_.find(hook);
    if (it == registrations_.end()) return {};
    return it->second;
}

// ============================================================================
// Middleware
// ============================================================================

Result<void> Engine::set_middleware(const std::string& hook, const std::string& label,
                                    Middleware middleware) {
    if (hook.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "middleware requires <hook> [function]"));
    }
    if (!middleware) {
        clear_middleware(hook);
        return Result<void>::ok();
    }

    middleware_[hook] = {label, std::move(middleware)};
    log::hooks().format("Registered middleware '{}' for hook '{}'", label, hook);
    return Result<void>::ok();
}

void Engine::clear_middleware(const std::string& hook) {
    middleware_.erase(hook);
    log::hooks().format("Reset middleware for hook '{}' to default", hook);
}

// ============================================================================
// Script discovery and modes
// ============================================================================

void Engine::add_source_pattern(const std::string& glob) {
    source_patterns_.push_back(glob);
    log::hooks().format("Registered pattern for sourced execution: {}", glob);
}

void Engine::add_script_pattern(const std::string& glob) {
    script_patterns_.push_back(glob);
    log::hooks().format("Registered pattern for script execution: {}", glob);
}

ExecMode Engine::exec_mode_for(const std::string& file_name) const {
    return exec_mode_for(file_name, config_.exec_mode);
}

ExecMode Engine::exec_mode_for(const std::string& file_name, ExecMode fallback) const {
    for (const auto& pattern : source_patterns_) {
        if (glob_match(pattern, file_name)) return ExecMode::Source;
    }
    for (const auto& pattern : script_patterns_) {
        if (glob_match(pattern, file_name)) return ExecMode::Exec;
    }
    return fallback;
}

std::vector<ScriptEntry> Engine::discover_scripts(const std::string& hook) const {
    std::vector<ScriptEntry> scripts;

    std::error_code ec;
    if (!fs::is_directory(config_.hooks_dir, ec)) {
        return scripts;
    }

    std::string dash_prefix = hook + "-";
    std::string underscore_prefix = hook + "_";

    for (const auto& entry : fs::directory_iterator(config_.hooks_dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        std::string file_name = entry.path().filename().string();
        std::string key;
        if (starts_with(file_name, dash_prefix)) {
            key = file_name.substr(dash_prefix.size());
        } else if (starts_with(file_name, underscore_prefix)) {
            key = file_name.substr(underscore_prefix.size());
        } else {
            continue;
        }

        std::string path = entry.path().string();
        if (::access(path.c_str(), X_OK) != 0) continue;

        if (key.size() >= 3 && key.compare(key.size() - 3, 3, ".sh") == 0) {
            key.erase(key.size() - 3);
        }
        scripts.push_back({path, file_name, key});
    }
    if (ec) {
        log::error().format("cannot scan {}: {}", config_.hooks_dir, ec.message());
    }

    std::sort(scripts.begin(), scripts.end(), [](const ScriptEntry& a, const ScriptEntry& b) {
        return byte_less(a.file_name, b.file_name);
    });
    return scripts;
}

std::vector<MergedEntry> Engine::merged_sequence(const std::string& hook) const {
    std::vector<MergedEntry> merged;

    auto reg = registrations_.find(hook);
    if (reg != registrations_.end()) {
        for (const auto& r : reg->second) {
            merged.push_back({r.sort_key, ImplKind::Registered, r.function_name, r.sort_key});
        }
    }
    for (const auto& s : discover_scripts(hook)) {
        merged.push_back({s.sort_key, ImplKind::Script, s.path, s.file_name});
    }

    std::stable_sort(merged.begin(), merged.end(), [](const MergedEntry& a, const MergedEntry& b) {
        if (a.sort_key != b.sort_key) return byte_less(a.sort_key, b.sort_key);
        if (a.kind != b.kind) return kind_rank(a.kind) < kind_rank(b.kind);
        return byte_less(a.label, b.label);
    });
    return merged;
}

// ============================================================================
// Execution
// ============================================================================

Result<HookOutcome> Engine::invoke(const std::string& hook,
                                   const std::vector<std::string>& args,
                                   std::optional<ExecMode> mode) {
    HookOutcome outcome;
    flow_.clear();
    set_state(RunState::Pending);

    if (!known(hook)) {
        log::hooks().format("Hook '{}' not defined, skipping", hook);
        outcome.state = RunState::Done;
        state_ = RunState::Done;
        return Result<HookOutcome>::ok(outcome);
    }

    log::hooks().format("Executing hook: {}", hook);
    auto binding = middleware_.find(hook);
    log::hooks().format("  Using middleware: {}",
                        binding != middleware_.end() ? binding->second.label : "default");

    // Inline function first
    std::string inline_name = config_.function_prefix + hook;
    auto inline_fn = functions_.find(inline_name);
    if (inline_fn != functions_.end()) {
        set_state(RunState::RunningInline);
        log::hooks().format("  -> [function] {}", inline_name);

        // Copy: the function may redefine itself
        FunctionEntry entry = inline_fn->second;
        auto ran = run_function(hook, inline_name, entry, args);
        if (ran.isErr()) {
            return Result<HookOutcome>::err(ran.error());
        }
        outcome.status = ran.value();
        outcome.implementations++;
        log::hooks().format("    exit code: {}", outcome.status);

        if (after_implementation(outcome)) {
            return Result<HookOutcome>::ok(outcome);
        }
    }

    // Registered functions and scripts in one sequence
    auto merged = merged_sequence(hook);
    if (!merged.empty()) {
        set_state(RunState::RunningMergedSequence);
    }

    size_t reg_total = 0;
    size_t script_total = 0;
    for (const auto& entry : merged) {
        (entry.kind == ImplKind::Registered ? reg_total : script_total)++;
    }
    size_t reg_num = 0;
    size_t script_num = 0;

    for (const auto& entry : merged) {
        if (entry.kind == ImplKind::Registered) {
            ++reg_num;
            auto fn = functions_.find(entry.target);
            if (fn == functions_.end()) {
                log::hooks().format("  [registered {}/{}] {} -> function {}() not found, skipping",
                                    reg_num, reg_total, entry.label, entry.target);
                continue;
            }
            log::hooks().format("  -> [registered {}/{}] {} -> {}()",
                                reg_num, reg_total, entry.label, entry.target);

            FunctionEntry function = fn->second;
            auto ran = run_function(hook, entry.target, function, args);
            if (ran.isErr()) {
                return Result<HookOutcome>::err(ran.error());
            }
            outcome.status = ran.value();
        } else {
            ++script_num;
            log::hooks().format("  -> [script {}/{}] {}", script_num, script_total, entry.label);

            auto ran = run_script_entry(hook, entry, args, mode);
            if (ran.isErr()) {
                return Result<HookOutcome>::err(ran.error());
            }
            outcome.status = ran.value();
        }

        outcome.implementations++;
        log::hooks().format("    exit code: {}", outcome.status);

        if (after_implementation(outcome)) {
            return Result<HookOutcome>::ok(outcome);
        }
    }

    if (outcome.implementations == 0) {
        log::hooks().format("  No implementations found for hook '{}'", hook);
    } else {
        log::hooks().format("  Completed hook '{}' ({} implementation(s), final exit code: {})",
                            hook, outcome.implementations, outcome.status);
    }

    outcome.state = RunState::Done;
    set_state(RunState::Done);
    return Result<HookOutcome>::ok(outcome);
}

bool Engine::after_implementation(HookOutcome& outcome) {
    signals_.dispatch_pending();

    set_state(RunState::FlowCheck);
    if (!flow_.terminate) {
        return false;
    }

    outcome.terminated = true;
    outcome.route = flow_.route;
    outcome.flow_exit_code = flow_.exit_code;
    outcome.status = flow_.exit_code.value_or(0);
    outcome.state = RunState::Terminated;
    set_state(RunState::Terminated);
    log::modes().format("flow terminated (route: '{}', exit code: {})", outcome.route, outcome.status);
    return true;
}

Result<int> Engine::run_function(const std::string& hook, const std::string& name,
                                 const FunctionEntry& entry,
                                 const std::vector<std::string>& args) {
    if (entry.mode == ExecMode::Source) {
        log::modes().format("{} runs in source mode", name);
        HookCall call{hook, args, env_, &env_};
        try {
            return Result<int>::ok(entry.fn(call));
        } catch (const std::exception& e) {
            log::error().format("hook function '{}' failed: {}", name, e.what());
            return Result<int>::ok(1);
        } catch (...) {
            log::error().format("hook function '{}' failed: unknown exception", name);
            return Result<int>::ok(1);
        }
    }

    set_state(RunState::Capturing);
    auto captured = capture_.run_function(hook, [&]() {
        HookCall call{hook, args, env_, nullptr};
        return entry.fn(call);
    });
    if (captured.isErr()) {
        return Result<int>::err(captured.error());
    }
    return Result<int>::ok(apply_middleware(hook, captured.value(), args));
}

Result<int> Engine::run_script_entry(const std::string& hook, const MergedEntry& entry,
                                     const std::vector<std::string>& args,
                                     std::optional<ExecMode> mode) {
    ExecMode exec_mode = exec_mode_for(entry.label, mode.value_or(config_.exec_mode));

    if (exec_mode == ExecMode::Source) {
        log::modes().format("{} runs in source mode", entry.label);
        return run_sourced_script(entry, args);
    }

    set_state(RunState::Capturing);
    std::vector<std::string> argv{entry.target};
    argv.insert(argv.end(), args.begin(), args.end());

    auto captured = capture_.run_process(hook, argv, env_);
    if (captured.isErr()) {
        return Result<int>::err(captured.error());
    }
    return Result<int>::ok(apply_middleware(hook, captured.value(), args));
}

Result<int> Engine::run_sourced_script(const MergedEntry& entry,
                                       const std::vector<std::string>& args) {
    std::vector<std::string> argv{
        process::resolve_executable(config_.shell, env_), "-c", kSourceWrapper,
        "hookline-source", entry.target};
    argv.insert(argv.end(), args.begin(), args.end());

    out_.flush();
    err_.flush();
    auto ran = process::run_attached(argv, env_, &signals_, kReportFd);
    if (ran.isErr()) {
        return Result<int>::err(ran.error());
    }

    const auto& report = ran.value().report;
    if (report.empty()) {
        // The script left through `exit`; its environment is lost
        log::modes().format("{} reported no environment", entry.label);
        return Result<int>::ok(ran.value().exit_code);
    }

    auto after = parse_env_report(report);
    if (after.count("__hookline_missing_run") > 0) {
        log::hooks().format("    No hook:run function found in {}, skipping", entry.label);
    }

    for (auto it = after.begin(); it != after.end();) {
        if (starts_with(it->first, kInternalPrefix) || starts_with(it->first, "BASH_FUNC_")) {
            it = after.erase(it);
        } else {
            ++it;
        }
    }
    for (const char* name : kShellManaged) {
        if (auto before = env_.get(name)) {
            after[name] = *before;
        } else {
            after.erase(name);
        }
    }

    size_t changed = env_.adopt(after);
    log::modes().format("{} changed {} environment variable(s)", entry.label, changed);
    return Result<int>::ok(ran.value().exit_code);
}

int Engine::apply_middleware(const std::string& hook, const Capture& capture,
                             const std::vector<std::string>& args) {
    set_state(RunState::MiddlewareApplying);

    MiddlewareCall call{hook, capture.exit_code, capture.buffer, with_separator(args)};
    Coordinator coordinator{env_, flow_, out_, err_};

    auto binding = middleware_.find(hook);
    try {
        if (binding == middleware_.end()) {
            return default_middleware(call, coordinator);
        }
        // Copy: middleware may rebind itself
        Middleware fn = binding->second.fn;
        return fn(call, coordinator);
    } catch (const std::exception& e) {
        log::error().format("middleware for hook '{}' failed: {}", hook, e.what());
        return 1;
    } catch (...) {
        log::error().format("middleware for hook '{}' failed: unknown exception", hook);
        return 1;
    }
}

Result<int> Engine::run(const std::string& hook, const std::vector<std::string>& args) {
    auto invoked = invoke(hook, args);
    if (invoked.isErr()) {
        return Result<int>::err(invoked.error());
    }
    const HookOutcome& outcome = invoked.value();
    if (outcome.terminated) {
        return Result<int>::ok(apply_flow(outcome));
    }
    return Result<int>::ok(outcome.status);
}

Result<int> Engine::run_source(const std::string& hook, const std::vector<std::string>& args) {
    auto invoked = invoke(hook, args, ExecMode::Source);
    if (invoked.isErr()) {
        return Result<int>::err(invoked.error());
    }
    if (invoked.value().terminated) {
        return Result<int>::ok(apply_flow(invoked.value()));
    }
    return Result<int>::ok(invoked.value().status);
}

Result<int> Engine::run_script(const std::string& hook, const std::vector<std::string>& args) {
    auto invoked = invoke(hook, args, ExecMode::Exec);
    if (invoked.isErr()) {
        return Result<int>::err(invoked.error());
    }
    if (invoked.value().terminated) {
        return Result<int>::ok(apply_flow(invoked.value()));
    }
    return Result<int>::ok(invoked.value().status);
}

int Engine::apply_flow(const HookOutcome& outcome) {
    if (!outcome.terminated) {
        return outcome.status;
    }
    if (flow_handler_) {
        return flow_handler_(outcome, *this);
    }
    return default_flow(outcome);
}

void Engine::set_flow_handler(FlowHandler handler) {
    flow_handler_ = std::move(handler);
}

int Engine::default_flow(const HookOutcome& outcome) {
    int status = outcome.status;

    if (!outcome.route.empty()) {
        log::modes().format("routing to {}", outcome.route);
        std::vector<std::string> argv{process::resolve_executable(config_.shell, env_),
                                      outcome.route};
        out_.flush();
        err_.flush();
        auto ran = process::run_attached(argv, env_, &signals_);
        if (ran.isErr()) {
            log::error().format("cannot run route '{}': {}", outcome.route, ran.error().message());
            status = 1;
        } else {
            log::modes().format("route {} finished (exit code: {})", outcome.route,
                                ran.value().exit_code);
        }
    }

    out_.flush();
    err_.flush();
    signals_.exit(status);
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<HookInfo> Engine::list() const {
    std::vector<HookInfo> result;
    for (const auto& [name, contexts] : declared_) {
        HookInfo info;
        info.name = name;
        info.contexts = contexts;
        info.inline_function = has_function(config_.function_prefix + name);
        auto reg = registrations_.find(name);
        info.registered = (reg != registrations_.end()) ? reg->second.size() : 0;
        info.scripts = discover_scripts(name).size();
        auto binding = middleware_.find(name);
        info.middleware = (binding != middleware_.end()) ? binding->second.label : "default";
        result.push_back(std::move(info));
    }
    return result;
}

bool Engine::runnable(const std::string& hook) const {
    return has_function(config_.function_prefix + hook) || !discover_scripts(hook).empty();
}

void Engine::reset() {
    declared_.clear();
    registrations_.clear();
    middleware_.clear();
    config_ = loaded_config_;
    source_patterns_ = config_.source_patterns;
    script_patterns_ = config_.script_patterns;
    env_.set_separator(config_.path_separator);
    capture_.reset_sequence();
    flow_.clear();
    state_ = RunState::Pending;
    remove_end_trap();
    log::hooks().line("Engine reset");
}

} // namespace hookline
