/**
 * hookline CLI - run command
 *
 * Bootstrap an engine, run one hook and leave with its status. The end
 * hook runs on the way out.
 */

#include "../common.hpp"
#include <hookline/engine.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace hookline::cli::commands {

namespace {

struct RunOptions {
    std::string hook;
    std::vector<std::string> args;
    std::string mode;                  // exec | source, empty for config default
    bool contract = false;
    std::vector<std::string> declare;
};

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    init_warning_collector(opts.json, opts.quiet);

    Environment env = Environment::from_process();
    configure_logging(opts, env);

    auto config = load_config(opts, env);
    if (!config) {
        return 1;
    }

    std::optional<ExecMode> mode;
    if (!run_opts.mode.empty()) {
        mode = parse_exec_mode(run_opts.mode);
        if (!mode) {
            print_error("invalid mode '" + run_opts.mode + "' (expected exec or source)", opts.json);
            return 1;
        }
    }

    SignalRegistry signals;
    Engine engine(*config, env, signals);

    auto booted = engine.bootstrap();
    if (booted.isErr()) {
        print_error(booted.error().toString(), opts.json);
        signals.exit(1);
    }

    std::vector<std::string> hooks = config->hooks;
    hooks.insert(hooks.end(), run_opts.declare.begin(), run_opts.declare.end());
    hooks.push_back(run_opts.hook);

    auto declared = engine.declare(hooks, "hookline");
    if (declared.isErr()) {
        print_error(declared.error().toString(), opts.json);
        signals.exit(1);
    }

    if (run_opts.contract) {
        auto bound = engine.set_middleware(run_opts.hook, "contract", contract_middleware());
        if (bound.isErr()) {
            print_error(bound.error().toString(), opts.json);
            signals.exit(1);
        }
    }

    Result<int> ran = Result<int>::ok(0);
    if (!mode) {
        ran = engine.run(run_opts.hook, run_opts.args);
    } else if (*mode == ExecMode::Source) {
        ran = engine.run_source(run_opts.hook, run_opts.args);
    } else {
        ran = engine.run_script(run_opts.hook, run_opts.args);
    }

    if (ran.isErr()) {
        print_error(ran.error().toString(), opts.json);
        signals.exit(1);
    }

    // Leave through the registry so the end hook sees the status
    signals.exit(ran.value());
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunOptions run_opts;

    app->add_option("hook", run_opts.hook, "Hook to run")->required();
    app->add_option("args", run_opts.args, "Arguments passed to every implementation");
    app->add_option("--mode", run_opts.mode, "Script mode for this call (exec|source)")
        ->check(CLI::IsMember({"exec", "source", "script"}));
    app->add_flag("--contract", run_opts.contract, "Apply contract: directives from the hook");
    app->add_option("--declare", run_opts.declare, "Additional hooks to declare");

    // Allow -- to separate hookline args from hook args
    app->allow_extras();

    app->callback([&opts]() {
        std::exit(cmd_run(opts, run_opts));
    });
}

} // namespace hookline::cli::commands
