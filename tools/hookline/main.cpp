/**
 * hookline CLI - Entry Point
 *
 * Run, inspect and talk to hooks from the command line.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace hookline::cli::commands {
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_emit(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace hookline::cli;

    CLI::App app{"hookline - hook execution engine"};
    app.set_version_flag("-V,--version", HOOKLINE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (hookline.config.v1)");
    app.add_option("--hooks-dir", opts.hooks_dir, "Directory with hook scripts");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Enable all log tags");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* run_cmd = app.add_subcommand("run", "Run a hook and exit with its status");
    commands::setup_run(run_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List declared hooks and their implementations");
    commands::setup_list(list_cmd, opts);

    auto* emit_cmd = app.add_subcommand("emit", "Print a contract directive");
    commands::setup_emit(emit_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
