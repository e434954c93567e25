/**
 * hookline CLI - list command
 *
 * Show declared hooks and what implements them.
 */

#include "../common.hpp"
#include <hookline/engine.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace hookline::cli::commands {

namespace {

struct ListOptions {
    std::vector<std::string> declare;
};

std::string describe(const HookInfo& info) {
    std::vector<std::string> parts;
    if (info.inline_function) {
        parts.push_back("function");
    }
    if (info.registered > 0) {
        parts.push_back(std::to_string(info.registered) + " registered");
    }
    if (info.scripts > 0) {
        parts.push_back(std::to_string(info.scripts) + " script(s)");
    }

    if (parts.empty()) {
        return "not implemented";
    }
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) joined += ", ";
        joined += part;
    }
    return "implemented (" + joined + ")";
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    init_warning_collector(opts.json, opts.quiet);

    Environment env = Environment::from_process();
    configure_logging(opts, env);

    auto config = load_config(opts, env);
    if (!config) {
        return 1;
    }

    SignalRegistry signals;
    Engine engine(*config, env, signals);

    std::vector<std::string> hooks = config->hooks;
    hooks.insert(hooks.end(), list_opts.declare.begin(), list_opts.declare.end());
    auto declared = engine.declare(hooks, "hookline");
    if (declared.isErr()) {
        print_error(declared.error().toString(), opts.json);
        return 1;
    }

    auto infos = engine.list();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["hooks_dir"] = config->hooks_dir;
        j["exec_mode"] = exec_mode_to_string(config->exec_mode);
        j["hooks"] = nlohmann::json::array();
        for (const auto& info : infos) {
            nlohmann::json hook;
            hook["name"] = info.name;
            hook["contexts"] = info.contexts;
            hook["inline"] = info.inline_function;
            hook["registered"] = info.registered;
            hook["scripts"] = info.scripts;
            hook["middleware"] = info.middleware;
            hook["runnable"] = engine.runnable(info.name);
            j["hooks"].push_back(hook);
        }
        output_json(j);
        return 0;
    }

    if (infos.empty()) {
        std::cout << "No hooks defined" << std::endl;
        return 0;
    }

    std::cout << "Defined hooks:" << std::endl;
    for (const auto& info : infos) {
        std::cout << "  - " << info.name << ": " << describe(info) << std::endl;
        if (info.contexts.size() > 1) {
            std::cout << "      defined in " << info.contexts.size() << " contexts" << std::endl;
        }
        if (opts.verbose) {
            for (const auto& script : engine.discover_scripts(info.name)) {
                std::cout << "      " << script.file_name << " ("
                          << exec_mode_to_string(engine.exec_mode_for(script.file_name)) << ")"
                          << std::endl;
            }
        }
    }

    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("--declare", list_opts.declare, "Additional hooks to declare");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace hookline::cli::commands
