/**
 * hookline CLI - emit command
 *
 * Print a validated contract directive, for hook scripts that would
 * rather not hand-write the wire format.
 */

#include "../common.hpp"
#include <hookline/contract.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace hookline::cli::commands {

namespace {

struct EmitOptions {
    std::string kind;   // env | route | exit
    std::string value;
};

int cmd_emit(const GlobalOptions& opts, const EmitOptions& emit_opts) {
    std::string line = std::string(CONTRACT_PREFIX) + emit_opts.kind + ":" + emit_opts.value;

    auto directive = parse_directive(line);
    if (directive.isErr()) {
        print_error(directive.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["kind"] = directive_kind_to_string(directive.value().kind);
        j["line"] = format_directive(directive.value());
        output_json(j);
        return 0;
    }

    std::cout << format_directive(directive.value()) << std::endl;
    return 0;
}

} // anonymous namespace

void setup_emit(CLI::App* app, GlobalOptions& opts) {
    static EmitOptions emit_opts;

    app->add_option("kind", emit_opts.kind, "Directive kind")
        ->required()
        ->check(CLI::IsMember({"env", "route", "exit"}));
    app->add_option("value", emit_opts.value, "NAME=VALUE (also +=, ^=, -=), PATH or CODE")
        ->required();

    app->callback([&opts]() {
        std::exit(cmd_emit(opts, emit_opts));
    });
}

} // namespace hookline::cli::commands
