#include "hookline/middleware.hpp"
#include "hookline/log.hpp"

namespace hookline {

Result<std::vector<std::string>> MiddlewareCall::implementation_args() const {
    if (args.empty() || args.front() != ARGS_SEPARATOR) {
        return Result<std::vector<std::string>>::err(
            Error(ErrorCode::MISSING_SEPARATOR, "hooks middleware expects '--' separator"));
    }
    return Result<std::vector<std::string>>::ok(
        std::vector<std::string>(args.begin() + 1, args.end()));
}

void replay(const CaptureBuffer& buffer, Coordinator& coordinator) {
    for (const auto& line : buffer.lines) {
        std::ostream& sink = (line.stream == StreamTag::Stdout) ? coordinator.out : coordinator.err;
        sink << line.text << '\n';
    }
    coordinator.out.flush();
    coordinator.err.flush();
}

int default_middleware(const MiddlewareCall& call, Coordinator& coordinator) {
    auto args = call.implementation_args();
    if (args.isErr()) {
        log::error().line(args.error().message());
        return 1;
    }

    replay(call.buffer, coordinator);
    return call.exit_code;
}

int contract_middleware_fn(const MiddlewareCall& call, Coordinator& coordinator) {
    log::hooks().format("middleware is processing hook: '{}'", call.hook);
    log::hooks().format("total captured lines for '{}': {}", call.hook, call.buffer.lines.size());

    bool rejected = false;

    for (const auto& line : call.buffer.lines) {
        if (line.stream == StreamTag::Stderr) {
            coordinator.err << line.text << '\n';
            continue;
        }
        coordinator.out << line.text << '\n';

        // Directives are only honoured on stdout
        if (!is_contract_line(line.text)) continue;

        auto directive = parse_directive(line.text);
        if (directive.isErr()) {
            log::error().line(directive.error().message());
            rejected = true;
            continue;
        }
        apply_directive(directive.value(), coordinator.env, coordinator.flow);
    }
    coordinator.out.flush();
    coordinator.err.flush();

    if (rejected && call.exit_code == 0) {
        return 1;
    }
    return call.exit_code;
}

} // namespace hookline
