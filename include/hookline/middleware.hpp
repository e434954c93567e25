#pragma once

/**
 * @file middleware.hpp
 * @brief Post-processing of captured implementation output
 *
 * After every exec-mode implementation the engine hands the capture to the
 * hook's middleware. The middleware decides what reaches the coordinator's
 * streams, may mutate the coordinator environment and may request
 * termination, and returns the effective status of the implementation.
 */

#include "hookline/capture.hpp"
#include "hookline/contract.hpp"
#include "hookline/environment.hpp"
#include "hookline/types.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace hookline {

constexpr const char* ARGS_SEPARATOR = "--";

struct MiddlewareCall {
    std::string hook;
    int exit_code = 0;
    const CaptureBuffer& buffer;
    std::vector<std::string> args;  // starts with "--" when built by the engine

    // Arguments the implementation received (everything after "--")
    Result<std::vector<std::string>> implementation_args() const;
};

/**
 * What middleware may touch on the coordinator side.
 */
struct Coordinator {
    Environment& env;
    FlowState& flow;
    std::ostream& out;
    std::ostream& err;
};

using Middleware = std::function<int(const MiddlewareCall& call, Coordinator& coordinator)>;

// Write every captured line to the coordinator stream it came from
void replay(const CaptureBuffer& buffer, Coordinator& coordinator);

/**
 * Replay the capture unchanged and return the implementation's status.
 * Returns 1 when the separator is missing.
 */
int default_middleware(const MiddlewareCall& call, Coordinator& coordinator);

/**
 * Replay like the default middleware and apply `contract:` directives
 * found on stdout. A malformed directive turns a successful status into 1.
 */
int contract_middleware_fn(const MiddlewareCall& call, Coordinator& coordinator);

inline Middleware contract_middleware() { return &contract_middleware_fn; }

} // namespace hookline
