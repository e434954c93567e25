#pragma once

/**
 * @file capture.hpp
 * @brief Output capture harness
 *
 * Runs one implementation (an in-process function or a subprocess) and
 * records every line it writes, tagged with its stream, into a uniquely
 * named buffer. Lines keep their order within a stream; the relative order
 * of stdout and stderr lines is the order in which they reached the
 * coordinator.
 */

#include "hookline/environment.hpp"
#include "hookline/types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace hookline {

class SignalRegistry;

struct CaptureLine {
    StreamTag stream;
    std::string text;
};

struct CaptureBuffer {
    std::string name;  // __<slug>_<seq>
    std::vector<CaptureLine> lines;

    std::vector<std::string> stdout_lines() const;
    std::vector<std::string> stderr_lines() const;
};

struct Capture {
    CaptureBuffer buffer;
    int exit_code = 0;
};

// Buffer name for a hook and sequence number
std::string capture_buffer_name(const std::string& hook, uint64_t seq);

class CaptureHarness {
public:
    // Signals that arrive while a subprocess runs are forwarded to it
    explicit CaptureHarness(SignalRegistry* signals = nullptr) : signals_(signals) {}

    /**
     * Run an in-process function with stdout/stderr redirected into the
     * buffer. An escaping exception becomes a stderr line and status 1.
     */
    Result<Capture> run_function(const std::string& hook, const std::function<int()>& fn);

    /**
     * Run argv[0] as a subprocess with `env` as its environment.
     */
    Result<Capture> run_process(const std::string& hook,
                                const std::vector<std::string>& argv,
                                const Environment& env);

    uint64_t sequence() const { return seq_; }
    void reset_sequence() { seq_ = 0; }

private:
    std::string next_name(const std::string& hook);

    SignalRegistry* signals_;
    uint64_t seq_ = 0;
};

} // namespace hookline
