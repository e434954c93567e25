#pragma once

/**
 * @file signals.hpp
 * @brief Ordered, snapshot-able signal handler registry
 *
 * Each signal owns a list of named handlers plus the disposition that was
 * installed before the registry took the signal over ("legacy"). When a
 * signal fires, the legacy handler runs first, then the registered
 * handlers, most recently registered first.
 *
 * The OS-level handler only marks the signal as pending; handlers run at
 * safe points through dispatch_pending(). EXIT is a pseudo-signal that
 * fires when the process leaves through exit().
 *
 * INT, TERM, HUP and QUIT interrupt blocking calls (no SA_RESTART). When
 * one arrives twice before it was dispatched and nothing but the default
 * action was installed before, the default action is taken at once.
 *
 * @example
 * ```cpp
 * hookline::SignalRegistry signals;
 * signals.on("EXIT", "cleanup", [](int) { remove_temp_files(); return 0; });
 * signals.push();
 * signals.on("INT", "abort-step", on_abort);
 * // ...
 * signals.pop();  // abort-step is gone again
 * ```
 */

#include "hookline/types.hpp"

#include <csignal>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hookline {

// Signal number used for the EXIT pseudo-signal
constexpr int SIGNAL_EXIT = 0;

// Returns a status; non-zero is reported as a handler failure
using SignalCallback = std::function<int(int signo)>;

struct SignalHandler {
    std::string name;
    SignalCallback callback;
};

struct SignalInfo {
    std::string signal;
    std::vector<std::string> handlers;  // registration order
    bool has_legacy = false;
};

// Read end of the pipe the OS-level handler writes to when a signal arrives
int signal_wakeup_fd();

// Discard queued wake-up bytes
void drain_signal_wakeup_fd();

// Normalise "SIGINT", "int", "2" to "INT"; "0" to "EXIT"
std::optional<std::string> normalize_signal(const std::string& input);

// Signal name to number (EXIT is SIGNAL_EXIT)
std::optional<int> signal_number(const std::string& name);

class SignalRegistry {
public:
    SignalRegistry();
    ~SignalRegistry();

    SignalRegistry(const SignalRegistry&) = delete;
    SignalRegistry& operator=(const SignalRegistry&) = delete;

    // Register a handler; duplicates by name are ignored unless allowed
    Result<void> on(const std::string& signal, const std::string& name,
                    SignalCallback callback, bool allow_duplicates = false);

    // Remove every handler with this name; no-op when absent
    Result<void> off(const std::string& signal, const std::string& name);

    // Run legacy handler then handlers in LIFO order. Never throws.
    void dispatch(const std::string& signal) noexcept;

    // Dispatch every signal that arrived since the last call
    void dispatch_pending() noexcept;

    // Signals that arrived but have not been dispatched yet
    std::vector<int> pending() const;

    // Take over INT, TERM, HUP and QUIT so they exit through EXIT handlers
    void guard_termination();

    // Snapshot handler lists (all active signals when empty)
    void push(const std::vector<std::string>& signals = {});

    // Restore the top snapshot (only the listed signals when not empty)
    Result<void> pop(const std::vector<std::string>& signals = {});

    size_t level() const { return stack_.size(); }

    // Drop handlers but keep the dispatcher installed
    Result<void> clear(const std::string& signal);

    // Reinstate the legacy disposition and forget the signal
    Result<void> restore(const std::string& signal);

    // Diagnostic view (all active signals when empty)
    std::vector<SignalInfo> list(const std::vector<std::string>& signals = {}) const;

    bool active(const std::string& signal) const;

    bool exiting() const { return exiting_; }

    void set_exit_status(int status) { exit_status_ = status; }
    int exit_status() const { return exit_status_; }

    // Record the status, then leave the process; EXIT handlers run.
    // Coordinators must leave through here (not by returning from main)
    // for the EXIT handlers to see the status.
    [[noreturn]] void exit(int status);

private:
    struct SignalRecord {
        int signo = 0;
        std::vector<SignalHandler> handlers;
        bool has_legacy = false;
        struct sigaction legacy {};
    };

    using Snapshot = std::map<std::string, std::vector<SignalHandler>>;

    SignalRecord& initialize(const std::string& signal, int signo);
    void run_legacy(const SignalRecord& record) noexcept;
    void release(const std::string& signal, SignalRecord& record);
    void terminate_if_fatal(const std::string& signal, int signo);

    static void exit_trampoline();

    std::map<std::string, SignalRecord> records_;
    std::vector<Snapshot> stack_;
    int exit_status_ = 0;
    bool exiting_ = false;
};

} // namespace hookline
