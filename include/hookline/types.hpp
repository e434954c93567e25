#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hookline {

// ============================================================================
// Execution Mode
// ============================================================================

enum class ExecMode {
    Exec,    // captured, isolated from the live environment
    Source   // direct access to coordinator state, no capture, no middleware
};

inline const char* exec_mode_to_string(ExecMode m) {
    switch (m) {
        case ExecMode::Exec: return "exec";
        case ExecMode::Source: return "source";
        default: return "exec";
    }
}

std::optional<ExecMode> parse_exec_mode(const std::string& s);

// ============================================================================
// Implementation Kind
// ============================================================================

enum class ImplKind {
    Inline,
    Registered,
    Script
};

inline const char* impl_kind_to_string(ImplKind k) {
    switch (k) {
        case ImplKind::Inline: return "inline";
        case ImplKind::Registered: return "registered";
        case ImplKind::Script: return "script";
        default: return "inline";
    }
}

// ============================================================================
// Stream Tag
// ============================================================================

enum class StreamTag {
    Stdout,
    Stderr
};

inline const char* stream_tag_to_string(StreamTag t) {
    switch (t) {
        case StreamTag::Stdout: return "stdout";
        case StreamTag::Stderr: return "stderr";
        default: return "stdout";
    }
}

// ============================================================================
// Run State (one invocation of a hook)
// ============================================================================

enum class RunState {
    Pending,
    RunningInline,
    RunningMergedSequence,
    Capturing,
    MiddlewareApplying,
    FlowCheck,
    Done,
    Terminated
};

inline const char* run_state_to_string(RunState s) {
    switch (s) {
        case RunState::Pending: return "PENDING";
        case RunState::RunningInline: return "RUNNING_INLINE";
        case RunState::RunningMergedSequence: return "RUNNING_MERGED_SEQUENCE";
        case RunState::Capturing: return "CAPTURING";
        case RunState::MiddlewareApplying: return "MIDDLEWARE_APPLYING";
        case RunState::FlowCheck: return "FLOW_CHECK";
        case RunState::Done: return "DONE";
        case RunState::Terminated: return "TERMINATED";
        default: return "PENDING";
    }
}

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorCode {
    // Declaration / registration
    INVALID_HOOK_NAME,
    INVALID_ARGUMENT,
    FUNCTION_NOT_FOUND,
    DUPLICATE_REGISTRATION,
    NOT_FOUND,

    // Capture harness
    CAPTURE_FAILED,

    // Middleware contract
    MISSING_SEPARATOR,
    INVALID_DIRECTIVE,

    // Signal registry
    INVALID_SIGNAL,
    STACK_EMPTY,

    // Configuration / system
    CONFIG_ERROR,
    IO_ERROR,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::INVALID_HOOK_NAME: return "INVALID_HOOK_NAME";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::FUNCTION_NOT_FOUND: return "FUNCTION_NOT_FOUND";
        case ErrorCode::DUPLICATE_REGISTRATION: return "DUPLICATE_REGISTRATION";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::CAPTURE_FAILED: return "CAPTURE_FAILED";
        case ErrorCode::MISSING_SEPARATOR: return "MISSING_SEPARATOR";
        case ErrorCode::INVALID_DIRECTIVE: return "INVALID_DIRECTIVE";
        case ErrorCode::INVALID_SIGNAL: return "INVALID_SIGNAL";
        case ErrorCode::STACK_EMPTY: return "STACK_EMPTY";
        case ErrorCode::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

// ============================================================================
// Naming Rules
// ============================================================================

// Hook names: alphanumeric, underscore and dash only
bool is_valid_hook_name(const std::string& name);

// Environment variable names: ^[A-Za-z_][A-Za-z0-9_]*$
bool is_valid_env_name(const std::string& name);

// Filesystem-safe slug: runs of non-alphanumerics become `sep`, lowercase,
// trimmed, at most max_len characters
std::string to_slug(const std::string& input, char sep = '_', size_t max_len = 40);

} // namespace hookline
