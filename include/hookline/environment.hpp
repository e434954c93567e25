#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hookline {

// ============================================================================
// Environment Operations
// ============================================================================

/**
 * Environment variable operation type.
 *
 * - Set: Replace or set a value
 * - Append: Add to the end with separator
 * - Prepend: Add to the front with separator
 * - Remove: Drop every separator-delimited segment equal to the value
 */
enum class EnvOp {
    Set,
    Append,
    Prepend,
    Remove
};

inline const char* env_op_to_string(EnvOp op) {
    switch (op) {
        case EnvOp::Set: return "set";
        case EnvOp::Append: return "append";
        case EnvOp::Prepend: return "prepend";
        case EnvOp::Remove: return "remove";
    }
    return "set";
}

/**
 * Apply an environment operation to the current value of a variable.
 *
 * An absent or empty current value makes append/prepend behave like set
 * and makes remove yield an empty string.
 */
std::string apply_env_op(EnvOp op,
                         const std::optional<std::string>& current,
                         const std::string& value,
                         const std::string& separator = ":");

// ============================================================================
// Coordinator Environment
// ============================================================================

/**
 * The coordinator's live environment.
 *
 * Subprocess implementations receive it as their envp; in-process
 * implementations in exec mode only get a const view. Mutation is
 * reserved for middleware and source-mode implementations.
 */
class Environment {
public:
    using Listener = std::function<void(const std::string& name)>;

    Environment() = default;
    explicit Environment(std::unordered_map<std::string, std::string> vars)
        : vars_(std::move(vars)) {}

    // Snapshot of the current process environment
    static Environment from_process();

    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    void set(const std::string& name, const std::string& value);
    void unset(const std::string& name);

    // Apply an operation using the configured separator
    void apply(const std::string& name, EnvOp op, const std::string& value);

    const std::string& separator() const { return separator_; }
    void set_separator(std::string separator) { separator_ = std::move(separator); }

    const std::unordered_map<std::string, std::string>& vars() const { return vars_; }

    // "NAME=VALUE" entries in lexicographic order, for execve
    std::vector<std::string> to_envp() const;

    // Replace contents with `after`, reporting each changed name
    // Returns the number of variables that changed
    size_t adopt(const std::unordered_map<std::string, std::string>& after);

    // Called with the variable name after every mutation
    void set_listener(Listener listener) { listener_ = std::move(listener); }

private:
    void notify(const std::string& name) const;

    std::unordered_map<std::string, std::string> vars_;
    std::string separator_ = ":";
    Listener listener_;
};

} // namespace hookline
