#include "hookline/environment.hpp"

#include <algorithm>

extern "C" char** environ;

namespace hookline {

std::string apply_env_op(EnvOp op,
                         const std::optional<std::string>& current,
                         const std::string& value,
                         const std::string& separator) {
    bool has_current = current.has_value() && !current->empty();

    switch (op) {
        case EnvOp::Set:
            return value;

        case EnvOp::Append:
            if (has_current) {
                return *current + separator + value;
            }
            return value;

        case EnvOp::Prepend:
            if (has_current) {
                return value + separator + *current;
            }
            return value;

        case EnvOp::Remove: {
            if (!has_current) {
                return "";
            }
            std::string filtered;
            bool first = true;
            size_t start = 0;
            while (start <= current->size()) {
                size_t end = separator.empty() ? std::string::npos
                                               : current->find(separator, start);
                if (end == std::string::npos) end = current->size();
                std::string part = current->substr(start, end - start);
                if (part != value) {
                    if (!first) filtered += separator;
                    filtered += part;
                    first = false;
                }
                start = end + separator.size();
                if (end == current->size()) break;
            }
            return filtered;
        }
    }

    return value;
}

Environment Environment::from_process() {
    std::unordered_map<std::string, std::string> env;
    for (char** ep = environ; ep && *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    return Environment(std::move(env));
}

std::optional<std::string> Environment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

bool Environment::contains(const std::string& name) const {
    return vars_.count(name) > 0;
}

void Environment::set(const std::string& name, const std::string& value) {
    vars_[name] = value;
    notify(name);
}

void Environment::unset(const std::string& name) {
    if (vars_.erase(name) > 0) {
        notify(name);
    }
}

void Environment::apply(const std::string& name, EnvOp op, const std::string& value) {
    set(name, apply_env_op(op, get(name), value, separator_));
}

std::vector<std::string> Environment::to_envp() const {
    std::vector<std::string> entries;
    entries.reserve(vars_.size());
    for (const auto& [key, value] : vars_) {
        entries.push_back(key + "=" + value);
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

size_t Environment::adopt(const std::unordered_map<std::string, std::string>& after) {
    std::vector<std::string> changed;

    for (const auto& [key, value] : after) {
        auto it = vars_.find(key);
        if (it == vars_.end() || it->second != value) {
            changed.push_back(key);
        }
    }
    for (const auto& [key, value] : vars_) {
        if (after.count(key) == 0) {
            changed.push_back(key);
        }
    }

    vars_ = after;
    for (const auto& name : changed) {
        notify(name);
    }
    return changed.size();
}

void Environment::notify(const std::string& name) const {
    if (listener_) {
        listener_(name);
    }
}

} // namespace hookline
