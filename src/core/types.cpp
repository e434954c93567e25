#include "hookline/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace hookline {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ExecMode> parse_exec_mode(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "exec" || lower == "script") return ExecMode::Exec;
    if (lower == "source") return ExecMode::Source;
    return std::nullopt;
}

bool is_valid_hook_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

bool is_valid_env_name(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && name[0] != '_') return false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string to_slug(const std::string& input, char sep, size_t max_len) {
    std::string slug;
    slug.reserve(input.size());
    bool pending_sep = false;

    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_sep && !slug.empty()) {
                slug += sep;
            }
            pending_sep = false;
            slug += static_cast<char>(std::tolower(uc));
        } else {
            pending_sep = true;
        }
    }

    if (slug.size() > max_len) {
        slug.resize(max_len);
        while (!slug.empty() && slug.back() == sep) {
            slug.pop_back();
        }
    }

    if (slug.empty()) {
        slug = "hook";
    }
    return slug;
}

} // namespace hookline
