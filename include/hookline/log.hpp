#pragma once

/**
 * @file log.hpp
 * @brief Tag-filtered diagnostic channels on top of spdlog
 *
 * Every tag ("hooks", "trap", "modes", ...) owns one spdlog logger that
 * writes `[tag] message` lines to stderr. A channel is silent unless its
 * tag is enabled, which follows the DEBUG convention:
 *
 *   DEBUG=hooks,trap     enable two tags
 *   DEBUG=*              enable everything
 *   DEBUG=*,-trap        everything except trap
 *
 * The `error` and `warn` tags are enabled unless explicitly disabled.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace hookline {
namespace log {

class Channel {
public:
    Channel(std::string tag, std::shared_ptr<spdlog::logger> logger);

    const std::string& tag() const { return tag_; }
    bool enabled() const { return enabled_; }
    void set_enabled(bool on);

    // Emit one line
    void line(const std::string& message) const;

    // Emit one formatted line
    template<typename... Args>
    void format(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
        if (!enabled_) return;
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    // Emit every line of a block of text as its own log line
    void pipe(const std::string& text) const;

private:
    std::string tag_;
    std::shared_ptr<spdlog::logger> logger_;
    bool enabled_ = false;
};

// Get (or create on first use) the channel for a tag
Channel& channel(const std::string& tag);

// Re-evaluate every channel against a DEBUG-style filter
void configure(const std::string& debug_filter);

// Current DEBUG-style filter
const std::string& current_filter();

// Force a tag on or off regardless of the filter
void enable(const std::string& tag, bool on = true);

bool is_enabled(const std::string& tag);

// Whether a DEBUG-style filter enables the tag
bool filter_enables(const std::string& debug_filter, const std::string& tag);

// Known channel tags, sorted
std::vector<std::string> tags();

// Shorthands for the always-on channels
inline Channel& hooks() { return channel("hooks"); }
inline Channel& trap() { return channel("trap"); }
inline Channel& modes() { return channel("modes"); }
inline Channel& capture() { return channel("capture"); }
inline Channel& error() { return channel("error"); }
inline Channel& warn() { return channel("warn"); }

} // namespace log
} // namespace hookline
