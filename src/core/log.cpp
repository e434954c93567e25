#include "hookline/log.hpp"

#include <spdlog/sinks/stdout_sinks.h>

#include <map>
#include <mutex>
#include <sstream>

namespace hookline {
namespace log {

namespace {

struct ChannelTable {
    std::mutex mutex;
    std::map<std::string, std::unique_ptr<Channel>> channels;
    std::map<std::string, bool> forced;
    std::string filter;
    std::shared_ptr<spdlog::sinks::stderr_sink_mt> sink =
        std::make_shared<spdlog::sinks::stderr_sink_mt>();
};

ChannelTable& table() {
    static ChannelTable instance;
    return instance;
}

std::vector<std::string> split_filter(const std::string& filter) {
    std::vector<std::string> parts;
    std::stringstream ss(filter);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start == std::string::npos) continue;
        parts.push_back(item.substr(start, end - start + 1));
    }
    return parts;
}

bool evaluate(const ChannelTable& t, const std::string& tag) {
    auto forced = t.forced.find(tag);
    if (forced != t.forced.end()) {
        return forced->second;
    }
    return filter_enables(t.filter, tag);
}

} // namespace

Channel::Channel(std::string tag, std::shared_ptr<spdlog::logger> logger)
    : tag_(std::move(tag)), logger_(std::move(logger)) {}

void Channel::set_enabled(bool on) {
    enabled_ = on;
    logger_->set_level(on ? spdlog::level::trace : spdlog::level::off);
}

void Channel::line(const std::string& message) const {
    if (!enabled_) return;
    logger_->info(message);
}

void Channel::pipe(const std::string& text) const {
    if (!enabled_) return;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item)) {
        logger_->info(item);
    }
}

bool filter_enables(const std::string& debug_filter, const std::string& tag) {
    bool on = (tag == "error" || tag == "warn");
    for (const auto& part : split_filter(debug_filter)) {
        if (part == "*" || part == tag) {
            on = true;
        }
    }
    // Negations win regardless of position
    for (const auto& part : split_filter(debug_filter)) {
        if (part == "-" + tag) {
            on = false;
        }
    }
    return on;
}

Channel& channel(const std::string& tag) {
    auto& t = table();
    std::lock_guard<std::mutex> lock(t.mutex);

    auto it = t.channels.find(tag);
    if (it != t.channels.end()) {
        return *it->second;
    }

    // spdlog keeps its own registry; reuse a logger another module created
    auto logger = spdlog::get(tag);
    if (!logger) {
        logger = std::make_shared<spdlog::logger>(tag, t.sink);
        logger->set_pattern("[%n] %v");
        logger->flush_on(spdlog::level::trace);
        spdlog::register_logger(logger);
    }

    auto created = std::make_unique<Channel>(tag, logger);
    created->set_enabled(evaluate(t, tag));
    auto& ref = *created;
    t.channels.emplace(tag, std::move(created));
    return ref;
}

void configure(const std::string& debug_filter) {
    auto& t = table();
    std::lock_guard<std::mutex> lock(t.mutex);
    t.filter = debug_filter;
    t.forced.clear();
    for (auto& [tag, ch] : t.channels) {
        ch->set_enabled(evaluate(t, tag));
    }
}

const std::string& current_filter() {
    return table().filter;
}

void enable(const std::string& tag, bool on) {
    channel(tag);
    auto& t = table();
    std::lock_guard<std::mutex> lock(t.mutex);
    t.forced[tag] = on;
    t.channels[tag]->set_enabled(on);
}

bool is_enabled(const std::string& tag) {
    return channel(tag).enabled();
}

std::vector<std::string> tags() {
    auto& t = table();
    std::lock_guard<std::mutex> lock(t.mutex);
    std::vector<std::string> result;
    for (const auto& [tag, ch] : t.channels) {
        result.push_back(tag);
    }
    return result;
}

} // namespace log
} // namespace hookline
