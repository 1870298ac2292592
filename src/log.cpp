#include "quire/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <print>

namespace quire::log {

namespace {

std::atomic<Level> current_level{Level::Info};
std::mutex sink_mtx;
Sink current_sink;

void print_to_stderr(Level lvl, std::string_view message) {
    switch (lvl) {
    case Level::Debug:
        std::println(stderr, "debug: {}", message);
        break;
    case Level::Info:
        std::println(stderr, "{}", message);
        break;
    case Level::Warn:
        std::println(stderr, "\033[1;33mwarning:\033[0m {}", message);
        break;
    case Level::Error:
        std::println(stderr, "\033[1;31merror:\033[0m {}", message);
        break;
    case Level::Off:
        break;
    }
}

} // namespace

void set_level(Level lvl) {
    current_level.store(lvl, std::memory_order_relaxed);
}

Level level() {
    return current_level.load(std::memory_order_relaxed);
}

void set_sink(Sink sink) {
    std::lock_guard lock(sink_mtx);
    current_sink = std::move(sink);
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "debug")
        return Level::Debug;
    if (name == "info")
        return Level::Info;
    if (name == "warn" || name == "warning")
        return Level::Warn;
    if (name == "error")
        return Level::Error;
    if (name == "off" || name == "quiet")
        return Level::Off;
    return std::nullopt;
}

std::string_view level_name(Level lvl) {
    switch (lvl) {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    case Level::Off:
        return "off";
    }
    return "unknown";
}

void write(Level lvl, std::string_view message) {
    if (lvl == Level::Off || lvl < level())
        return;
    // Workers log concurrently; one line at a time.
    std::lock_guard lock(sink_mtx);
    if (current_sink) {
        current_sink(lvl, message);
        return;
    }
    print_to_stderr(lvl, message);
}

} // namespace quire::log
