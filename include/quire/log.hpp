#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace quire::log {

enum class Level : uint8_t { Debug, Info, Warn, Error, Off };

/** @brief Receives every message at or above the current level. */
using Sink = std::function<void(Level, std::string_view)>;

void set_level(Level level);
Level level();

/**
 * @brief Replaces the output sink.
 *
 * The default sink prints to stderr. Passing an empty function restores it.
 */
void set_sink(Sink sink);

std::optional<Level> parse_level(std::string_view name);
std::string_view level_name(Level level);

void write(Level level, std::string_view message);

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args &&...args) {
    if (level() <= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args &&...args) {
    if (level() <= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args &&...args) {
    if (level() <= Level::Warn)
        write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args &&...args) {
    if (level() <= Level::Error)
        write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace quire::log
