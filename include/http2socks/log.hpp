#pragma once

#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string_view>
#include <utility>

namespace http2socks::log {

enum class Level {
    ERROR = 0,
    WARN,
    INFO,
    DEBUG
};

void set_level(Level level);
Level level();

// "error", "warn", "info" or "debug".
std::optional<Level> parse_level(std::string_view name);

inline bool enabled(Level l) {
    return static_cast<int>(l) <= static_cast<int>(level());
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::ERROR)) {
        std::println(stderr, "[error] {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::WARN)) {
        std::println(stderr, "[warn] {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::INFO)) {
        std::println(stderr, "[info] {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::DEBUG)) {
        std::println(stderr, "[debug] {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

} // namespace http2socks::log
