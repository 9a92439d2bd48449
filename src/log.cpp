#include "http2socks/log.hpp"

#include <atomic>

namespace http2socks::log {

namespace {
std::atomic<Level> current_level{Level::INFO};
} // namespace

void set_level(Level l) {
    current_level.store(l, std::memory_order_relaxed);
}

Level level() {
    return current_level.load(std::memory_order_relaxed);
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "error")
        return Level::ERROR;
    if (name == "warn")
        return Level::WARN;
    if (name == "info")
        return Level::INFO;
    if (name == "debug")
        return Level::DEBUG;
    return std::nullopt;
}

} // namespace http2socks::log
