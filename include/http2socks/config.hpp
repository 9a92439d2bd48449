#pragma once

#include "http2socks/address.hpp"
#include "http2socks/http_request.hpp"
#include "http2socks/log.hpp"
#include "http2socks/timeout.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace http2socks {

constexpr uint16_t DEFAULT_LISTEN_PORT = 8118;
constexpr uint16_t DEFAULT_SOCKS_PORT = 9050;
constexpr Duration DEFAULT_HANDSHAKE_TIMEOUT = std::chrono::seconds(30);
constexpr Duration DEFAULT_IDLE_TIMEOUT = std::chrono::seconds(300);
constexpr Duration DEFAULT_DRAIN_TIMEOUT = std::chrono::seconds(10);

struct BridgeConfig {
    HostPort listen{"127.0.0.1", DEFAULT_LISTEN_PORT};
    HostPort socks_proxy{"127.0.0.1", DEFAULT_SOCKS_PORT};

    // Upper bound on the whole life of a single connection.
    std::optional<Duration> connection_timeout;

    // Bounds reading the request head and, separately, the SOCKS5
    // connect + handshake. Zero disables.
    Duration handshake_timeout = DEFAULT_HANDSHAKE_TIMEOUT;

    // Relay direction inactivity limit. Zero disables.
    Duration idle_timeout = DEFAULT_IDLE_TIMEOUT;

    // Grace period for in-flight connections after shutdown.
    Duration drain_timeout = DEFAULT_DRAIN_TIMEOUT;

    std::size_t max_header_size = DEFAULT_MAX_HEADER_SIZE;
};

// "host:port" or "[v6]:port"; the port is required. Port 0 is accepted so a
// listener can ask for an ephemeral port.
std::expected<HostPort, std::string> parse_host_port(std::string_view text);

struct CommandLine {
    BridgeConfig config;
    std::optional<log::Level> log_level; // set by -v / -q
    bool show_help = false;
};

std::string usage();

std::expected<CommandLine, std::string> parse_arguments(int argc, const char* const argv[]);

} // namespace http2socks
