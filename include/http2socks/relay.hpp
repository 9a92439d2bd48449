#pragma once

#include "asio_config.hpp"
#include "http2socks/timeout.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace http2socks {

constexpr std::size_t RELAY_CHUNK_SIZE = 16 * 1024;

struct RelayResult {
    uint64_t client_to_upstream = 0;
    uint64_t upstream_to_client = 0;
    std::error_code error; // RelayError, empty when the session ended with EOF
    std::error_code cause; // transport error behind `error`
};

// Copies bytes in both directions until either side reaches EOF or fails,
// then cancels the other direction and closes both sockets. A positive
// idle_timeout ends a direction whose read or write makes no progress for
// that long.
asio::awaitable<RelayResult> relay(asio::ip::tcp::socket& client, asio::ip::tcp::socket& upstream,
                                   Duration idle_timeout = Duration::zero());

} // namespace http2socks
