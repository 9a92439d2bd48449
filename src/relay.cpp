#include "http2socks/relay.hpp"

#include "http2socks/errors.hpp"

#include <array>

namespace http2socks {

namespace {

struct Direction {
    uint64_t bytes = 0;
    std::error_code error;
    std::error_code cause;
};

asio::awaitable<void> pump(asio::ip::tcp::socket& from, asio::ip::tcp::socket& to, Direction& direction,
                           Duration idle_timeout) {
    std::array<uint8_t, RELAY_CHUNK_SIZE> buffer;
    while (true) {
        auto read_res = co_await with_timeout<std::size_t>(
            from.async_read_some(asio::buffer(buffer), asio::as_tuple(asio::use_awaitable)), idle_timeout);
        if (!read_res) {
            if (read_res.error() != asio::error::eof) {
                direction.error = make_error_code(RelayError::READ_FAILED);
                direction.cause = read_res.error();
            }
            co_return;
        }

        auto write_res = co_await with_timeout<std::size_t>(
            asio::async_write(to, asio::buffer(buffer.data(), *read_res), asio::as_tuple(asio::use_awaitable)),
            idle_timeout);
        if (!write_res) {
            direction.error = make_error_code(RelayError::WRITE_FAILED);
            direction.cause = write_res.error();
            co_return;
        }
        direction.bytes += *write_res;
    }
}

void close_socket(asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

} // namespace

asio::awaitable<RelayResult> relay(asio::ip::tcp::socket& client, asio::ip::tcp::socket& upstream,
                                   Duration idle_timeout) {
    Direction client_to_upstream;
    Direction upstream_to_client;

    // Whichever direction finishes first cancels the other.
    auto finished = co_await (pump(client, upstream, client_to_upstream, idle_timeout) ||
                              pump(upstream, client, upstream_to_client, idle_timeout));

    close_socket(client);
    close_socket(upstream);

    const Direction& first = finished.index() == 0 ? client_to_upstream : upstream_to_client;

    RelayResult result;
    result.client_to_upstream = client_to_upstream.bytes;
    result.upstream_to_client = upstream_to_client.bytes;
    result.error = first.error;
    result.cause = first.cause;
    co_return result;
}

} // namespace http2socks
