#include "http2socks/socks5_client.hpp"

#include "http2socks/errors.hpp"
#include "http2socks/log.hpp"
#include "http2socks/protocol.hpp"

#include <vector>

namespace http2socks {

namespace {

std::unexpected<std::error_code> transport_error(const std::error_code& cause) {
    log::debug("SOCKS5 transport error: {}", cause.message());
    return std::unexpected(make_error_code(SocksError::TRANSPORT_ERROR));
}

} // namespace

asio::awaitable<std::expected<void, std::error_code>> Socks5Client::connect(asio::ip::tcp::socket& socket,
                                                                            const HostPort& proxy,
                                                                            const std::string& target_host,
                                                                            uint16_t target_port,
                                                                            Duration handshake_timeout) {
    if (handshake_timeout <= Duration::zero()) {
        co_return co_await establish(socket, proxy, target_host, target_port);
    }

    asio::steady_timer deadline(socket.get_executor());
    deadline.expires_after(handshake_timeout);

    auto result = co_await (establish(socket, proxy, target_host, target_port) ||
                            deadline.async_wait(asio::as_tuple(asio::use_awaitable)));
    if (result.index() == 0) {
        co_return std::get<0>(result);
    }
    if (auto [wait_ec] = std::get<1>(result); wait_ec) {
        // The deadline was cancelled along with the handshake, it did not expire.
        co_return transport_error(wait_ec);
    }

    asio::error_code ec;
    socket.close(ec);
    co_return std::unexpected(make_error_code(SocksError::TIMEOUT));
}

asio::awaitable<std::expected<void, std::error_code>> Socks5Client::establish(asio::ip::tcp::socket& socket,
                                                                              const HostPort& proxy,
                                                                              const std::string& target_host,
                                                                              uint16_t target_port) {
    auto opened = co_await open(socket, proxy);
    if (!opened) {
        co_return opened;
    }
    co_return co_await handshake(socket, target_host, target_port);
}

asio::awaitable<std::expected<void, std::error_code>> Socks5Client::open(asio::ip::tcp::socket& socket,
                                                                         const HostPort& proxy) {
    asio::ip::tcp::resolver resolver(socket.get_executor());
    auto [resolve_ec, endpoints] = co_await resolver.async_resolve(proxy.host, std::to_string(proxy.port),
                                                                   asio::as_tuple(asio::use_awaitable));
    if (resolve_ec) {
        co_return transport_error(resolve_ec);
    }

    // A resolve is not interrupted by cancellation. Connecting now would reopen
    // a socket its owner has already closed.
    auto cancel_state = co_await asio::this_coro::cancellation_state;
    if (cancel_state.cancelled() != asio::cancellation_type::none) {
        co_return transport_error(asio::error::operation_aborted);
    }

    auto [connect_ec, endpoint] =
        co_await asio::async_connect(socket, endpoints, asio::as_tuple(asio::use_awaitable));
    if (connect_ec) {
        co_return transport_error(connect_ec);
    }
    co_return std::expected<void, std::error_code>{};
}

asio::awaitable<std::expected<void, std::error_code>> Socks5Client::handshake(asio::ip::tcp::socket& socket,
                                                                              const std::string& target_host,
                                                                              uint16_t target_port) {
    using namespace socks5;

    // Encode first so an unusable target never reaches the proxy.
    auto request = encode_connect_request(target_host, target_port);
    if (!request) {
        co_return std::unexpected(request.error());
    }

    // 1. Send Version + Auth Methods (No Auth)
    auto [greet_ec, greet_n] =
        co_await asio::async_write(socket, asio::buffer(GREETING), asio::as_tuple(asio::use_awaitable));
    if (greet_ec) {
        co_return transport_error(greet_ec);
    }

    // 2. Receive Auth Selection
    uint8_t method_resp[2];
    auto [method_ec, method_n] =
        co_await asio::async_read(socket, asio::buffer(method_resp), asio::as_tuple(asio::use_awaitable));
    if (method_ec) {
        co_return transport_error(method_ec);
    }
    if (method_resp[0] != VERSION) {
        co_return std::unexpected(make_error_code(SocksError::INVALID_REPLY));
    }
    if (static_cast<AuthMethod>(method_resp[1]) != AuthMethod::NO_AUTH) {
        co_return std::unexpected(make_error_code(SocksError::UNSUPPORTED_AUTH_METHOD));
    }

    // 3. Send Request (Connect)
    auto [request_ec, request_n] =
        co_await asio::async_write(socket, asio::buffer(*request), asio::as_tuple(asio::use_awaitable));
    if (request_ec) {
        co_return transport_error(request_ec);
    }

    // 4. Receive Reply: VER, REP, RSV, ATYP
    uint8_t reply_header[4];
    auto [reply_ec, reply_n] =
        co_await asio::async_read(socket, asio::buffer(reply_header), asio::as_tuple(asio::use_awaitable));
    if (reply_ec) {
        co_return transport_error(reply_ec);
    }
    if (reply_header[0] != VERSION) {
        co_return std::unexpected(make_error_code(SocksError::INVALID_REPLY));
    }
    if (auto rep = reply_to_error(reply_header[1])) {
        co_return std::unexpected(rep);
    }

    // Drain BND.ADDR and BND.PORT; the bridge has no use for them.
    std::size_t remaining = fixed_bound_address_length(reply_header[3]);
    if (static_cast<AddressType>(reply_header[3]) == AddressType::DOMAIN_NAME) {
        uint8_t len = 0;
        auto [len_ec, len_n] =
            co_await asio::async_read(socket, asio::buffer(&len, 1), asio::as_tuple(asio::use_awaitable));
        if (len_ec) {
            co_return transport_error(len_ec);
        }
        remaining = static_cast<std::size_t>(len) + 2;
    } else if (remaining == 0) {
        co_return std::unexpected(make_error_code(SocksError::INVALID_REPLY));
    }

    std::vector<uint8_t> bound(remaining);
    auto [bound_ec, bound_n] =
        co_await asio::async_read(socket, asio::buffer(bound), asio::as_tuple(asio::use_awaitable));
    if (bound_ec) {
        co_return transport_error(bound_ec);
    }
    co_return std::expected<void, std::error_code>{};
}

} // namespace http2socks
