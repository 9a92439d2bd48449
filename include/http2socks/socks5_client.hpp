#pragma once

#include "asio_config.hpp"
#include "http2socks/address.hpp"
#include "http2socks/timeout.hpp"

#include <expected>
#include <string>
#include <system_error>

namespace http2socks {

class Socks5Client {
  public:
    // Connects `socket` to the proxy, performs the no-auth handshake and asks
    // for a CONNECT to target_host:target_port. On success the socket is the
    // established tunnel. Errors are SocksError codes. A positive
    // handshake_timeout bounds resolve + connect + handshake as a whole; on
    // expiry the socket is closed and SocksError::TIMEOUT is returned.
    static asio::awaitable<std::expected<void, std::error_code>> connect(asio::ip::tcp::socket& socket,
                                                                         const HostPort& proxy,
                                                                         const std::string& target_host,
                                                                         uint16_t target_port,
                                                                         Duration handshake_timeout);

    // Assumes socket is already connected to the proxy.
    static asio::awaitable<std::expected<void, std::error_code>> handshake(asio::ip::tcp::socket& socket,
                                                                           const std::string& target_host,
                                                                           uint16_t target_port);

  private:
    static asio::awaitable<std::expected<void, std::error_code>> establish(asio::ip::tcp::socket& socket,
                                                                           const HostPort& proxy,
                                                                           const std::string& target_host,
                                                                           uint16_t target_port);
    static asio::awaitable<std::expected<void, std::error_code>> open(asio::ip::tcp::socket& socket,
                                                                      const HostPort& proxy);
};

} // namespace http2socks
