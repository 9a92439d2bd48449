#include "http2socks/connection.hpp"

#include "http2socks/http_request.hpp"
#include "http2socks/http_response.hpp"
#include "http2socks/log.hpp"
#include "http2socks/socks5_client.hpp"

#include <format>

namespace http2socks {

namespace {

void close_socket(asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    if (socket.is_open()) {
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

} // namespace

Connection::Connection(asio::ip::tcp::socket client, std::shared_ptr<const BridgeConfig> config, uint64_t id)
    : client_(std::move(client)), upstream_(client_.get_executor()), config_(std::move(config)), id_(id) {
    asio::error_code ec;
    auto remote = client_.remote_endpoint(ec);
    peer_ = ec ? std::format("#{}", id_) : std::format("#{} {}:{}", id_, remote.address().to_string(), remote.port());
}

asio::awaitable<void> Connection::run() {
    // Cancellation ends the pending operation with an error code; the
    // coroutine still has to unwind through close() and report().
    co_await asio::this_coro::throw_if_cancelled(false);

    if (config_->connection_timeout && *config_->connection_timeout > Duration::zero()) {
        co_await (serve() || expire_after(*config_->connection_timeout));
    } else {
        co_await serve();
    }

    close();
    report();
}

asio::awaitable<void> Connection::expire_after(Duration limit) {
    asio::steady_timer deadline(client_.get_executor());
    deadline.expires_after(limit);

    auto [ec] = co_await deadline.async_wait(asio::as_tuple(asio::use_awaitable));
    if (!ec) {
        // Closing the sockets unblocks whatever serve() is waiting on.
        timed_out_ = true;
        close();
    }
}

void Connection::abort() {
    aborted_ = true;
    cancel_signal_.emit(asio::cancellation_type::terminal);
    close();
}

asio::awaitable<void> Connection::serve() {
    // 1. Request head
    auto request = co_await read_request(client_, config_->max_header_size, config_->handshake_timeout);
    if (!request) {
        error_ = request.error();
        co_await reject(STATUS_BAD_REQUEST, error_.message());
        co_return;
    }

    method_ = request->method;
    target_ = HostPort{request->target_host, request->target_port}.to_string();
    log::debug("{} {} {} via {}", peer_, method_, target_, config_->socks_proxy.to_string());

    // 2. Tunnel through the SOCKS proxy
    auto tunnel = co_await Socks5Client::connect(upstream_, config_->socks_proxy, request->target_host,
                                                 request->target_port, config_->handshake_timeout);
    if (!tunnel) {
        error_ = tunnel.error();
        co_await reject(status_for_error(error_),
                        std::format("Failed to connect to {} through SOCKS proxy: {}", target_, error_.message()));
        co_return;
    }

    if (aborted_ || timed_out_) {
        co_return;
    }

    // 3. Preamble
    if (request->is_connect) {
        bool established = co_await send(client_, CONNECT_ESTABLISHED);
        if (!established) {
            co_return;
        }
        status_ = 200;
        if (!request->early_data.empty()) {
            bool forwarded = co_await send(upstream_, request->early_data);
            if (!forwarded) {
                co_return;
            }
        }
    } else {
        bool forwarded = co_await send(upstream_, request->raw_request);
        if (!forwarded) {
            co_return;
        }
    }

    // 4. Splice
    relaying_ = true;
    relay_ = co_await relay(client_, upstream_, config_->idle_timeout);
    error_ = relay_.error;
}

asio::awaitable<void> Connection::reject(int status, std::string_view detail) {
    if (aborted_ || timed_out_) {
        co_return;
    }
    status_ = status;
    auto response = make_error_response(status, detail);
    auto [ec, n] = co_await asio::async_write(client_, asio::buffer(response), asio::as_tuple(asio::use_awaitable));
    if (ec) {
        log::debug("{} could not deliver {} response: {}", peer_, status, ec.message());
    }
}

asio::awaitable<bool> Connection::send(asio::ip::tcp::socket& socket, std::string_view bytes) {
    auto [ec, n] = co_await asio::async_write(socket, asio::buffer(bytes), asio::as_tuple(asio::use_awaitable));
    if (ec) {
        error_ = ec;
        co_return false;
    }
    co_return true;
}

void Connection::close() {
    close_socket(client_);
    close_socket(upstream_);
}

void Connection::report() const {
    auto target = target_.empty() ? std::string("-") : target_;
    auto method = method_.empty() ? std::string("-") : method_;

    if (aborted_) {
        log::warn("{} {} {} cancelled during shutdown ({} bytes up, {} bytes down)", peer_, method, target,
                  relay_.client_to_upstream, relay_.upstream_to_client);
    } else if (timed_out_) {
        log::warn("{} {} {} exceeded the connection timeout", peer_, method, target);
    } else if (relaying_) {
        if (error_) {
            log::info("{} {} {} closed after {} bytes up, {} bytes down: {} ({})", peer_, method, target,
                      relay_.client_to_upstream, relay_.upstream_to_client, error_.message(), relay_.cause.message());
        } else {
            log::info("{} {} {} closed after {} bytes up, {} bytes down", peer_, method, target,
                      relay_.client_to_upstream, relay_.upstream_to_client);
        }
    } else if (error_) {
        log::warn("{} {} {} failed with {}: {}", peer_, method, target, status_, error_.message());
    } else {
        log::debug("{} {} {} finished", peer_, method, target);
    }
}

} // namespace http2socks
