#include "http2socks/bridge.hpp"

#include "http2socks/connection.hpp"
#include "http2socks/errors.hpp"
#include "http2socks/log.hpp"

#include <exception>
#include <format>
#include <stdexcept>
#include <string>

namespace http2socks {

namespace {

std::error_code to_bind_error(const std::error_code& ec) {
    if (ec == std::errc::address_in_use) {
        return make_error_code(BindError::ADDRESS_IN_USE);
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return make_error_code(BindError::PERMISSION_DENIED);
    }
    if (ec == std::errc::address_not_available || ec == std::errc::invalid_argument ||
        ec == std::errc::address_family_not_supported) {
        return make_error_code(BindError::INVALID_ADDRESS);
    }
    return make_error_code(BindError::BIND_FAILED);
}

// Completion handler for co_spawn: exceptions escaping a bridge coroutine are
// logged instead of tearing down the io_context.
auto log_exception(std::string_view what) {
    return [what](std::exception_ptr e) {
        if (!e) {
            return;
        }
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            log::error("{} terminated: {}", what, ex.what());
        }
    };
}

} // namespace

std::string_view to_string(BridgeState state) {
    switch (state) {
        case BridgeState::STARTING:
            return "starting";
        case BridgeState::LISTENING:
            return "listening";
        case BridgeState::DRAINING:
            return "draining";
        case BridgeState::STOPPED:
            return "stopped";
    }
    return "unknown";
}

void ShutdownHandle::trigger() {
    if (bridge_) {
        bridge_->shutdown();
    }
}

bool ShutdownHandle::triggered() const {
    return bridge_ && bridge_->shutdown_requested();
}

Bridge::Bridge(asio::io_context& io_context, BridgeConfig config)
    : io_context_(io_context), strand_(asio::make_strand(io_context)),
      config_(std::make_shared<const BridgeConfig>(std::move(config))), acceptor_(strand_), drain_timer_(strand_) {}

ListenHandle Bridge::start() {
    if (state_ != BridgeState::STARTING) {
        throw std::logic_error("Bridge::start() called more than once");
    }

    const auto listen_text = config_->listen.to_string();
    auto fail = [&](const std::error_code& ec) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        set_state(BridgeState::STOPPED);
        throw std::system_error(to_bind_error(ec), std::format("cannot listen on {}: {}", listen_text, ec.message()));
    };

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(config_->listen.host, std::to_string(config_->listen.port),
                                      asio::ip::resolver_base::passive | asio::ip::resolver_base::numeric_service, ec);
    if (ec || endpoints.empty()) {
        fail(ec ? ec : std::make_error_code(std::errc::address_not_available));
    }
    asio::ip::tcp::endpoint endpoint = *endpoints.begin();

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        fail(ec);
    }

    auto local = acceptor_.local_endpoint(ec);
    if (ec) {
        fail(ec);
    }

    set_state(BridgeState::LISTENING);
    asio::co_spawn(strand_, listen(), log_exception("accept loop"));

    log::info("HTTP-SOCKS bridge listening on {}:{}, forwarding to {}", local.address().to_string(), local.port(),
              config_->socks_proxy.to_string());
    return ListenHandle{local, ShutdownHandle(this)};
}

void Bridge::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    asio::post(strand_, [this] { begin_drain(); });
}

asio::awaitable<void> Bridge::listen() {
    while (state_ == BridgeState::LISTENING) {
        auto [ec, socket] = co_await acceptor_.async_accept(asio::as_tuple(asio::use_awaitable));
        if (state_ != BridgeState::LISTENING) {
            // Shutdown won the race against this accept.
            asio::error_code ignored;
            socket.close(ignored);
            break;
        }
        if (ec) {
            log::error("Accept failed: {}", ec.message());
            continue;
        }

        auto connection = std::make_shared<Connection>(std::move(socket), config_, next_id_++);
        connections_.emplace(connection->id(), connection);
        active_ = connections_.size();
        log::debug("{} accepted ({} active)", connection->peer(), connections_.size());

        auto slot = connection->cancellation_slot();
        asio::co_spawn(strand_, serve_connection(std::move(connection)),
                       asio::bind_cancellation_slot(slot, log_exception("connection")));
    }
}

asio::awaitable<void> Bridge::serve_connection(std::shared_ptr<Connection> connection) {
    co_await connection->run();

    connections_.erase(connection->id());
    active_ = connections_.size();
    finish_if_drained();
}

void Bridge::begin_drain() {
    if (state_ != BridgeState::LISTENING) {
        return;
    }
    set_state(BridgeState::DRAINING);

    asio::error_code ec;
    acceptor_.close(ec);
    log::info("Shutdown signal received, draining {} connection(s)", connections_.size());

    if (connections_.empty()) {
        finish_if_drained();
        return;
    }
    if (config_->drain_timeout <= Duration::zero()) {
        cancel_connections();
        return;
    }

    drain_timer_.expires_after(config_->drain_timeout);
    drain_timer_.async_wait([this](const asio::error_code& wait_ec) {
        if (!wait_ec && state_ == BridgeState::DRAINING) {
            cancel_connections();
        }
    });
}

void Bridge::cancel_connections() {
    log::warn("Drain timeout elapsed, cancelling {} connection(s)", connections_.size());
    for (auto& [id, connection] : connections_) {
        connection->abort();
    }
}

void Bridge::finish_if_drained() {
    if (state_ != BridgeState::DRAINING || !connections_.empty()) {
        return;
    }
    drain_timer_.cancel();
    set_state(BridgeState::STOPPED);
}

void Bridge::set_state(BridgeState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        log::debug("Bridge {} -> {}", to_string(previous), to_string(state));
        if (state == BridgeState::STOPPED && previous != BridgeState::STARTING) {
            log::info("HTTP-SOCKS bridge stopped");
        }
    }
}

} // namespace http2socks
