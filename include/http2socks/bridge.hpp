#pragma once

#include "asio_config.hpp"
#include "http2socks/config.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>

namespace http2socks {

class Bridge;
class Connection;

enum class BridgeState {
    STARTING,
    LISTENING,
    DRAINING,
    STOPPED
};

std::string_view to_string(BridgeState state);

// Single-use, in-process trigger for Bridge::shutdown(). Copies share the
// bridge; only the first trigger on any of them has an effect.
class ShutdownHandle {
  public:
    ShutdownHandle() = default;

    void trigger();
    bool triggered() const;

  private:
    friend class Bridge;
    explicit ShutdownHandle(Bridge* bridge) : bridge_(bridge) {}

    Bridge* bridge_ = nullptr;
};

struct ListenHandle {
    asio::ip::tcp::endpoint local_endpoint; // actual port when 0 was requested
    ShutdownHandle shutdown;
};

// HTTP proxy front end that tunnels every request through a SOCKS5 proxy.
//
// All bridge work runs on one strand of `io_context`. The Bridge must outlive
// the io_context's run() calls.
class Bridge {
  public:
    Bridge(asio::io_context& io_context, BridgeConfig config);

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Binds the listen address synchronously and starts accepting. Throws
    // std::system_error with a BindError code if the address cannot be bound;
    // nothing is left listening in that case.
    ListenHandle start();

    // Stops accepting immediately, lets in-flight connections finish and
    // cancels those still running after the drain timeout. Thread-safe and
    // idempotent.
    void shutdown();

    bool shutdown_requested() const { return shutdown_requested_.load(); }
    BridgeState state() const { return state_.load(); }
    std::size_t active_connections() const { return active_.load(); }

  private:
    asio::awaitable<void> listen();
    asio::awaitable<void> serve_connection(std::shared_ptr<Connection> connection);

    void begin_drain();
    void cancel_connections();
    void finish_if_drained();
    void set_state(BridgeState state);

    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::shared_ptr<const BridgeConfig> config_;
    asio::ip::tcp::acceptor acceptor_;
    asio::steady_timer drain_timer_;

    // Strand-only state.
    std::unordered_map<uint64_t, std::shared_ptr<Connection>> connections_;
    uint64_t next_id_ = 1;

    std::atomic<BridgeState> state_{BridgeState::STARTING};
    std::atomic<std::size_t> active_{0};
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace http2socks
