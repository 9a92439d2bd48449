#pragma once

#include "asio_config.hpp"
#include "http2socks/config.hpp"
#include "http2socks/relay.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace http2socks {

// One accepted client connection: parse the request, open a SOCKS5 tunnel to
// its target, answer or forward the request, then relay until either side
// closes.
class Connection {
  public:
    Connection(asio::ip::tcp::socket client, std::shared_ptr<const BridgeConfig> config, uint64_t id);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Never throws; all failures end in a logged, closed connection.
    asio::awaitable<void> run();

    // Cancels run() and closes both sockets. Must be called on the executor
    // that runs the connection.
    void abort();

    // Slot the co_spawn running run() must be bound to; abort() emits a
    // terminal cancellation on it.
    asio::cancellation_slot cancellation_slot() { return cancel_signal_.slot(); }

    uint64_t id() const { return id_; }
    const std::string& peer() const { return peer_; }

  private:
    asio::awaitable<void> serve();
    asio::awaitable<void> expire_after(Duration limit);
    asio::awaitable<void> reject(int status, std::string_view detail);
    asio::awaitable<bool> send(asio::ip::tcp::socket& socket, std::string_view bytes);
    void close();
    void report() const;

    asio::ip::tcp::socket client_;
    asio::ip::tcp::socket upstream_;
    std::shared_ptr<const BridgeConfig> config_;
    uint64_t id_;
    asio::cancellation_signal cancel_signal_;

    std::string peer_;
    std::string method_;
    std::string target_;
    int status_ = 0; // written by the bridge itself; 0 when the origin answered
    bool relaying_ = false;
    bool aborted_ = false;
    bool timed_out_ = false;
    RelayResult relay_;
    std::error_code error_;
};

} // namespace http2socks
