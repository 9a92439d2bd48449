#pragma once

#include "asio_config.hpp"

#include <chrono>
#include <expected>
#include <system_error>
#include <type_traits>
#include <utility>

namespace http2socks {

using namespace asio::experimental::awaitable_operators;

using Duration = std::chrono::steady_clock::duration;

// Runs an awaitable that completes with tuple<error_code, T...> (an operation
// started with asio::as_tuple(asio::use_awaitable)) and returns
// expected<T, error_code>.
//
// When `limit` is positive the operation races a timer; if the timer wins the
// operation is cancelled and `on_timeout` is returned. A zero limit awaits the
// operation without a deadline.
template <typename T = void, typename Op>
auto with_timeout(Op&& op, Duration limit,
                  std::error_code on_timeout = std::make_error_code(std::errc::timed_out))
    -> asio::awaitable<std::expected<T, std::error_code>> {
    auto unpack = [](auto& op_result) -> std::expected<T, std::error_code> {
        std::error_code ec = std::get<0>(op_result);
        if (ec) {
            return std::unexpected(ec);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(std::get<1>(op_result));
        } else {
            return {};
        }
    };

    if (limit <= Duration::zero()) {
        auto op_result = co_await std::forward<Op>(op);
        co_return unpack(op_result);
    }

    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(limit);

    auto result = co_await (std::forward<Op>(op) || timer.async_wait(asio::as_tuple(asio::use_awaitable)));
    if (result.index() == 0) {
        co_return unpack(std::get<0>(result));
    }
    co_return std::unexpected(on_timeout);
}

} // namespace http2socks
