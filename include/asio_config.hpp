#pragma once

// Standalone Asio with C++20 coroutine support. ASIO_STANDALONE and
// ASIO_NO_DEPRECATED are set by the build.

#include <asio.hpp>
#include <asio/experimental/awaitable_operators.hpp>
