#pragma once

#include "asio_config.hpp"
#include "http2socks/timeout.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace http2socks {

constexpr std::size_t DEFAULT_MAX_HEADER_SIZE = 64 * 1024;
constexpr uint16_t DEFAULT_HTTP_PORT = 80;

struct ParsedRequest {
    std::string method;
    bool is_connect = false;
    std::string target_host;
    uint16_t target_port = 0;

    // Original request bytes (head plus any body prefix already read) for
    // non-CONNECT requests; empty for CONNECT.
    std::string raw_request;

    // Bytes a CONNECT client sent after the request head.
    std::string early_data;
};

// Parses the request head held in the first `head_length` bytes of `buffer`
// (which must end with CRLFCRLF). Bytes after the head are kept as body prefix
// or CONNECT early data. Errors are ParseError::MALFORMED_REQUEST.
std::expected<ParsedRequest, std::error_code> parse_request(std::string_view buffer, std::size_t head_length);

// Value of the first header named `name` (case-insensitive) in a request
// head, with surrounding whitespace removed.
std::optional<std::string_view> find_header(std::string_view head, std::string_view name);

// Reads from `socket` until a complete request head is buffered and parses it.
// Errors: ParseError::UNEXPECTED_EOF, ParseError::HEADERS_TOO_LARGE,
// ParseError::MALFORMED_REQUEST, std::errc::timed_out, or the socket error.
asio::awaitable<std::expected<ParsedRequest, std::error_code>> read_request(
    asio::ip::tcp::socket& socket, std::size_t max_header_size = DEFAULT_MAX_HEADER_SIZE,
    Duration timeout = Duration::zero());

} // namespace http2socks
