#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace http2socks {

constexpr std::string_view CONNECT_ESTABLISHED = "HTTP/1.1 200 Connection Established\r\n\r\n";

constexpr int STATUS_BAD_REQUEST = 400;
constexpr int STATUS_BAD_GATEWAY = 502;
constexpr int STATUS_GATEWAY_TIMEOUT = 504;

// HTTP status reported to the client for a failure before relaying starts:
// parse errors are 400, SOCKS timeouts and TTL expiry 504, everything else 502.
int status_for_error(const std::error_code& ec);

std::string_view reason_phrase(int status);

// Complete "Connection: close" response with a short text/plain body.
std::string make_error_response(int status, std::string_view detail);

} // namespace http2socks
