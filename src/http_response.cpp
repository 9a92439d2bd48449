#include "http2socks/http_response.hpp"

#include "http2socks/errors.hpp"

#include <format>

namespace http2socks {

int status_for_error(const std::error_code& ec) {
    if (ec.category() == parse_category()) {
        return STATUS_BAD_REQUEST;
    }
    if (ec == SocksError::TIMEOUT || ec == SocksError::TTL_EXPIRED || ec == std::errc::timed_out) {
        return STATUS_GATEWAY_TIMEOUT;
    }
    return STATUS_BAD_GATEWAY;
}

std::string_view reason_phrase(int status) {
    switch (status) {
        case STATUS_BAD_REQUEST:
            return "Bad Request";
        case STATUS_BAD_GATEWAY:
            return "Bad Gateway";
        case STATUS_GATEWAY_TIMEOUT:
            return "Gateway Timeout";
        default:
            return "Error";
    }
}

std::string make_error_response(int status, std::string_view detail) {
    std::string body = std::format("{}\r\n", detail);
    return std::format("HTTP/1.1 {} {}\r\n"
                       "Content-Type: text/plain\r\n"
                       "Content-Length: {}\r\n"
                       "Connection: close\r\n"
                       "\r\n"
                       "{}",
                       status, reason_phrase(status), body.size(), body);
}

} // namespace http2socks
