#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace http2socks {

struct HostPort {
    std::string host; // never bracketed, even for IPv6 literals
    uint16_t port = 0;

    // host:port, with brackets around IPv6 literals.
    std::string to_string() const;

    bool operator==(const HostPort&) const = default;
};

// Splits "host:port", "[v6]:port" or (when a default is given) a bare host.
// The split happens on the last colon of an unbracketed authority. Ports must
// be decimal in 1..65535. Errors are ParseError::MALFORMED_REQUEST.
std::expected<HostPort, std::error_code> split_host_port(std::string_view text,
                                                         std::optional<uint16_t> default_port = std::nullopt);

// Decimal port in 1..65535.
std::optional<uint16_t> parse_port(std::string_view text);

} // namespace http2socks
