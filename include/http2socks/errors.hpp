#pragma once

#include <system_error>

namespace http2socks {

// Failure to bring up the listening socket. Fatal to Bridge::start().
enum class BindError {
    SUCCESS = 0,
    ADDRESS_IN_USE,
    PERMISSION_DENIED,
    INVALID_ADDRESS,
    BIND_FAILED
};

// Failure to read a usable request head from the client.
enum class ParseError {
    SUCCESS = 0,
    MALFORMED_REQUEST,
    HEADERS_TOO_LARGE,
    UNEXPECTED_EOF
};

// Failure to obtain an upstream tunnel from the SOCKS5 proxy.
// Values 1..8 follow the RFC 1928 reply codes.
enum class SocksError {
    SUCCESS = 0,
    GENERAL_FAILURE = 1,
    CONNECTION_NOT_ALLOWED = 2,
    NETWORK_UNREACHABLE = 3,
    HOST_UNREACHABLE = 4,
    CONNECTION_REFUSED = 5,
    TTL_EXPIRED = 6,
    COMMAND_NOT_SUPPORTED = 7,
    ADDRESS_TYPE_NOT_SUPPORTED = 8,
    UNSUPPORTED_AUTH_METHOD = 100,
    TRANSPORT_ERROR,
    TIMEOUT,
    INVALID_REPLY,
    INVALID_TARGET
};

// Failure while splicing bytes between client and upstream.
enum class RelayError {
    SUCCESS = 0,
    READ_FAILED,
    WRITE_FAILED
};

const std::error_category& bind_category();
const std::error_category& parse_category();
const std::error_category& socks_category();
const std::error_category& relay_category();

std::error_code make_error_code(BindError e);
std::error_code make_error_code(ParseError e);
std::error_code make_error_code(SocksError e);
std::error_code make_error_code(RelayError e);

} // namespace http2socks

namespace std {
template <>
struct is_error_code_enum<http2socks::BindError> : true_type {};
template <>
struct is_error_code_enum<http2socks::ParseError> : true_type {};
template <>
struct is_error_code_enum<http2socks::SocksError> : true_type {};
template <>
struct is_error_code_enum<http2socks::RelayError> : true_type {};
} // namespace std
