#pragma once

#include "http2socks/errors.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace http2socks::socks5 {

constexpr uint8_t VERSION = 0x05;
constexpr uint8_t RSV = 0x00;
constexpr std::size_t MAX_DOMAIN_LENGTH = 255;

enum class AuthMethod : uint8_t {
    NO_AUTH = 0x00
};

enum class Command : uint8_t {
    CONNECT = 0x01
};

enum class AddressType : uint8_t {
    IPV4 = 0x01,
    DOMAIN_NAME = 0x03,
    IPV6 = 0x04
};

enum class Reply : uint8_t {
    SUCCEEDED = 0x00,
    GENERIC_FAILURE = 0x01,
    CONNECTION_NOT_ALLOWED = 0x02,
    NETWORK_UNREACHABLE = 0x03,
    HOST_UNREACHABLE = 0x04,
    CONNECTION_REFUSED = 0x05,
    TTL_EXPIRED = 0x06,
    COMMAND_NOT_SUPPORTED = 0x07,
    ADDRESS_TYPE_NOT_SUPPORTED = 0x08
};

// Method selection message offering only "no authentication".
constexpr uint8_t GREETING[] = {VERSION, 0x01, static_cast<uint8_t>(AuthMethod::NO_AUTH)};

// Builds VER CMD RSV ATYP DST.ADDR DST.PORT for a CONNECT to host:port.
// IPv4 and IPv6 literals are encoded as addresses; anything else goes out as a
// domain name so the proxy performs the lookup.
std::expected<std::vector<uint8_t>, std::error_code> encode_connect_request(const std::string& host,
                                                                            uint16_t port);

// Maps the REP field of a reply to an error; SUCCEEDED maps to an empty code.
std::error_code reply_to_error(uint8_t reply);

// Bytes that follow ATYP in a reply for fixed-size address types (address +
// port), or 0 when the length must be read from the wire (domain) or the type
// is unknown.
std::size_t fixed_bound_address_length(uint8_t atyp);

} // namespace http2socks::socks5
