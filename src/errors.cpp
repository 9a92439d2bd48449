#include "http2socks/errors.hpp"

#include <string>

namespace http2socks {

namespace {

class BindCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "http2socks.bind"; }

    std::string message(int ev) const override {
        switch (static_cast<BindError>(ev)) {
            case BindError::SUCCESS:
                return "Success";
            case BindError::ADDRESS_IN_USE:
                return "Listen address already in use";
            case BindError::PERMISSION_DENIED:
                return "Permission denied binding listen address";
            case BindError::INVALID_ADDRESS:
                return "Invalid listen address";
            case BindError::BIND_FAILED:
                return "Failed to bind listen address";
            default:
                return "Unknown error";
        }
    }
};

class ParseCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "http2socks.parse"; }

    std::string message(int ev) const override {
        switch (static_cast<ParseError>(ev)) {
            case ParseError::SUCCESS:
                return "Success";
            case ParseError::MALFORMED_REQUEST:
                return "Malformed HTTP request";
            case ParseError::HEADERS_TOO_LARGE:
                return "HTTP request headers too large";
            case ParseError::UNEXPECTED_EOF:
                return "Client closed connection before sending a complete request";
            default:
                return "Unknown error";
        }
    }
};

class SocksCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "http2socks.socks5"; }

    std::string message(int ev) const override {
        switch (static_cast<SocksError>(ev)) {
            case SocksError::SUCCESS:
                return "Success";
            case SocksError::GENERAL_FAILURE:
                return "General SOCKS server failure";
            case SocksError::CONNECTION_NOT_ALLOWED:
                return "Connection not allowed by ruleset";
            case SocksError::NETWORK_UNREACHABLE:
                return "Network unreachable";
            case SocksError::HOST_UNREACHABLE:
                return "Host unreachable";
            case SocksError::CONNECTION_REFUSED:
                return "Connection refused by destination";
            case SocksError::TTL_EXPIRED:
                return "TTL expired";
            case SocksError::COMMAND_NOT_SUPPORTED:
                return "Command not supported";
            case SocksError::ADDRESS_TYPE_NOT_SUPPORTED:
                return "Address type not supported";
            case SocksError::UNSUPPORTED_AUTH_METHOD:
                return "SOCKS proxy requires an unsupported authentication method";
            case SocksError::TRANSPORT_ERROR:
                return "Could not talk to SOCKS proxy";
            case SocksError::TIMEOUT:
                return "SOCKS handshake timed out";
            case SocksError::INVALID_REPLY:
                return "Invalid SOCKS reply";
            case SocksError::INVALID_TARGET:
                return "Destination cannot be encoded in a SOCKS request";
            default:
                return "Unknown error";
        }
    }
};

class RelayCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "http2socks.relay"; }

    std::string message(int ev) const override {
        switch (static_cast<RelayError>(ev)) {
            case RelayError::SUCCESS:
                return "Success";
            case RelayError::READ_FAILED:
                return "Relay read failed";
            case RelayError::WRITE_FAILED:
                return "Relay write failed";
            default:
                return "Unknown error";
        }
    }
};

} // namespace

const std::error_category& bind_category() {
    static BindCategory instance;
    return instance;
}

const std::error_category& parse_category() {
    static ParseCategory instance;
    return instance;
}

const std::error_category& socks_category() {
    static SocksCategory instance;
    return instance;
}

const std::error_category& relay_category() {
    static RelayCategory instance;
    return instance;
}

std::error_code make_error_code(BindError e) {
    return {static_cast<int>(e), bind_category()};
}

std::error_code make_error_code(ParseError e) {
    return {static_cast<int>(e), parse_category()};
}

std::error_code make_error_code(SocksError e) {
    return {static_cast<int>(e), socks_category()};
}

std::error_code make_error_code(RelayError e) {
    return {static_cast<int>(e), relay_category()};
}

} // namespace http2socks
