#include "http2socks/address.hpp"

#include "http2socks/errors.hpp"

#include <algorithm>

namespace http2socks {

namespace {

bool valid_host(std::string_view host) {
    if (host.empty()) {
        return false;
    }
    return std::none_of(host.begin(), host.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u <= 0x20 || u == 0x7F || c == '/' || c == '[' || c == ']';
    });
}

} // namespace

std::string HostPort::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::optional<uint16_t> parse_port(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::expected<HostPort, std::error_code> split_host_port(std::string_view text,
                                                         std::optional<uint16_t> default_port) {
    auto malformed = std::unexpected(make_error_code(ParseError::MALFORMED_REQUEST));

    std::string_view host;
    std::string_view port_text;
    bool has_port = false;

    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos) {
            return malformed;
        }
        host = text.substr(1, close - 1);
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return malformed;
            }
            port_text = rest.substr(1);
            has_port = true;
        }
        // Only an IPv6 literal may appear between brackets.
        if (host.find(':') == std::string_view::npos) {
            return malformed;
        }
        if (std::any_of(host.begin(), host.end(), [](char c) {
                auto u = static_cast<unsigned char>(c);
                return u <= 0x20 || u == 0x7F || c == '[' || c == ']' || c == '/';
            })) {
            return malformed;
        }
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string_view::npos) {
            host = text;
        } else {
            host = text.substr(0, colon);
            port_text = text.substr(colon + 1);
            has_port = true;
        }
        if (!valid_host(host)) {
            return malformed;
        }
    }

    if (host.empty()) {
        return malformed;
    }

    HostPort result;
    result.host = std::string(host);
    if (has_port) {
        auto port = parse_port(port_text);
        if (!port) {
            return malformed;
        }
        result.port = *port;
    } else if (default_port) {
        result.port = *default_port;
    } else {
        return malformed;
    }
    return result;
}

} // namespace http2socks
