#include "http2socks/http_request.hpp"

#include "http2socks/address.hpp"
#include "http2socks/errors.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace http2socks {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view HEAD_TERMINATOR = "\r\n\r\n";

bool is_tchar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '!':
        case '#':
        case '$':
        case '%':
        case '&':
        case '\'':
        case '*':
        case '+':
        case '-':
        case '.':
        case '^':
        case '_':
        case '`':
        case '|':
        case '~':
            return true;
        default:
            return false;
    }
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_request_line(std::string_view line) {
    std::vector<std::string_view> tokens;
    std::size_t start = 0;
    while (start <= line.size()) {
        auto space = line.find(' ', start);
        if (space == std::string_view::npos) {
            tokens.push_back(line.substr(start));
            break;
        }
        tokens.push_back(line.substr(start, space - start));
        start = space + 1;
    }
    return tokens;
}

// Authority of an absolute-form target, or nullopt for origin/asterisk form.
// A target is absolute only when "://" ends its first path segment, so URLs in
// an origin-form path or query stay origin-form. Sets `malformed` when the
// target looks absolute but cannot be used.
std::optional<std::string_view> absolute_authority(std::string_view target, bool& malformed) {
    if (target.starts_with('/')) {
        return std::nullopt;
    }
    auto scheme_end = target.find("://");
    if (scheme_end == std::string_view::npos || scheme_end > target.find_first_of("/?#")) {
        return std::nullopt;
    }
    auto scheme = target.substr(0, scheme_end);
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front())) ||
        !std::all_of(scheme.begin(), scheme.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        })) {
        malformed = true;
        return std::nullopt;
    }

    auto rest = target.substr(scheme_end + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    if (authority.empty()) {
        malformed = true;
        return std::nullopt;
    }
    return authority;
}

} // namespace

std::optional<std::string_view> find_header(std::string_view head, std::string_view name) {
    auto line_end = head.find(CRLF);
    if (line_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto pos = line_end + CRLF.size();

    while (pos < head.size()) {
        auto end = head.find(CRLF, pos);
        if (end == std::string_view::npos) {
            end = head.size();
        }
        auto line = head.substr(pos, end - pos);
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon != std::string_view::npos && iequals(line.substr(0, colon), name)) {
            return trim(line.substr(colon + 1));
        }
        pos = end + CRLF.size();
    }
    return std::nullopt;
}

std::expected<ParsedRequest, std::error_code> parse_request(std::string_view buffer, std::size_t head_length) {
    auto malformed = std::unexpected(make_error_code(ParseError::MALFORMED_REQUEST));

    if (head_length > buffer.size()) {
        return malformed;
    }
    auto head = buffer.substr(0, head_length);

    // RFC 9112 lets a server ignore empty lines ahead of the request line.
    while (head.starts_with(CRLF)) {
        head.remove_prefix(CRLF.size());
    }

    auto line_end = head.find(CRLF);
    if (line_end == std::string_view::npos || line_end == 0) {
        return malformed;
    }

    auto tokens = split_request_line(head.substr(0, line_end));
    if (tokens.size() != 3) {
        return malformed;
    }
    auto method = tokens[0];
    auto target = tokens[1];
    auto version = tokens[2];

    if (method.empty() || !std::all_of(method.begin(), method.end(), is_tchar)) {
        return malformed;
    }
    if (target.empty() || !version.starts_with("HTTP/")) {
        return malformed;
    }

    ParsedRequest request;
    request.method = std::string(method);
    request.is_connect = (method == "CONNECT");

    if (request.is_connect) {
        auto host_port = split_host_port(target);
        if (!host_port) {
            return malformed;
        }
        request.target_host = std::move(host_port->host);
        request.target_port = host_port->port;
        request.early_data = std::string(buffer.substr(head_length));
        return request;
    }

    bool bad_target = false;
    auto authority = absolute_authority(target, bad_target);
    if (bad_target) {
        return malformed;
    }
    if (!authority) {
        authority = find_header(head, "Host");
        if (!authority || authority->empty()) {
            return malformed;
        }
    }

    auto host_port = split_host_port(*authority, DEFAULT_HTTP_PORT);
    if (!host_port) {
        return malformed;
    }
    request.target_host = std::move(host_port->host);
    request.target_port = host_port->port;
    request.raw_request = std::string(buffer);
    return request;
}

asio::awaitable<std::expected<ParsedRequest, std::error_code>> read_request(asio::ip::tcp::socket& socket,
                                                                           std::size_t max_header_size,
                                                                           Duration timeout) {
    std::string buffer;
    auto head_length = co_await with_timeout<std::size_t>(
        asio::async_read_until(socket, asio::dynamic_buffer(buffer, max_header_size), HEAD_TERMINATOR,
                               asio::as_tuple(asio::use_awaitable)),
        timeout);

    if (!head_length) {
        auto ec = head_length.error();
        if (ec == asio::error::eof) {
            co_return std::unexpected(make_error_code(ParseError::UNEXPECTED_EOF));
        }
        if (ec == asio::error::not_found) {
            co_return std::unexpected(make_error_code(ParseError::HEADERS_TOO_LARGE));
        }
        co_return std::unexpected(ec);
    }

    co_return parse_request(buffer, *head_length);
}

} // namespace http2socks
