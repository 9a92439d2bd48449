#include "asio_config.hpp"
#include "http2socks/errors.hpp"
#include "http2socks/http_request.hpp"
#include "http2socks/http_response.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace http2socks;
using namespace http2socks::testing;

namespace {

std::expected<ParsedRequest, std::error_code> parse(std::string_view text) {
    auto end = text.find("\r\n\r\n");
    return parse_request(text, end == std::string_view::npos ? text.size() : end + 4);
}

} // namespace

// 1. CONNECT
TEST(HttpRequestTest, ConnectAuthority) {
    auto req = parse("CONNECT example.com:443 HTTP/1.1\r\nHost: example.com:443\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_TRUE(req->is_connect);
    EXPECT_EQ(req->method, "CONNECT");
    EXPECT_EQ(req->target_host, "example.com");
    EXPECT_EQ(req->target_port, 443);
    EXPECT_TRUE(req->raw_request.empty());
    EXPECT_TRUE(req->early_data.empty());
}

TEST(HttpRequestTest, ConnectIPv6AndEarlyData) {
    auto req = parse("CONNECT [2001:db8::1]:8443 HTTP/1.1\r\n\r\n\x16\x03\x01");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->target_host, "2001:db8::1");
    EXPECT_EQ(req->target_port, 8443);
    EXPECT_EQ(req->early_data, "\x16\x03\x01");
}

TEST(HttpRequestTest, ConnectRequiresPort) {
    auto req = parse("CONNECT example.com HTTP/1.1\r\n\r\n");
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error(), ParseError::MALFORMED_REQUEST);

    EXPECT_FALSE(parse("CONNECT example.com:0 HTTP/1.1\r\n\r\n").has_value());
    EXPECT_FALSE(parse("CONNECT example.com:70000 HTTP/1.1\r\n\r\n").has_value());
}

// 2. Plain HTTP
TEST(HttpRequestTest, AbsoluteFormTarget) {
    std::string text = "GET http://example.com:8080/a/b?c=d HTTP/1.1\r\nHost: ignored.example\r\n\r\n";
    auto req = parse(text);
    ASSERT_TRUE(req.has_value());
    EXPECT_FALSE(req->is_connect);
    EXPECT_EQ(req->method, "GET");
    EXPECT_EQ(req->target_host, "example.com");
    EXPECT_EQ(req->target_port, 8080);
    EXPECT_EQ(req->raw_request, text);
}

TEST(HttpRequestTest, AbsoluteFormDefaultsToPort80) {
    auto req = parse("GET http://user:pw@example.com/ HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->target_host, "example.com");
    EXPECT_EQ(req->target_port, DEFAULT_HTTP_PORT);

    auto v6 = parse("GET http://[::1]/x HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->target_host, "::1");
    EXPECT_EQ(v6->target_port, 80);
}

TEST(HttpRequestTest, OriginFormUsesHostHeader) {
    auto req = parse("DELETE /item/7 HTTP/1.1\r\nhOsT:   api.example:9000  \r\nAccept: */*\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->method, "DELETE");
    EXPECT_EQ(req->target_host, "api.example");
    EXPECT_EQ(req->target_port, 9000);
}

TEST(HttpRequestTest, UrlInsideOriginFormTargetIsNotAnAuthority) {
    const char* cases[] = {
        "GET /login?next=http://x/ HTTP/1.1\r\nHost: example.com\r\n\r\n",
        "GET /redirect/http://x/ HTTP/1.1\r\nHost: example.com\r\n\r\n",
        "GET /a#http://x HTTP/1.1\r\nHost: example.com\r\n\r\n",
    };
    for (const char* text : cases) {
        auto req = parse(text);
        ASSERT_TRUE(req.has_value()) << text;
        EXPECT_EQ(req->target_host, "example.com") << text;
        EXPECT_EQ(req->target_port, 80) << text;
        EXPECT_EQ(req->raw_request, text);
    }
}

TEST(HttpRequestTest, BodyPrefixIsKept) {
    std::string text = "POST http://example.com/form HTTP/1.1\r\nContent-Length: 3\r\n\r\nabc";
    auto req = parse(text);
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->raw_request, text);
}

TEST(HttpRequestTest, LeadingEmptyLinesAreIgnored) {
    std::string text = "\r\nGET / HTTP/1.0\r\nHost: example.com\r\n\r\n";
    auto req = parse_request(text, text.size());
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->target_host, "example.com");
    EXPECT_EQ(req->target_port, 80);
}

// 3. Malformed heads
TEST(HttpRequestTest, MalformedRequestLines) {
    const char* cases[] = {
        "NONSENSE\r\n\r\n",
        "GET /\r\n\r\n",
        "GET  / HTTP/1.1\r\nHost: a\r\n\r\n",
        "GET / HTTP/1.1 extra\r\nHost: a\r\n\r\n",
        "G(T / HTTP/1.1\r\nHost: a\r\n\r\n",
        "GET / FTP/1.0\r\nHost: a\r\n\r\n",
        "GET /no-host HTTP/1.1\r\nAccept: */*\r\n\r\n",
        "GET / HTTP/1.1\r\nHost: \r\n\r\n",
        "GET http:///path HTTP/1.1\r\n\r\n",
        "GET 1http://example.com/ HTTP/1.1\r\n\r\n",
        "GET http://example.com:99999/ HTTP/1.1\r\n\r\n",
    };
    for (const char* text : cases) {
        auto req = parse(text);
        ASSERT_FALSE(req.has_value()) << text;
        EXPECT_EQ(req.error(), ParseError::MALFORMED_REQUEST) << text;
    }
}

TEST(HttpRequestTest, FindHeader) {
    std::string_view head = "GET / HTTP/1.1\r\nX-One: 1\r\ncontent-type:\ttext/plain \r\n\r\n";
    EXPECT_EQ(find_header(head, "x-one"), "1");
    EXPECT_EQ(find_header(head, "Content-Type"), "text/plain");
    EXPECT_EQ(find_header(head, "Missing"), std::nullopt);
    // The request line is never a header.
    EXPECT_EQ(find_header("Host: a\r\n\r\n", "Host"), std::nullopt);
}

// 4. Reading from a socket
class ReadRequestTest : public ::testing::Test {
  protected:
    asio::io_context io_;
};

TEST_F(ReadRequestTest, HeadSplitAcrossWrites) {
    auto req = run_task(io_, []() -> asio::awaitable<std::expected<ParsedRequest, std::error_code>> {
        auto [client, server] = co_await make_socket_pair();
        co_await write_all(client, "GET http://example.com/ HT");
        co_await sleep_for(20ms);
        co_await write_all(client, "TP/1.1\r\nHost: example.com\r\n");
        co_await sleep_for(20ms);
        co_await write_all(client, "\r\n");
        co_return co_await read_request(server, DEFAULT_MAX_HEADER_SIZE, 2s);
    }());

    ASSERT_TRUE(req.has_value()) << req.error().message();
    EXPECT_EQ(req->target_host, "example.com");
    EXPECT_EQ(req->raw_request, "GET http://example.com/ HTTP/1.1\r\nHost: example.com\r\n\r\n");
}

TEST_F(ReadRequestTest, OversizedHeadIsRejected) {
    auto req = run_task(io_, []() -> asio::awaitable<std::expected<ParsedRequest, std::error_code>> {
        auto [client, server] = co_await make_socket_pair();
        std::string head = "GET / HTTP/1.1\r\nX-Filler: " + std::string(4096, 'x') + "\r\n\r\n";
        co_await write_all(client, head);
        co_return co_await read_request(server, 1024, 2s);
    }());

    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error(), ParseError::HEADERS_TOO_LARGE);
}

TEST_F(ReadRequestTest, EofBeforeHeadEnds) {
    auto req = run_task(io_, []() -> asio::awaitable<std::expected<ParsedRequest, std::error_code>> {
        auto [client, server] = co_await make_socket_pair();
        co_await write_all(client, "GET / HTTP/1.1\r\nHost: exa");
        client.shutdown(tcp::socket::shutdown_send);
        co_return co_await read_request(server, DEFAULT_MAX_HEADER_SIZE, 2s);
    }());

    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error(), ParseError::UNEXPECTED_EOF);
}

TEST_F(ReadRequestTest, SilentClientTimesOut) {
    auto req = run_task(io_, []() -> asio::awaitable<std::expected<ParsedRequest, std::error_code>> {
        auto [client, server] = co_await make_socket_pair();
        co_await write_all(client, "GET / HTTP/1.1\r\n");
        co_return co_await read_request(server, DEFAULT_MAX_HEADER_SIZE, 100ms);
    }());

    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error(), std::errc::timed_out);
}

// 5. Responses
TEST(HttpResponseTest, StatusForError) {
    EXPECT_EQ(status_for_error(ParseError::MALFORMED_REQUEST), STATUS_BAD_REQUEST);
    EXPECT_EQ(status_for_error(ParseError::HEADERS_TOO_LARGE), STATUS_BAD_REQUEST);
    EXPECT_EQ(status_for_error(SocksError::TIMEOUT), STATUS_GATEWAY_TIMEOUT);
    EXPECT_EQ(status_for_error(SocksError::TTL_EXPIRED), STATUS_GATEWAY_TIMEOUT);
    EXPECT_EQ(status_for_error(SocksError::CONNECTION_REFUSED), STATUS_BAD_GATEWAY);
    EXPECT_EQ(status_for_error(SocksError::TRANSPORT_ERROR), STATUS_BAD_GATEWAY);
    EXPECT_EQ(status_for_error(SocksError::UNSUPPORTED_AUTH_METHOD), STATUS_BAD_GATEWAY);
}

TEST(HttpResponseTest, ErrorResponseShape) {
    auto response = make_error_response(STATUS_BAD_GATEWAY, "SOCKS5 proxy unreachable");
    EXPECT_TRUE(response.starts_with("HTTP/1.1 502 Bad Gateway\r\n"));
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(response.find("Content-Type: text/plain"), std::string::npos);

    auto body_start = response.find("\r\n\r\n");
    ASSERT_NE(body_start, std::string::npos);
    auto body = response.substr(body_start + 4);
    EXPECT_EQ(body, "SOCKS5 proxy unreachable\r\n");
    EXPECT_NE(response.find("Content-Length: " + std::to_string(body.size()) + "\r\n"), std::string::npos);
}

TEST(HttpResponseTest, ConnectEstablishedLine) {
    EXPECT_EQ(CONNECT_ESTABLISHED, "HTTP/1.1 200 Connection Established\r\n\r\n");
    EXPECT_EQ(reason_phrase(STATUS_BAD_REQUEST), "Bad Request");
    EXPECT_EQ(reason_phrase(STATUS_GATEWAY_TIMEOUT), "Gateway Timeout");
}
