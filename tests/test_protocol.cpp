#include "http2socks/errors.hpp"
#include "http2socks/protocol.hpp"

#include <gtest/gtest.h>

using namespace http2socks;
using namespace http2socks::socks5;

TEST(ProtocolTest, GreetingOffersOnlyNoAuth) {
    ASSERT_EQ(sizeof(GREETING), 3u);
    EXPECT_EQ(GREETING[0], 0x05);
    EXPECT_EQ(GREETING[1], 0x01);
    EXPECT_EQ(GREETING[2], 0x00);
}

TEST(ProtocolTest, EncodeIPv4Target) {
    auto request = encode_connect_request("192.168.1.20", 8080);
    ASSERT_TRUE(request.has_value());
    std::vector<uint8_t> expected = {0x05, 0x01, 0x00, 0x01, 192, 168, 1, 20, 0x1F, 0x90};
    EXPECT_EQ(*request, expected);
}

TEST(ProtocolTest, EncodeIPv6Target) {
    auto request = encode_connect_request("::1", 443);
    ASSERT_TRUE(request.has_value());
    ASSERT_EQ(request->size(), 4u + 16u + 2u);
    EXPECT_EQ((*request)[3], 0x04);
    EXPECT_EQ((*request)[19], 0x01);
    EXPECT_EQ((*request)[20], 0x01);
    EXPECT_EQ((*request)[21], 0xBB);
}

TEST(ProtocolTest, EncodeDomainTargetUnresolved) {
    auto request = encode_connect_request("example.com", 443);
    ASSERT_TRUE(request.has_value());
    std::vector<uint8_t> expected = {0x05, 0x01, 0x00, 0x03, 11};
    std::string name = "example.com";
    expected.insert(expected.end(), name.begin(), name.end());
    expected.push_back(0x01);
    expected.push_back(0xBB);
    EXPECT_EQ(*request, expected);
}

TEST(ProtocolTest, DomainLengthLimits) {
    EXPECT_TRUE(encode_connect_request(std::string(255, 'a'), 80).has_value());

    auto too_long = encode_connect_request(std::string(256, 'a'), 80);
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error(), SocksError::INVALID_TARGET);

    auto empty = encode_connect_request("", 80);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), SocksError::INVALID_TARGET);
}

TEST(ProtocolTest, ReplyCodes) {
    EXPECT_FALSE(reply_to_error(0x00));
    EXPECT_EQ(reply_to_error(0x01), SocksError::GENERAL_FAILURE);
    EXPECT_EQ(reply_to_error(0x02), SocksError::CONNECTION_NOT_ALLOWED);
    EXPECT_EQ(reply_to_error(0x03), SocksError::NETWORK_UNREACHABLE);
    EXPECT_EQ(reply_to_error(0x04), SocksError::HOST_UNREACHABLE);
    EXPECT_EQ(reply_to_error(0x05), SocksError::CONNECTION_REFUSED);
    EXPECT_EQ(reply_to_error(0x06), SocksError::TTL_EXPIRED);
    EXPECT_EQ(reply_to_error(0x07), SocksError::COMMAND_NOT_SUPPORTED);
    EXPECT_EQ(reply_to_error(0x08), SocksError::ADDRESS_TYPE_NOT_SUPPORTED);

    // Unassigned codes are treated as a general failure.
    EXPECT_EQ(reply_to_error(0x09), SocksError::GENERAL_FAILURE);
    EXPECT_EQ(reply_to_error(0xFF), SocksError::GENERAL_FAILURE);
}

TEST(ProtocolTest, BoundAddressLengths) {
    EXPECT_EQ(fixed_bound_address_length(0x01), 6u);
    EXPECT_EQ(fixed_bound_address_length(0x04), 18u);
    EXPECT_EQ(fixed_bound_address_length(0x03), 0u);
    EXPECT_EQ(fixed_bound_address_length(0x02), 0u);
}

TEST(ProtocolTest, ErrorCategories) {
    std::error_code ec = SocksError::CONNECTION_REFUSED;
    EXPECT_STREQ(ec.category().name(), "http2socks.socks5");
    EXPECT_EQ(ec.value(), 5);
    EXPECT_EQ(ec.message(), "Connection refused by destination");

    EXPECT_NE(std::error_code(ParseError::MALFORMED_REQUEST), std::error_code(BindError::ADDRESS_IN_USE));
    EXPECT_STREQ(std::error_code(RelayError::READ_FAILED).category().name(), "http2socks.relay");
}
