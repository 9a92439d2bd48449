#include "http2socks/protocol.hpp"

#include "asio_config.hpp"

namespace http2socks::socks5 {

std::expected<std::vector<uint8_t>, std::error_code> encode_connect_request(const std::string& host,
                                                                            uint16_t port) {
    std::vector<uint8_t> request;
    request.push_back(VERSION);
    request.push_back(static_cast<uint8_t>(Command::CONNECT));
    request.push_back(RSV);

    asio::error_code ec;
    auto ip_addr = asio::ip::make_address(host, ec);

    if (!ec) {
        if (ip_addr.is_v4()) {
            request.push_back(static_cast<uint8_t>(AddressType::IPV4));
            auto bytes = ip_addr.to_v4().to_bytes();
            request.insert(request.end(), bytes.begin(), bytes.end());
        } else {
            request.push_back(static_cast<uint8_t>(AddressType::IPV6));
            auto bytes = ip_addr.to_v6().to_bytes();
            request.insert(request.end(), bytes.begin(), bytes.end());
        }
    } else {
        if (host.empty() || host.size() > MAX_DOMAIN_LENGTH) {
            return std::unexpected(make_error_code(SocksError::INVALID_TARGET));
        }
        request.push_back(static_cast<uint8_t>(AddressType::DOMAIN_NAME));
        request.push_back(static_cast<uint8_t>(host.size()));
        request.insert(request.end(), host.begin(), host.end());
    }

    request.push_back(static_cast<uint8_t>((port >> 8) & 0xFF));
    request.push_back(static_cast<uint8_t>(port & 0xFF));
    return request;
}

std::error_code reply_to_error(uint8_t reply) {
    switch (static_cast<Reply>(reply)) {
        case Reply::SUCCEEDED:
            return {};
        case Reply::GENERIC_FAILURE:
        case Reply::CONNECTION_NOT_ALLOWED:
        case Reply::NETWORK_UNREACHABLE:
        case Reply::HOST_UNREACHABLE:
        case Reply::CONNECTION_REFUSED:
        case Reply::TTL_EXPIRED:
        case Reply::COMMAND_NOT_SUPPORTED:
        case Reply::ADDRESS_TYPE_NOT_SUPPORTED:
            // SocksError shares the RFC 1928 numbering for these.
            return make_error_code(static_cast<SocksError>(reply));
    }
    return make_error_code(SocksError::GENERAL_FAILURE);
}

std::size_t fixed_bound_address_length(uint8_t atyp) {
    switch (static_cast<AddressType>(atyp)) {
        case AddressType::IPV4:
            return 4 + 2;
        case AddressType::IPV6:
            return 16 + 2;
        case AddressType::DOMAIN_NAME:
            return 0;
    }
    return 0;
}

} // namespace http2socks::socks5
