#include "socks_handshake.hpp"
#include <vector>
#include "../../binary/reader.hpp"
#include "../../binary/writer.hpp"

namespace Egress::Network::Proxy {

namespace net = boost::asio;
using namespace Egress::Binary;

namespace {
constexpr uint8_t SOCKS4_VERSION   = 0x04;
constexpr uint8_t SOCKS4_GRANTED   = 0x5A;
constexpr uint8_t SOCKS5_VERSION   = 0x05;
constexpr uint8_t SOCKS5_NO_AUTH   = 0x00;
constexpr uint8_t SOCKS5_NO_METHOD = 0xFF;
constexpr uint8_t CMD_CONNECT      = 0x01;
constexpr uint8_t ATYP_IPV4        = 0x01;
constexpr uint8_t ATYP_DOMAIN      = 0x03;
constexpr uint8_t ATYP_IPV6        = 0x04;
}  // namespace

uint16_t SocksHandshake::parse_port(const std::string& port) {
    int value = 0;
    try {
        value = std::stoi(port);
    } catch (const std::exception&) {
        throw HandshakeError("Invalid target port: " + port);
    }
    if (value <= 0 || value > 65535)
        throw HandshakeError("Invalid target port: " + port);
    return static_cast<uint16_t>(value);
}

net::awaitable<void> SocksHandshake::perform_socks4(boost::beast::tcp_stream& stream,
                                                    const std::string&        host,
                                                    const std::string&        port) {
    boost::system::error_code ec;
    net::ip::address          addr   = net::ip::make_address(host, ec);
    bool                      use_4a = ec || !addr.is_v4();

    std::vector<uint8_t> req_data;
    Writer               writer(req_data);
    writer.write_uint8(SOCKS4_VERSION);
    writer.write_uint8(CMD_CONNECT);
    writer.write_uint16_be(parse_port(port));

    if (use_4a) {
        // 0.0.0.x with x != 0 tells the proxy to resolve the trailing hostname.
        writer.write_bytes(std::array<uint8_t, 4>{0, 0, 0, 1});
        writer.write_uint8(0x00);
        writer.write_string(host);
        writer.write_uint8(0x00);
    }
    else {
        writer.write_bytes(addr.to_v4().to_bytes());
        writer.write_uint8(0x00);
    }

    co_await net::async_write(stream, net::buffer(req_data), net::use_awaitable);

    std::vector<uint8_t> resp_data(8);
    co_await net::async_read(stream, net::buffer(resp_data), net::use_awaitable);

    Reader reader(resp_data);
    reader.read_uint8();
    if (reader.read_uint8() != SOCKS4_GRANTED) {
        throw HandshakeError("SOCKS4 request rejected");
    }
    co_return;
}

net::awaitable<void> SocksHandshake::perform_socks5(boost::beast::tcp_stream& stream,
                                                    const std::string&        host,
                                                    const std::string&        port) {
    if (host.size() > 255)
        throw HandshakeError("SOCKS5 hostname too long");

    std::vector<uint8_t> greeting;
    Writer               writer(greeting);
    writer.write_uint8(SOCKS5_VERSION);
    writer.write_uint8(0x01);
    writer.write_uint8(SOCKS5_NO_AUTH);
    co_await net::async_write(stream, net::buffer(greeting), net::use_awaitable);

    std::vector<uint8_t> choice_data(2);
    co_await net::async_read(stream, net::buffer(choice_data), net::use_awaitable);

    Reader reader(choice_data);
    if (reader.read_uint8() != SOCKS5_VERSION || reader.read_uint8() == SOCKS5_NO_METHOD) {
        throw HandshakeError("SOCKS5 handshake failed (auth choice)");
    }

    std::vector<uint8_t> req_data;
    Writer               req_writer(req_data);
    req_writer.write_uint8(SOCKS5_VERSION);
    req_writer.write_uint8(CMD_CONNECT);
    req_writer.write_uint8(0x00);
    req_writer.write_uint8(ATYP_DOMAIN);
    req_writer.write_uint8(static_cast<uint8_t>(host.size()));
    req_writer.write_string(host);
    req_writer.write_uint16_be(parse_port(port));

    co_await net::async_write(stream, net::buffer(req_data), net::use_awaitable);

    std::vector<uint8_t> header_data(4);
    co_await net::async_read(stream, net::buffer(header_data), net::use_awaitable);

    Reader header_reader(header_data);
    header_reader.read_uint8();
    uint8_t reply = header_reader.read_uint8();
    if (reply != 0x00) {
        throw HandshakeError("SOCKS5 connect failed (reply " + std::to_string(reply) + ")");
    }
    header_reader.read_uint8();
    uint8_t atyp = header_reader.read_uint8();

    size_t len = 0;
    if (atyp == ATYP_IPV4)
        len = 4;
    else if (atyp == ATYP_DOMAIN) {
        uint8_t  domain_len = 0;
        co_await net::async_read(stream, net::buffer(&domain_len, 1), net::use_awaitable);
        len = domain_len;
    }
    else if (atyp == ATYP_IPV6)
        len = 16;
    else
        throw HandshakeError("SOCKS5 reply has unknown address type");

    std::vector<uint8_t> addr_port(len + 2);
    co_await net::async_read(stream, net::buffer(addr_port), net::use_awaitable);

    co_return;
}

}  // namespace Egress::Network::Proxy
