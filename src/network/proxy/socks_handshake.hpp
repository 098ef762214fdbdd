#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <stdexcept>
#include <string>

namespace Egress::Network::Proxy {

/**
 * @brief Raised when an egress proxy refuses or garbles a tunnel setup.
 */
class HandshakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief SOCKS4/4a and SOCKS5 client handshakes on a connected stream.
 *
 * The stream's expiry bounds every read and write. On return the stream
 * is a transparent tunnel to host:port.
 */
class SocksHandshake {
public:
    /**
     * @brief Performs a SOCKS4 handshake, falling back to SOCKS4a for hostnames.
     * @param stream The connected stream to the proxy server.
     * @param host Target host.
     * @param port Target port.
     */
    static boost::asio::awaitable<void> perform_socks4(boost::beast::tcp_stream& stream,
                                                       const std::string&        host,
                                                       const std::string&        port);

    /**
     * @brief Performs a SOCKS5 handshake (No Auth).
     * @param stream The connected stream to the proxy server.
     * @param host Target host (hostname or IP).
     * @param port Target port.
     */
    static boost::asio::awaitable<void> perform_socks5(boost::beast::tcp_stream& stream,
                                                       const std::string&        host,
                                                       const std::string&        port);

    static uint16_t parse_port(const std::string& port);
};

}  // namespace Egress::Network::Proxy
