#include "proxy_endpoint.hpp"
#include <stdexcept>
#include "../../utils/url/url.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

using Egress::Utils::Url;

const char* to_string(ProxyScheme scheme) {
    switch (scheme) {
        case ProxyScheme::HTTP: return "http";
        case ProxyScheme::SOCKS4: return "socks4";
        case ProxyScheme::SOCKS5: return "socks5";
    }
    return "http";
}

ProxyEndpoint ProxyEndpoint::parse(const std::string& address) {
    std::string normalized = address;
    if (normalized.find("://") == std::string::npos)
        normalized = "http://" + normalized;

    auto parsed = Url::parse(normalized);

    ProxyEndpoint endpoint;
    if (parsed.scheme == "http" || parsed.scheme == "https") {
        endpoint.scheme = ProxyScheme::HTTP;
    }
    else if (parsed.scheme == "socks4") {
        endpoint.scheme = ProxyScheme::SOCKS4;
    }
    else if (parsed.scheme == "socks5" || parsed.scheme == "socks5h") {
        endpoint.scheme = ProxyScheme::SOCKS5;
    }
    else {
        throw std::invalid_argument("Unsupported proxy scheme: " + address);
    }

    if (parsed.host.empty())
        throw std::invalid_argument("Proxy address has no host: " + address);
    if (parsed.port.empty())
        throw std::invalid_argument("Proxy address has no port: " + address);

    int port = 0;
    try {
        size_t consumed = 0;
        port            = std::stoi(parsed.port, &consumed);
        if (consumed != parsed.port.size())
            port = 0;
    } catch (const std::exception&) {
        port = 0;
    }
    if (port <= 0 || port > 65535)
        throw std::invalid_argument("Invalid proxy port: " + address);

    endpoint.host = parsed.host;
    endpoint.port = static_cast<std::uint16_t>(port);
    return endpoint;
}

std::string ProxyEndpoint::url() const {
    return std::string(to_string(scheme)) + "://" + host + ":" + std::to_string(port);
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
