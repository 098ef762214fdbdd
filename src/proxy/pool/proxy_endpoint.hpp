#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace Egress {
namespace Proxy {
namespace Pool {

enum class ProxyScheme { HTTP, SOCKS4, SOCKS5 };

const char* to_string(ProxyScheme scheme);

struct ProxyEndpoint {
    ProxyScheme   scheme = ProxyScheme::HTTP;
    std::string   host;
    std::uint16_t port = 0;

    // Accepts "host:port" (HTTP assumed) or "scheme://host:port".
    // Throws std::invalid_argument on anything else.
    static ProxyEndpoint parse(const std::string& address);

    std::string url() const;

    bool operator==(const ProxyEndpoint& other) const {
        return scheme == other.scheme && port == other.port && host == other.host;
    }
    bool operator!=(const ProxyEndpoint& other) const {
        return !(*this == other);
    }
};

struct ProxyEndpointHash {
    std::size_t operator()(const ProxyEndpoint& endpoint) const noexcept {
        std::size_t h = std::hash<std::string>{}(endpoint.host);
        h ^= std::hash<std::uint32_t>{}((static_cast<std::uint32_t>(endpoint.scheme) << 16)
                                        | endpoint.port)
             + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
