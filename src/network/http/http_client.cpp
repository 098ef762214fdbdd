#include "http_client.hpp"

namespace Egress {
namespace Network {
namespace Http {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Proxy: return "proxy";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Tls: return "tls";
        case ErrorType::Cancelled: return "cancelled";
        case ErrorType::Other: return "other";
    }
    return "other";
}

}  // namespace Http
}  // namespace Network
}  // namespace Egress
