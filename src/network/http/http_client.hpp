#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Egress {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout, Tls, Cancelled, Other };

enum class HTTPCode { Ok = 200, NetworkError = 0 };

const char* to_string(ErrorType type);

struct Header {
    std::string name;
    std::string value;
};

using Headers = std::vector<Header>;

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    bool        success    = false;  // Transport completed and status is 200
    ErrorType   error_type = ErrorType::None;
};

/**
 * @brief One outbound HTTP GET per call, optionally through an egress proxy.
 *
 * Implementations never throw for transport failures; they report them in
 * Response::error_type. The timeout bounds the whole request, handshakes
 * included.
 *
 * cancel() may be called from any thread. It aborts the request in flight
 * and every later one on the same client with ErrorType::Cancelled. A
 * pending get() must run on a strand or single-threaded executor.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Empty string means a direct connection.
    virtual void set_proxy(const std::string& proxy)             = 0;
    virtual void set_timeout(std::chrono::milliseconds timeout)  = 0;
    virtual boost::asio::awaitable<Response> get(const std::string& url,
                                                 const Headers&     headers) = 0;
    virtual void cancel() = 0;
};

using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

}  // namespace Http
}  // namespace Network
}  // namespace Egress
