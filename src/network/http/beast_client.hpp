#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../../proxy/pool/proxy_endpoint.hpp"
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Egress {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_proxy(const std::string& proxy) override;
    void set_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string& url, const Headers& headers) override;
    void cancel() override;

private:
    // Where the request failed, used to tell proxy faults from target faults.
    enum class Stage { Resolve, Connect, Tunnel, Tls, Exchange };

    // Outlives the client so a posted cancel never touches a dead stream.
    struct AbortState {
        std::mutex                mutex;
        bool                      requested = false;
        boost::beast::tcp_stream* stream    = nullptr;
    };

    class ActiveStream;

    std::optional<Egress::Proxy::Pool::ProxyEndpoint> proxy_;
    std::chrono::milliseconds                         timeout_{30000};
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};
    std::shared_ptr<AbortState>                       abort_ = std::make_shared<AbortState>();

    bool abort_requested() const;

    boost::asio::awaitable<Response> perform_http_request(const Utils::UrlParsed& target,
                                                          const Headers&          headers,
                                                          Stage&                  stage);
    boost::asio::awaitable<Response> perform_https_request(const Utils::UrlParsed& target,
                                                           const Headers&          headers,
                                                           Stage&                  stage);

    boost::asio::awaitable<void> connect(boost::beast::tcp_stream& stream,
                                         const Utils::UrlParsed&   target,
                                         Stage&                    stage);
    boost::asio::awaitable<void> open_tunnel(boost::beast::tcp_stream& stream,
                                             const Utils::UrlParsed&   target);

    template <class Stream>
    boost::asio::awaitable<Response> exchange(Stream&                 stream,
                                              const std::string&      request_target,
                                              const Utils::UrlParsed& target,
                                              const Headers&          headers);

    Response error_response(const std::string& url,
                            ErrorType          type,
                            const std::string& message) const;
    ErrorType classify(const boost::system::error_code& ec, Stage stage) const;
};

}  // namespace Http
}  // namespace Network
}  // namespace Egress
