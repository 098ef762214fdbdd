#include "beast_client.hpp"
#include "../../core/types/constants.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Egress {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Egress::Proxy::Pool::ProxyEndpoint;
using Egress::Proxy::Pool::ProxyScheme;
using Egress::Utils::Url;
using Egress::Utils::UrlParsed;

// Publishes the stream of the request in flight for cancel().
class BeastClient::ActiveStream {
public:
    ActiveStream(std::shared_ptr<AbortState> state, beast::tcp_stream& stream)
        : state_(std::move(state)) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->requested)
            throw boost::system::system_error(net::error::operation_aborted);
        state_->stream = &stream;
    }

    ~ActiveStream() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stream = nullptr;
    }

    ActiveStream(const ActiveStream&)            = delete;
    ActiveStream& operator=(const ActiveStream&) = delete;

private:
    std::shared_ptr<AbortState> state_;
};

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_proxy(const std::string& proxy) {
    if (proxy.empty()) {
        proxy_.reset();
        return;
    }
    proxy_ = ProxyEndpoint::parse(proxy);
}

void BeastClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void BeastClient::cancel() {
    std::lock_guard<std::mutex> lock(abort_->mutex);
    abort_->requested = true;
    if (!abort_->stream)
        return;

    // The stream is only touched on its own executor.
    net::post(abort_->stream->get_executor(), [state = abort_]() {
        std::lock_guard<std::mutex> guard(state->mutex);
        if (state->stream)
            state->stream->cancel();
    });
}

bool BeastClient::abort_requested() const {
    std::lock_guard<std::mutex> lock(abort_->mutex);
    return abort_->requested;
}

Response BeastClient::error_response(const std::string& url,
                                     ErrorType          type,
                                     const std::string& message) const {
    Response response;
    response.effective_url = url;
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    response.status_code   = static_cast<long>(HTTPCode::NetworkError);
    return response;
}

ErrorType BeastClient::classify(const boost::system::error_code& ec, Stage stage) const {
    if (ec == beast::error::timeout || ec == net::error::timed_out
        || ec == net::error::operation_aborted)
        return ErrorType::Timeout;
    if (ec.category() == net::error::get_ssl_category() || ec == ssl::error::stream_truncated)
        return ErrorType::Tls;
    if (proxy_ && (stage == Stage::Resolve || stage == Stage::Connect || stage == Stage::Tunnel))
        return ErrorType::Proxy;
    return ErrorType::Network;
}

net::awaitable<Response> BeastClient::get(const std::string& url, const Headers& headers) {
    auto target = Url::parse(url);
    if (target.host.empty() || (target.scheme != "http" && target.scheme != "https")) {
        co_return error_response(url, ErrorType::Other, "Invalid URL");
    }

    Stage stage = Stage::Resolve;
    try {
        if (target.scheme == "https") {
            co_return co_await perform_https_request(target, headers, stage);
        }
        co_return co_await perform_http_request(target, headers, stage);
    } catch (const boost::system::system_error& e) {
        if (abort_requested())
            co_return error_response(url, ErrorType::Cancelled, "Request cancelled");
        co_return error_response(url, classify(e.code(), stage), e.code().message());
    } catch (const Network::Proxy::HandshakeError& e) {
        co_return error_response(url, ErrorType::Proxy, e.what());
    } catch (const std::exception& e) {
        co_return error_response(url, ErrorType::Network, e.what());
    }
}

net::awaitable<void> BeastClient::connect(beast::tcp_stream& stream,
                                          const UrlParsed&   target,
                                          Stage&             stage) {
    std::string connect_host = target.host;
    std::string connect_port = Url::effective_port(target);
    if (proxy_) {
        connect_host = proxy_->host;
        connect_port = std::to_string(proxy_->port);
    }

    // IPv6 literals arrive bracketed from the URL parser.
    if (connect_host.size() > 2 && connect_host.front() == '[' && connect_host.back() == ']')
        connect_host = connect_host.substr(1, connect_host.size() - 2);

    stage = Stage::Resolve;
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);

    // The resolver is not covered by cancel(); catch a request made meanwhile.
    if (abort_requested())
        throw boost::system::system_error(net::error::operation_aborted);

    stage = Stage::Connect;
    co_await stream.async_connect(results, net::use_awaitable);
}

net::awaitable<void> BeastClient::open_tunnel(beast::tcp_stream& stream, const UrlParsed& target) {
    std::string host = target.host;
    std::string port = Url::effective_port(target);

    switch (proxy_->scheme) {
        case ProxyScheme::SOCKS5:
            co_await Network::Proxy::SocksHandshake::perform_socks5(stream, host, port);
            co_return;
        case ProxyScheme::SOCKS4:
            co_await Network::Proxy::SocksHandshake::perform_socks4(stream, host, port);
            co_return;
        case ProxyScheme::HTTP: break;
    }

    http::request<http::empty_body> req{http::verb::connect, host + ":" + port, 11};
    req.set(http::field::host, host + ":" + port);
    co_await http::async_write(stream, req, net::use_awaitable);

    // A successful CONNECT reply has no body; read the header only.
    beast::flat_buffer                      b;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read_header(stream, b, parser, net::use_awaitable);

    if (parser.get().result() != http::status::ok) {
        throw Network::Proxy::HandshakeError("Proxy CONNECT failed: HTTP "
                                             + std::to_string(parser.get().result_int()));
    }
}

template <class Stream>
net::awaitable<Response> BeastClient::exchange(Stream&            stream,
                                               const std::string& request_target,
                                               const UrlParsed&   target,
                                               const Headers&     headers) {
    http::request<http::string_body> req{http::verb::get, request_target, 11};
    std::string                      host_header = target.host;
    if (!target.port.empty())
        host_header += ":" + target.port;
    req.set(http::field::host, host_header);
    for (const auto& header : headers)
        req.set(header.name, header.value);
    req.set(http::field::connection, "close");

    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await http::async_read(stream, b, res, net::use_awaitable);

    Response response;
    response.effective_url = target.start_url;
    response.status_code   = res.result_int();
    response.body          = std::move(res.body());
    response.success       = (response.status_code == static_cast<long>(HTTPCode::Ok));
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    co_return response;
}

net::awaitable<Response> BeastClient::perform_http_request(const UrlParsed& target,
                                                           const Headers&   headers,
                                                           Stage&           stage) {
    beast::tcp_stream stream(co_await net::this_coro::executor);
    ActiveStream      active(abort_, stream);
    stream.expires_after(timeout_);

    co_await connect(stream, target, stage);

    std::string request_target = Url::request_target(target);
    if (proxy_) {
        stage = Stage::Tunnel;
        if (proxy_->scheme == ProxyScheme::HTTP) {
            // HTTP proxies take the absolute URI.
            request_target = target.scheme + "://" + target.host
                             + (target.port.empty() ? "" : ":" + target.port) + request_target;
        }
        else {
            co_await open_tunnel(stream, target);
        }
    }

    stage         = Stage::Exchange;
    auto response = co_await exchange(stream, request_target, target, headers);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const UrlParsed& target,
                                                            const Headers&   headers,
                                                            Stage&           stage) {
    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    auto&                                lowest = beast::get_lowest_layer(ssl_stream);
    ActiveStream                         active(abort_, lowest);
    lowest.expires_after(timeout_);

    co_await connect(lowest, target, stage);

    if (proxy_) {
        stage = Stage::Tunnel;
        co_await open_tunnel(lowest, target);
    }

    stage = Stage::Tls;
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    ssl_stream.set_verify_callback(ssl::host_name_verification(target.host));
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    stage         = Stage::Exchange;
    auto response = co_await exchange(ssl_stream, Url::request_target(target), target, headers);

    // Servers routinely close without close_notify once the body is sent.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Egress
