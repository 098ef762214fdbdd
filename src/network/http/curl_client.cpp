#include "curl_client.hpp"
#include <algorithm>
#include <cctype>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <string_view>

namespace Egress {
namespace Network {
namespace Http {

namespace net = boost::asio;

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

static inline std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return size * nitems;

    std::string_view header(buffer, size * nitems);
    if (istarts_with(header, CONTENT_TYPE_HEADER)) {
        *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    }
    return size * nitems;
}

int CurlClient::progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (ctx && ctx->aborted && ctx->aborted->load(std::memory_order_acquire))
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    return 0;
}

CurlClient::CurlClient(net::thread_pool& blocking_pool)
    : blocking_pool_(blocking_pool), curl_(curl_easy_init()) {
}

void CurlClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void CurlClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void CurlClient::cancel() {
    aborted_.store(true, std::memory_order_release);
}

Response CurlClient::create_error_response(const std::string& url, const std::string& msg) const {
    Response r;
    r.effective_url = url;
    r.success       = false;
    r.error         = msg;
    r.error_type    = ErrorType::Other;
    r.status_code   = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

ErrorType CurlClient::map_curl_code(CURLcode code) const {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_ABORTED_BY_CALLBACK: return ErrorType::Cancelled;
        case CURLE_COULDNT_RESOLVE_PROXY: return ErrorType::Proxy;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE: return ErrorType::Tls;
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
            return proxy_.empty() ? ErrorType::Network : ErrorType::Proxy;
        default: return ErrorType::Network;
    }
}

CurlClient::HeaderList CurlClient::build_header_list(const Headers& headers) const {
    curl_slist* raw = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(raw, (h.name + ": " + h.value).c_str());
        if (!next)
            break;
        raw = next;
    }
    return HeaderList(raw);
}

void CurlClient::setup_curl_options(CURL*              curl,
                                    const std::string& url,
                                    RequestContext&    ctx,
                                    curl_slist*        header_list) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));

    // An empty string disables proxy environment variables as well.
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());

    if (header_list)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
}

Response CurlClient::handle_response(CURLcode           res,
                                     long               response_code,
                                     const std::string& effective_url,
                                     std::string&       body,
                                     std::string&       content_type) const {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;
    response.content_type  = content_type;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = (response.status_code == static_cast<long>(HTTPCode::Ok));
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

Response CurlClient::perform(const std::string& url, const Headers& headers) {
    if (!curl_)
        return create_error_response(url, "Failed to initialize CURL handle");

    if (aborted_.load(std::memory_order_acquire)) {
        auto response       = create_error_response(url, "Request cancelled");
        response.error_type = ErrorType::Cancelled;
        return response;
    }

    std::string    body_buffer;
    std::string    content_type;
    RequestContext ctx{&body_buffer, &content_type, &aborted_};
    HeaderList     header_list = build_header_list(headers);

    setup_curl_options(curl_.get(), url, ctx, header_list.get());
    CURLcode res = curl_easy_perform(curl_.get());

    long response_code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    std::string effective_url = eff_url_ptr ? std::string(eff_url_ptr) : url;

    return handle_response(res, response_code, effective_url, body_buffer, content_type);
}

net::awaitable<Response> CurlClient::get(const std::string& url, const Headers& headers) {
    co_return co_await net::co_spawn(
        blocking_pool_,
        [this, url, headers]() -> net::awaitable<Response> { co_return perform(url, headers); },
        net::use_awaitable);
}

}  // namespace Http
}  // namespace Network
}  // namespace Egress
