#pragma once
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>

#include "http_client.hpp"

namespace Egress {
namespace Network {
namespace Http {

/**
 * @brief libcurl transport.
 *
 * curl_easy_perform blocks, so each request runs on the supplied thread pool
 * and the awaiting coroutine resumes on its own executor afterwards. cancel()
 * is picked up by the progress callback, which libcurl calls at least once a
 * second while a transfer is open.
 */
class CurlClient : public HttpClient {
public:
    explicit CurlClient(boost::asio::thread_pool& blocking_pool);
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_proxy(const std::string& proxy) override;
    void set_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string& url, const Headers& headers) override;
    void cancel() override;

    // Blocking variant, used by get() on the pool.
    Response perform(const std::string& url, const Headers& headers);

private:
    struct RequestContext {
        std::string*             body         = nullptr;
        std::string*             content_type = nullptr;
        const std::atomic<bool>* aborted      = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    using HeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

    boost::asio::thread_pool&          blocking_pool_;
    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        proxy_;
    std::chrono::milliseconds          timeout_{30000};
    std::atomic<bool>                  aborted_{false};

    Response   create_error_response(const std::string& url, const std::string& msg) const;
    HeaderList build_header_list(const Headers& headers) const;
    void       setup_curl_options(CURL*              curl,
                                  const std::string& url,
                                  RequestContext&    ctx,
                                  curl_slist*        header_list) const;
    Response   handle_response(CURLcode           res,
                               long               response_code,
                               const std::string& effective_url,
                               std::string&       body,
                               std::string&       content_type) const;
    ErrorType  map_curl_code(CURLcode code) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int    progress_callback(void*      userp,
                                    curl_off_t dltotal,
                                    curl_off_t dlnow,
                                    curl_off_t ultotal,
                                    curl_off_t ulnow);
};

}  // namespace Http
}  // namespace Network
}  // namespace Egress
