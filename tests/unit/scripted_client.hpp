#pragma once
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../src/network/http/http_client.hpp"

namespace Egress {
namespace Testing {

using namespace Egress::Network::Http;

enum class Behavior { Ok, ServiceUnavailable, Refused, Hang };

/**
 * In-memory transport. Each proxy URL ("" for direct) is scripted with a
 * behavior; every call is recorded.
 */
struct Script {
    struct Call {
        std::string proxy;
        std::string url;
        std::string user_agent;
    };

    std::mutex                      mutex;
    std::map<std::string, Behavior> by_proxy;
    Behavior                        fallback = Behavior::Refused;
    std::vector<Call>               calls;

    void set(const std::string& proxy, Behavior behavior) {
        std::lock_guard<std::mutex> lock(mutex);
        by_proxy[proxy] = behavior;
    }

    std::vector<Call> recorded() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

    size_t count(const std::string& proxy) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t                      n = 0;
        for (const auto& call : calls) {
            if (call.proxy == proxy)
                ++n;
        }
        return n;
    }
};

class ScriptedClient : public HttpClient {
public:
    explicit ScriptedClient(std::shared_ptr<Script> script) : script_(std::move(script)) {
    }

    void set_proxy(const std::string& proxy) override {
        proxy_ = proxy;
    }

    void set_timeout(std::chrono::milliseconds timeout) override {
        timeout_ = timeout;
    }

    boost::asio::awaitable<Response> get(const std::string& url, const Headers& headers) override {
        Behavior behavior = script_->fallback;
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            std::string                 agent;
            for (const auto& header : headers) {
                if (header.name == "User-Agent")
                    agent = header.value;
            }
            script_->calls.push_back({proxy_, url, agent});
            auto it = script_->by_proxy.find(proxy_);
            if (it != script_->by_proxy.end())
                behavior = it->second;
        }

        Response response;
        response.effective_url = url;
        switch (behavior) {
            case Behavior::Ok:
                response.status_code = 200;
                response.success     = true;
                response.body        = "ok via " + (proxy_.empty() ? std::string("direct") : proxy_);
                break;
            case Behavior::ServiceUnavailable:
                response.status_code = 503;
                response.body        = "busy";
                response.error       = "HTTP 503";
                break;
            case Behavior::Refused:
                response.error_type = ErrorType::Network;
                response.error      = "Connection refused";
                break;
            case Behavior::Hang: {
                auto timer = std::make_shared<boost::asio::steady_timer>(
                    co_await boost::asio::this_coro::executor);
                timer->expires_after(timeout_);
                {
                    std::lock_guard<std::mutex> lock(abort_->mutex);
                    if (abort_->requested)
                        timer->expires_after(std::chrono::milliseconds(0));
                    abort_->timer = timer;
                }
                boost::system::error_code ec;
                co_await timer->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                {
                    std::lock_guard<std::mutex> lock(abort_->mutex);
                    abort_->timer.reset();
                    if (abort_->requested) {
                        response.error_type = ErrorType::Cancelled;
                        response.error      = "Request cancelled";
                        break;
                    }
                }
                response.error_type = ErrorType::Timeout;
                response.error      = "Operation timed out";
                break;
            }
        }
        co_return response;
    }

    void cancel() override {
        std::lock_guard<std::mutex> lock(abort_->mutex);
        abort_->requested = true;
        if (!abort_->timer)
            return;
        boost::asio::post(abort_->timer->get_executor(),
                          [timer = abort_->timer]() { timer->cancel(); });
    }

private:
    struct AbortState {
        std::mutex                                 mutex;
        bool                                       requested = false;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    std::shared_ptr<AbortState> abort_ = std::make_shared<AbortState>();
    std::shared_ptr<Script>     script_;
    std::string                 proxy_;
    std::chrono::milliseconds   timeout_{30000};
};

inline ClientFactory scripted_factory(std::shared_ptr<Script> script) {
    return [script]() { return std::make_unique<ScriptedClient>(script); };
}

// Runs one coroutine to completion on a private io_context.
template <typename T>
T run_sync(boost::asio::awaitable<T> task) {
    boost::asio::io_context ioc;
    auto future = boost::asio::co_spawn(ioc, std::move(task), boost::asio::use_future);
    ioc.run();
    return future.get();
}

}  // namespace Testing
}  // namespace Egress
