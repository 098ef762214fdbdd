#pragma once
#include <atomic>
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "../core/types/constants.hpp"
#include "../network/http/header_generator.hpp"
#include "../network/http/http_client.hpp"
#include "../proxy/pool/proxy_pool.hpp"
#include "../proxy/pool/selector.hpp"
#include "cancellation.hpp"
#include "egress/types.hpp"

namespace Egress {
namespace Dispatch {

using namespace Egress::Proxy::Pool;
using namespace Egress::Network::Http;

struct DispatchSettings {
    int                       max_attempts = Core::Constants::DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds attempt_timeout{Core::Constants::DEFAULT_ATTEMPT_TIMEOUT_MS};
    std::chrono::milliseconds backoff_min{Core::Constants::DEFAULT_BACKOFF_MIN_MS};
    std::chrono::milliseconds backoff_max{Core::Constants::DEFAULT_BACKOFF_MAX_MS};
    unsigned int              seed = 0;  // 0 = random
};

struct FetchOptions {
    std::optional<int>                 max_attempts;  // Overrides DispatchSettings
    std::chrono::milliseconds          budget{0};     // 0 = unlimited
    std::shared_ptr<CancellationToken> cancel;
};

class DispatchEngine {
public:
    DispatchEngine(ProxyPool&       pool,
                   Selector&        selector,
                   HeaderGenerator& headers,
                   ClientFactory    client_factory,
                   DispatchSettings settings = {});

    DispatchEngine(const DispatchEngine&)            = delete;
    DispatchEngine& operator=(const DispatchEngine&) = delete;

    /**
     * @brief Fetches `url` through the pool, then directly as a last resort.
     *
     * Never throws for transport failures. The result is a success on the
     * first HTTP 200, AllAttemptsExhausted when the direct attempt also fails,
     * or Cancelled when the budget runs out or the token is cancelled. A
     * cancel aborts the attempt in flight.
     */
    boost::asio::awaitable<DispatchResult> fetch(std::string url, FetchOptions options = {});

    DispatchCounters counters() const;

    const DispatchSettings& settings() const {
        return settings_;
    }

private:
    using Clock = std::chrono::steady_clock;

    // One try, proxied or direct. Lives for the duration of the attempt.
    struct DispatchAttempt {
        std::string                url;
        std::optional<ProxyRecord> proxy;
        std::chrono::milliseconds  timeout;
        Response                   outcome;
        ErrorKind                  error = ErrorKind::None;
    };

    // Per-call deadline and cancellation.
    struct CallState {
        Clock::time_point                  deadline;
        std::shared_ptr<CancellationToken> cancel;

        bool                      stopped() const;
        std::chrono::milliseconds clamp(std::chrono::milliseconds wanted) const;
    };

    ProxyPool&       pool_;
    Selector&        selector_;
    HeaderGenerator& headers_;
    ClientFactory    client_factory_;
    DispatchSettings settings_;

    std::mt19937 rng_;
    std::mutex   rng_mutex_;

    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> attempts_{0};
    std::atomic<std::uint64_t> successful_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> direct_attempts_{0};

    boost::asio::awaitable<void> execute(HttpClient& client, DispatchAttempt& attempt);
    // Returns early when the call's token is cancelled.
    boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds delay,
                                           const CallState&          call);

    std::chrono::milliseconds next_backoff();
    static ErrorKind          classify(const Response& response);

    DispatchResult success_result(const DispatchAttempt& attempt, int attempts, bool degraded) const;
    DispatchResult failure_result(ErrorKind              kind,
                                  const DispatchAttempt* last,
                                  int                    attempts,
                                  bool                   degraded) const;
};

}  // namespace Dispatch
}  // namespace Egress
