#include "dispatch_engine.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/logger/logger.hpp"

namespace Egress {
namespace Dispatch {

using namespace Egress::Core;
namespace net = boost::asio;

bool DispatchEngine::CallState::stopped() const {
    if (cancel && cancel->cancelled())
        return true;
    return Clock::now() >= deadline;
}

std::chrono::milliseconds DispatchEngine::CallState::clamp(std::chrono::milliseconds wanted) const {
    if (deadline == Clock::time_point::max())
        return wanted;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
    if (left < std::chrono::milliseconds(1))
        left = std::chrono::milliseconds(1);
    return std::min(wanted, left);
}

DispatchEngine::DispatchEngine(ProxyPool&       pool,
                               Selector&        selector,
                               HeaderGenerator& headers,
                               ClientFactory    client_factory,
                               DispatchSettings settings)
    : pool_(pool),
      selector_(selector),
      headers_(headers),
      client_factory_(std::move(client_factory)),
      settings_(settings),
      rng_(settings.seed ? settings.seed : std::random_device{}()) {
}

DispatchCounters DispatchEngine::counters() const {
    DispatchCounters out;
    out.requests        = requests_.load();
    out.attempts        = attempts_.load();
    out.successful      = successful_.load();
    out.failed          = failed_.load();
    out.direct_attempts = direct_attempts_.load();
    return out;
}

ErrorKind DispatchEngine::classify(const Response& response) {
    if (response.success)
        return ErrorKind::None;
    if (response.error_type == ErrorType::Timeout)
        return ErrorKind::AttemptTimeout;
    if (response.error_type == ErrorType::Cancelled)
        return ErrorKind::Cancelled;
    if (response.error_type == ErrorType::None && response.status_code != 0)
        return ErrorKind::AttemptNonSuccessStatus;
    return ErrorKind::AttemptConnectionError;
}

std::chrono::milliseconds DispatchEngine::next_backoff() {
    if (settings_.backoff_max <= settings_.backoff_min)
        return settings_.backoff_min;

    std::lock_guard<std::mutex>        lock(rng_mutex_);
    std::uniform_int_distribution<long> dist(static_cast<long>(settings_.backoff_min.count()),
                                             static_cast<long>(settings_.backoff_max.count()));
    return std::chrono::milliseconds(dist(rng_));
}

net::awaitable<void> DispatchEngine::sleep_for(std::chrono::milliseconds delay,
                                               const CallState&          call) {
    if (delay.count() <= 0)
        co_return;
    auto timer = std::make_shared<net::steady_timer>(co_await net::this_coro::executor);
    timer->expires_after(delay);

    auto registration = on_cancel(call.cancel, [timer]() {
        net::post(timer->get_executor(), [timer]() { timer->cancel(); });
    });
    boost::system::error_code ec;
    co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
}

net::awaitable<void> DispatchEngine::execute(HttpClient& client, DispatchAttempt& attempt) {
    attempts_++;
    if (!attempt.proxy)
        direct_attempts_++;

    try {
        client.set_proxy(attempt.proxy ? attempt.proxy->endpoint.url() : "");
        client.set_timeout(attempt.timeout);
        attempt.outcome = co_await client.get(attempt.url, headers_.generate());
    } catch (const std::exception& e) {
        attempt.outcome            = Response{};
        attempt.outcome.error      = e.what();
        attempt.outcome.error_type = ErrorType::Other;
    }

    attempt.error = classify(attempt.outcome);
    if (attempt.outcome.success)
        successful_++;
    else
        failed_++;
}

DispatchResult DispatchEngine::success_result(const DispatchAttempt& attempt,
                                              int                    attempts,
                                              bool                   degraded) const {
    DispatchResult result;
    result.success     = true;
    result.status_code = attempt.outcome.status_code;
    result.body        = attempt.outcome.body;
    result.attempts    = attempts;
    result.direct      = !attempt.proxy;
    result.proxy       = attempt.proxy ? attempt.proxy->endpoint.url() : "";
    result.degraded    = degraded;
    return result;
}

DispatchResult DispatchEngine::failure_result(ErrorKind              kind,
                                              const DispatchAttempt* last,
                                              int                    attempts,
                                              bool                   degraded) const {
    DispatchResult result;
    result.success    = false;
    result.error_kind = kind;
    result.attempts   = attempts;
    result.degraded   = degraded;
    if (last) {
        result.last_cause  = last->error;
        result.error       = last->outcome.error;
        result.status_code = last->outcome.status_code;
        result.body        = last->outcome.body;
        result.direct      = !last->proxy;
        result.proxy       = last->proxy ? last->proxy->endpoint.url() : "";
    }
    else if (degraded) {
        result.last_cause = ErrorKind::ProxyUnavailable;
    }
    if (result.error.empty())
        result.error = to_string(kind);
    return result;
}

net::awaitable<DispatchResult> DispatchEngine::fetch(std::string url, FetchOptions options) {
    requests_++;

    CallState call;
    call.cancel   = options.cancel;
    call.deadline = options.budget.count() > 0 ? Clock::now() + options.budget
                                               : Clock::time_point::max();

    const int max_attempts = std::max(0, options.max_attempts.value_or(settings_.max_attempts));
    auto      client       = client_factory_();

    // Aborts whichever attempt is in flight when the caller cancels.
    auto registration = on_cancel(call.cancel, [raw = client.get()]() { raw->cancel(); });

    std::optional<DispatchAttempt> last;
    int                            attempts = 0;
    bool                           degraded = false;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (call.stopped()) {
            co_return failure_result(
                ErrorKind::Cancelled, last ? &*last : nullptr, attempts, degraded);
        }

        auto proxy = selector_.next();
        if (!proxy) {
            degraded = true;
            Logger::warn("No proxy available for " + url + ", falling back to direct");
            break;
        }

        last.emplace(DispatchAttempt{url, proxy, call.clamp(settings_.attempt_timeout), {}});
        co_await execute(*client, *last);
        ++attempts;

        // A timeout forced by the caller's budget says nothing about the proxy.
        if (last->outcome.success || !call.stopped())
            pool_.record_outcome(proxy->endpoint, last->outcome.success, OutcomeSource::Live);

        if (last->outcome.success) {
            Logger::info("Request succeeded via " + proxy->endpoint.url() + ": " + url);
            co_return success_result(*last, attempts, degraded);
        }

        if (call.stopped()) {
            Logger::warn("Request cancelled during attempt via " + proxy->endpoint.url() + ": "
                         + url);
            co_return failure_result(ErrorKind::Cancelled, &*last, attempts, degraded);
        }

        Logger::warn("Attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts)
                     + " via " + proxy->endpoint.url() + " failed ("
                     + to_string(last->error) + "): " + last->outcome.error);

        co_await sleep_for(call.clamp(next_backoff()), call);
    }

    if (call.stopped()) {
        co_return failure_result(
            ErrorKind::Cancelled, last ? &*last : nullptr, attempts, degraded);
    }

    Logger::info("Attempting direct connection: " + url);
    last.emplace(DispatchAttempt{url, std::nullopt, call.clamp(settings_.attempt_timeout), {}});
    co_await execute(*client, *last);
    ++attempts;

    if (last->outcome.success)
        co_return success_result(*last, attempts, degraded);

    if (call.stopped())
        co_return failure_result(ErrorKind::Cancelled, &*last, attempts, degraded);

    Logger::error("Direct connection also failed (" + std::string(to_string(last->error))
                  + "): " + url + " - " + last->outcome.error);
    co_return failure_result(ErrorKind::AllAttemptsExhausted, &*last, attempts, degraded);
}

}  // namespace Dispatch
}  // namespace Egress
