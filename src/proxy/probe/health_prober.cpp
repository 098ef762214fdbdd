#include "health_prober.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <future>
#include <vector>
#include "../../core/logger/logger.hpp"

namespace Egress {
namespace Proxy {
namespace Probe {

using namespace Egress::Core;
using Egress::Proxy::Pool::Classification;
using Egress::Proxy::Pool::OutcomeSource;
namespace net = boost::asio;

HealthProber::HealthProber(ProxyPool&       pool,
                           HeaderGenerator& headers,
                           ClientFactory    client_factory,
                           ProbeSettings    settings)
    : pool_(pool),
      headers_(headers),
      client_factory_(std::move(client_factory)),
      settings_(std::move(settings)) {
}

HealthProber::~HealthProber() {
    stopping_ = true;
}

net::awaitable<bool> HealthProber::probe(ProxyEndpoint             endpoint,
                                         std::chrono::milliseconds timeout) {
    Network::Http::Response response;
    try {
        auto client = client_factory_();
        client->set_proxy(endpoint.url());
        client->set_timeout(timeout);
        response = co_await client->get(settings_.probe_url, headers_.generate());
    } catch (const std::exception& e) {
        response.success = false;
        response.error   = e.what();
    }

    if (!response.success) {
        Logger::debug("Probe failed for " + endpoint.url() + ": " + response.error);
    }
    co_return response.success;
}

net::awaitable<bool> HealthProber::probe_and_record(ProxyEndpoint             endpoint,
                                                    std::chrono::milliseconds timeout) {
    bool ok = co_await probe(endpoint, timeout);
    pool_.record_outcome(endpoint, ok, OutcomeSource::Probe);
    co_return ok;
}

size_t HealthProber::fast_start(const net::any_io_executor& executor) {
    auto records = pool_.records();
    if (records.size() > settings_.fast_start_count)
        records.resize(settings_.fast_start_count);
    if (records.empty())
        return 0;

    Logger::info("Fast-start: probing " + std::to_string(records.size()) + " of "
                 + std::to_string(pool_.size()) + " proxies");

    std::vector<std::future<bool>> pending;
    pending.reserve(records.size());
    for (const auto& record : records) {
        pending.push_back(net::co_spawn(executor,
                                        probe_and_record(record.endpoint,
                                                         settings_.fast_start_timeout),
                                        net::use_future));
    }

    size_t passed = 0;
    for (auto& result : pending) {
        try {
            if (result.get())
                ++passed;
        } catch (const std::exception& e) {
            Logger::error("Fast-start probe aborted: " + std::string(e.what()));
        }
    }

    Logger::info("Fast-start: " + std::to_string(passed) + "/" + std::to_string(records.size())
                 + " proxies working");
    return passed;
}

net::awaitable<void> HealthProber::pause(std::chrono::milliseconds delay) {
    if (delay.count() <= 0 || stopping_)
        co_return;

    if (timer_) {
        timer_->expires_after(delay);
        boost::system::error_code ec;
        co_await timer_->async_wait(net::redirect_error(net::use_awaitable, ec));
        co_return;
    }

    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(delay);
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
}

net::awaitable<size_t> HealthProber::sweep_once() {
    auto   candidates = pool_.needs_probe();
    size_t passed     = 0;
    size_t recovered  = 0;

    for (size_t i = 0; i < candidates.size() && !stopping_; ++i) {
        const auto& record = candidates[i];
        if (co_await probe_and_record(record.endpoint, settings_.sweep_timeout)) {
            ++passed;
            if (record.classification == Classification::Failed)
                ++recovered;
        }
        if (i + 1 < candidates.size())
            co_await pause(settings_.sweep_delay);
    }

    if (!candidates.empty()) {
        Logger::info("Sweep: " + std::to_string(passed) + "/" + std::to_string(candidates.size())
                     + " passed, " + std::to_string(recovered) + " recovered");
    }
    co_return passed;
}

net::awaitable<void> HealthProber::sweep_loop() {
    Logger::info("Health prober: background sweep started");
    while (!stopping_) {
        co_await sweep_once();
        sweeps_++;
        co_await pause(settings_.sweep_idle);
    }
    Logger::info("Health prober: background sweep stopped");
}

void HealthProber::start(const net::any_io_executor& executor) {
    if (running_.exchange(true))
        return;

    stopping_ = false;
    strand_.emplace(net::make_strand(executor));
    timer_.emplace(*strand_);

    net::co_spawn(*strand_, sweep_loop(), [this](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                Logger::error("Health prober terminated: " + std::string(ex.what()));
            }
        }
        running_ = false;
    });
}

void HealthProber::stop() {
    if (stopping_.exchange(true))
        return;
    if (strand_ && timer_) {
        net::post(*strand_, [this]() { timer_->cancel(); });
    }
}

}  // namespace Probe
}  // namespace Proxy
}  // namespace Egress
