#include "egress/gateway.hpp"
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../core/config/config.hpp"
#include "../core/logger/logger.hpp"
#include "../dispatch/dispatch_engine.hpp"
#include "../network/http/beast_client.hpp"
#include "../network/http/curl_client.hpp"
#include "../proxy/probe/health_prober.hpp"
#include "../utils/url/url.hpp"

namespace Egress {

using namespace Egress::Core;
using namespace Egress::Dispatch;
using Egress::Proxy::Probe::HealthProber;
using Egress::Proxy::Probe::ProbeSettings;
namespace net = boost::asio;

namespace {

std::string iso_timestamp() {
    auto        now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm     tm{};
    char        buffer[32];
    gmtime_r(&now, &tm);
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

DispatchSettings dispatch_settings(const Config& config) {
    DispatchSettings settings;
    settings.max_attempts    = config.max_attempts;
    settings.attempt_timeout = std::chrono::milliseconds(config.attempt_timeout_ms);
    settings.backoff_min     = std::chrono::milliseconds(config.backoff_min_ms);
    settings.backoff_max     = std::chrono::milliseconds(config.backoff_max_ms);
    return settings;
}

ProbeSettings probe_settings(const Config& config) {
    ProbeSettings settings;
    settings.probe_url          = config.probe_url;
    settings.fast_start_count   = static_cast<size_t>(std::max(0, config.fast_start_count));
    settings.fast_start_timeout = std::chrono::milliseconds(config.fast_start_timeout_ms);
    settings.sweep_timeout      = std::chrono::milliseconds(config.sweep_timeout_ms);
    settings.sweep_delay        = std::chrono::milliseconds(config.sweep_delay_ms);
    settings.sweep_idle         = std::chrono::milliseconds(config.sweep_idle_ms);
    return settings;
}

}  // namespace

struct Gateway::Impl {
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    Config config;

    net::io_context   ioc;
    net::thread_pool  blocking_pool;
    std::unique_ptr<WorkGuard> work_guard;
    std::vector<std::thread>   io_threads;

    ProxyPool                 pool;
    Selector                  selector;
    HeaderGenerator           headers;
    std::unique_ptr<DispatchEngine> engine;
    std::unique_ptr<HealthProber>   prober;

    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
    std::atomic<bool> started{false};
    std::atomic<bool> stopped{false};

    explicit Impl(const Config& cfg)
        : config(cfg),
          blocking_pool(static_cast<size_t>(std::max(1, cfg.threads))),
          pool(EvictionPolicy{cfg.min_samples, cfg.failure_floor}),
          selector(pool),
          headers(cfg.user_agents) {
        ClientFactory factory;
        if (config.transport == "curl") {
            factory = [this]() { return std::make_unique<CurlClient>(blocking_pool); };
        } else {
            factory = []() { return std::make_unique<BeastClient>(); };
        }

        engine = std::make_unique<DispatchEngine>(
            pool, selector, headers, factory, dispatch_settings(config));
        prober = std::make_unique<HealthProber>(pool, headers, factory, probe_settings(config));

        init_io_services();
    }

    void init_io_services() {
        work_guard = std::make_unique<WorkGuard>(ioc.get_executor());
        const int threads = std::max(1, config.threads);
        for (int i = 0; i < threads; ++i) {
            io_threads.emplace_back([this]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    Logger::error("IO Thread Exception: " + std::string(e.what()));
                }
            });
        }
        Logger::info("Started " + std::to_string(threads) + " IO threads.");
    }

    void seed() {
        std::vector<ProxyEndpoint> endpoints;
        endpoints.reserve(config.proxies.size());
        for (const auto& address : config.proxies)
            endpoints.push_back(ProxyEndpoint::parse(address));
        size_t added = pool.add_candidates(endpoints);
        Logger::info("Loaded " + std::to_string(added) + " proxies into the pool");
    }

    DispatchResult dispatch(const std::string& url) {
        if (stopped)
            throw std::runtime_error("Gateway is stopped");

        FetchOptions options;
        options.budget = std::chrono::milliseconds(std::max(0, config.budget_ms));

        // Cancellation hooks post to the attempt's executor; keep it serialized.
        auto future =
            net::co_spawn(net::make_strand(ioc), engine->fetch(url, options), net::use_future);
        try {
            return future.get();
        } catch (const std::exception& e) {
            Logger::error("Dispatch aborted for " + url + ": " + e.what());
            DispatchResult result;
            result.error_kind = ErrorKind::AllAttemptsExhausted;
            result.error      = e.what();
            return result;
        }
    }

    void shutdown() {
        if (stopped.exchange(true))
            return;

        Logger::info("Shutting down gateway...");
        prober->stop();
        work_guard.reset();
        ioc.stop();

        for (auto& t : io_threads) {
            if (t.get_id() == std::this_thread::get_id())
                continue;
            if (t.joinable())
                t.join();
        }
        io_threads.clear();

        blocking_pool.stop();
        blocking_pool.join();
        Logger::success("Shutdown complete.");
    }
};

Gateway::Gateway(const Config& config) : impl_(std::make_unique<Impl>(config)) {
}

Gateway::~Gateway() {
    stop();
}

void Gateway::start() {
    if (impl_->stopped)
        throw std::runtime_error("Gateway is stopped");
    if (impl_->started.exchange(true))
        return;

    impl_->seed();
    if (impl_->config.no_probe || impl_->pool.empty())
        return;

    impl_->prober->fast_start(impl_->ioc.get_executor());
    impl_->prober->start(impl_->ioc.get_executor());
}

void Gateway::stop() {
    impl_->shutdown();
}

DispatchResult Gateway::read(const std::string& url) {
    if (!Utils::Url::is_http_url(url))
        throw std::invalid_argument("URL must start with http:// or https://");
    return impl_->dispatch(impl_->config.reader_url + url);
}

DispatchResult Gateway::search(const std::string& query) {
    if (is_blank(query))
        throw std::invalid_argument("Search query must not be empty");
    return impl_->dispatch(impl_->config.search_url + "?q="
                           + Utils::Url::encode_query_component(query));
}

DispatchResult Gateway::fetch(const std::string& url) {
    if (!Utils::Url::is_http_url(url))
        throw std::invalid_argument("URL must start with http:// or https://");
    return impl_->dispatch(url);
}

GatewayStats Gateway::stats() const {
    GatewayStats out;
    out.pool           = impl_->pool.snapshot_stats();
    out.dispatch       = impl_->engine->counters();
    out.uptime_seconds = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now()
                                                         - impl_->started_at)
            .count());
    if (out.pool.total_candidates > 0) {
        out.proxy_health = static_cast<double>(out.pool.working_count)
                           / static_cast<double>(out.pool.total_candidates) * 100.0;
    }
    out.status = out.pool.working_count > 0 ? "healthy" : "degraded";
    return out;
}

std::string Gateway::health() const {
    return impl_->pool.snapshot_stats().working_count > 0 ? "healthy" : "degraded";
}

std::string to_json(const DispatchResult& result, const std::string& source) {
    nlohmann::json j = {{"success", result.success},
                        {"status_code", result.status_code},
                        {"content", result.body},
                        {"attempts", result.attempts},
                        {"direct", result.direct},
                        {"degraded", result.degraded},
                        {"source", source},
                        {"timestamp", iso_timestamp()}};
    if (!result.proxy.empty())
        j["proxy"] = result.proxy;
    if (!result.success) {
        j["error_kind"] = to_string(result.error_kind);
        j["last_cause"] = to_string(result.last_cause);
        j["error"]      = result.error;
    }
    return j.dump(2);
}

std::string to_json(const GatewayStats& stats) {
    nlohmann::json j = {
        {"status", stats.status},
        {"uptime_seconds", stats.uptime_seconds},
        {"proxy_health", stats.proxy_health},
        {"pool",
         {{"total", stats.pool.total_candidates},
          {"working", stats.pool.working_count},
          {"failed", stats.pool.failed_count},
          {"untested", stats.pool.untested_count},
          {"total_attempts", stats.pool.total_attempts},
          {"successful_attempts", stats.pool.successful_attempts},
          {"failed_attempts", stats.pool.failed_attempts}}},
        {"requests",
         {{"total", stats.dispatch.requests},
          {"attempts", stats.dispatch.attempts},
          {"successful", stats.dispatch.successful},
          {"failed", stats.dispatch.failed},
          {"direct", stats.dispatch.direct_attempts}}},
        {"timestamp", iso_timestamp()}};
    return j.dump(2);
}

}  // namespace Egress
