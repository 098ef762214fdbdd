#pragma once
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <optional>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../network/http/header_generator.hpp"
#include "../../network/http/http_client.hpp"
#include "../pool/proxy_pool.hpp"

namespace Egress {
namespace Proxy {
namespace Probe {

using Egress::Network::Http::ClientFactory;
using Egress::Network::Http::HeaderGenerator;
using Egress::Proxy::Pool::ProxyEndpoint;
using Egress::Proxy::Pool::ProxyPool;

struct ProbeSettings {
    std::string               probe_url        = Core::Constants::DEFAULT_PROBE_URL;
    size_t                    fast_start_count = Core::Constants::DEFAULT_FAST_START_COUNT;
    std::chrono::milliseconds fast_start_timeout{Core::Constants::DEFAULT_FAST_START_TIMEOUT_MS};
    std::chrono::milliseconds sweep_timeout{Core::Constants::DEFAULT_SWEEP_TIMEOUT_MS};
    std::chrono::milliseconds sweep_delay{Core::Constants::DEFAULT_SWEEP_DELAY_MS};
    std::chrono::milliseconds sweep_idle{Core::Constants::DEFAULT_SWEEP_IDLE_MS};
};

// The background sweep re-tests every candidate that is not Working.
class HealthProber {
public:
    HealthProber(ProxyPool&       pool,
                 HeaderGenerator& headers,
                 ClientFactory    client_factory,
                 ProbeSettings    settings = {});
    ~HealthProber();

    HealthProber(const HealthProber&)            = delete;
    HealthProber& operator=(const HealthProber&) = delete;

    // True only for HTTP 200 from the probe target within `timeout`.
    boost::asio::awaitable<bool> probe(ProxyEndpoint endpoint, std::chrono::milliseconds timeout);

    boost::asio::awaitable<bool> probe_and_record(ProxyEndpoint             endpoint,
                                                  std::chrono::milliseconds timeout);

    // Blocks until the first fast_start_count candidates are probed. Must not
    // run on a thread of `executor`.
    size_t fast_start(const boost::asio::any_io_executor& executor);

    // Runs one pass over every non-Working candidate. Returns how many passed.
    boost::asio::awaitable<size_t> sweep_once();

    // Spawns the background sweep on a strand of `executor`.
    void start(const boost::asio::any_io_executor& executor);
    void stop();

    bool running() const {
        return running_.load();
    }

    size_t completed_sweeps() const {
        return sweeps_.load();
    }

private:
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    ProxyPool&       pool_;
    HeaderGenerator& headers_;
    ClientFactory    client_factory_;
    ProbeSettings    settings_;

    std::optional<Strand>                    strand_;
    std::optional<boost::asio::steady_timer> timer_;

    std::atomic<bool>   stopping_{false};
    std::atomic<bool>   running_{false};
    std::atomic<size_t> sweeps_{0};

    boost::asio::awaitable<void> sweep_loop();
    boost::asio::awaitable<void> pause(std::chrono::milliseconds delay);
};

}  // namespace Probe
}  // namespace Proxy
}  // namespace Egress
