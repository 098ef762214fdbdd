#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Egress {
namespace Core {

struct Config {
    std::string              command;
    std::vector<std::string> args;
    std::string              config_path;

    std::vector<std::string> proxies;
    std::vector<std::string> user_agents;

    int threads      = Constants::DEFAULT_THREADS;
    int max_attempts = Constants::DEFAULT_MAX_ATTEMPTS;

    int attempt_timeout_ms = Constants::DEFAULT_ATTEMPT_TIMEOUT_MS;
    int budget_ms          = 0;  // 0 = unlimited
    int backoff_min_ms     = Constants::DEFAULT_BACKOFF_MIN_MS;
    int backoff_max_ms     = Constants::DEFAULT_BACKOFF_MAX_MS;

    std::string probe_url             = Constants::DEFAULT_PROBE_URL;
    int         fast_start_count      = Constants::DEFAULT_FAST_START_COUNT;
    int         fast_start_timeout_ms = Constants::DEFAULT_FAST_START_TIMEOUT_MS;
    int         sweep_timeout_ms      = Constants::DEFAULT_SWEEP_TIMEOUT_MS;
    int         sweep_delay_ms        = Constants::DEFAULT_SWEEP_DELAY_MS;
    int         sweep_idle_ms         = Constants::DEFAULT_SWEEP_IDLE_MS;
    bool        no_probe              = false;

    int    min_samples   = Constants::DEFAULT_MIN_SAMPLES;
    double failure_floor = Constants::DEFAULT_FAILURE_FLOOR;

    std::string reader_url = Constants::DEFAULT_READER_URL;
    std::string search_url = Constants::DEFAULT_SEARCH_URL;
    std::string transport  = Constants::DEFAULT_TRANSPORT;
    std::string log_level  = "info";

    static Config parse(int argc, char* argv[]);

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;
};

void load_yaml(Config& config, const std::string& path);

std::vector<std::string> read_proxy_list(const std::string& path);

}  // namespace Core
}  // namespace Egress
