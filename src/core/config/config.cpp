#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Egress {
namespace Core {

namespace {

template <typename T>
void read_key(const YAML::Node& yaml, const char* key, T& out) {
    if (yaml[key])
        out = yaml[key].as<T>();
}

std::string trim(const std::string& line) {
    size_t first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

}  // namespace

std::vector<std::string> read_proxy_list(const std::string& path) {
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Cannot open proxy list: " + path);

    std::vector<std::string> proxies;
    std::string              line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (!line.empty())
            proxies.push_back(line);
    }
    return proxies;
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        read_key(yaml, "threads", config.threads);
        read_key(yaml, "max_attempts", config.max_attempts);
        read_key(yaml, "attempt_timeout_ms", config.attempt_timeout_ms);
        read_key(yaml, "budget_ms", config.budget_ms);
        read_key(yaml, "backoff_min_ms", config.backoff_min_ms);
        read_key(yaml, "backoff_max_ms", config.backoff_max_ms);
        read_key(yaml, "probe_url", config.probe_url);
        read_key(yaml, "fast_start_count", config.fast_start_count);
        read_key(yaml, "fast_start_timeout_ms", config.fast_start_timeout_ms);
        read_key(yaml, "sweep_timeout_ms", config.sweep_timeout_ms);
        read_key(yaml, "sweep_delay_ms", config.sweep_delay_ms);
        read_key(yaml, "sweep_idle_ms", config.sweep_idle_ms);
        read_key(yaml, "no_probe", config.no_probe);
        read_key(yaml, "min_samples", config.min_samples);
        read_key(yaml, "failure_floor", config.failure_floor);
        read_key(yaml, "reader_url", config.reader_url);
        read_key(yaml, "search_url", config.search_url);
        read_key(yaml, "transport", config.transport);
        read_key(yaml, "log_level", config.log_level);

        if (yaml["proxies"] && yaml["proxies"].IsSequence()) {
            for (const auto& node : yaml["proxies"])
                config.proxies.push_back(node.as<std::string>());
        }

        if (yaml["proxy_list"]) {
            for (auto& proxy : read_proxy_list(yaml["proxy_list"].as<std::string>()))
                config.proxies.push_back(std::move(proxy));
        }

        if (yaml["user_agents"] && yaml["user_agents"].IsSequence()) {
            config.user_agents.clear();
            for (const auto& node : yaml["user_agents"])
                config.user_agents.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

void Config::validate() const {
    if (threads < 1)
        throw std::invalid_argument("threads must be at least 1");
    if (max_attempts < 0)
        throw std::invalid_argument("max_attempts must not be negative");
    if (attempt_timeout_ms <= 0)
        throw std::invalid_argument("attempt_timeout_ms must be positive");
    if (budget_ms < 0)
        throw std::invalid_argument("budget_ms must not be negative");
    if (backoff_min_ms < 0 || backoff_max_ms < backoff_min_ms)
        throw std::invalid_argument("backoff range is invalid");
    if (fast_start_count < 0)
        throw std::invalid_argument("fast_start_count must not be negative");
    if (fast_start_timeout_ms <= 0 || sweep_timeout_ms <= 0)
        throw std::invalid_argument("probe timeouts must be positive");
    if (sweep_delay_ms < 0 || sweep_idle_ms < 0)
        throw std::invalid_argument("sweep delays must not be negative");
    if (min_samples < 1)
        throw std::invalid_argument("min_samples must be at least 1");
    if (failure_floor < 0.0 || failure_floor > 1.0)
        throw std::invalid_argument("failure_floor must be within [0, 1]");
    if (transport != "beast" && transport != "curl")
        throw std::invalid_argument("Unknown transport: " + transport);
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Egress - rotating proxy dispatcher with direct fallback"};

    std::string              proxy_list_path;
    std::vector<std::string> cli_proxies;

    app.add_option("command", config.command, "read | search | fetch | stats | serve");
    app.add_option("args", config.args, "URL or search query");

    app.add_option("-p,--proxy", cli_proxies, "Proxy address (host:port or scheme://host:port)")
        ->allow_extra_args(false);
    app.add_option("--proxy-list", proxy_list_path, "File containing list of proxies");
    app.add_option("-t,--threads", config.threads, "I/O threads");
    app.add_option("--max-attempts", config.max_attempts, "Proxied attempts before direct fallback");
    app.add_option("--attempt-timeout", config.attempt_timeout_ms, "Per-attempt timeout (ms)");
    app.add_option("--budget", config.budget_ms, "Overall budget per request (ms, 0 = none)");
    app.add_option("--backoff-min", config.backoff_min_ms, "Minimum retry backoff (ms)");
    app.add_option("--backoff-max", config.backoff_max_ms, "Maximum retry backoff (ms)");
    app.add_option("--probe-url", config.probe_url, "Echo target used for health probes");
    app.add_option("--fast-start", config.fast_start_count, "Candidates probed at startup");
    app.add_option("--min-samples", config.min_samples, "Attempts before eviction applies");
    app.add_option("--failure-floor", config.failure_floor, "Success ratio below which a proxy is evicted");
    app.add_option("--transport", config.transport, "HTTP transport: beast | curl");
    app.add_option("--log-level", config.log_level, "none | error | warn | info | debug | all");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("--no-probe", config.no_probe, "Skip health probing");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e) == 0 ? 0 : Constants::EXIT_USAGE_ERROR);
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command-line values take precedence over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e) == 0 ? 0 : Constants::EXIT_USAGE_ERROR);
        }
    }

    for (auto& proxy : cli_proxies)
        config.proxies.push_back(std::move(proxy));
    if (!proxy_list_path.empty()) {
        for (auto& proxy : read_proxy_list(proxy_list_path))
            config.proxies.push_back(std::move(proxy));
    }

    return config;
}

}  // namespace Core
}  // namespace Egress
