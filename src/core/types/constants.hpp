#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace Egress {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.1.0";

    static constexpr int DEFAULT_THREADS      = 4;
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;

    static constexpr int DEFAULT_ATTEMPT_TIMEOUT_MS = 30000;
    static constexpr int DEFAULT_BACKOFF_MIN_MS     = 1000;
    static constexpr int DEFAULT_BACKOFF_MAX_MS     = 3000;

    static constexpr int DEFAULT_FAST_START_COUNT      = 20;
    static constexpr int DEFAULT_FAST_START_TIMEOUT_MS = 5000;
    static constexpr int DEFAULT_SWEEP_TIMEOUT_MS      = 10000;
    static constexpr int DEFAULT_SWEEP_DELAY_MS        = 500;
    static constexpr int DEFAULT_SWEEP_IDLE_MS         = 30000;

    static constexpr int    DEFAULT_MIN_SAMPLES   = 5;
    static constexpr double DEFAULT_FAILURE_FLOOR = 0.2;

    static constexpr const char* DEFAULT_PROBE_URL  = "http://httpbin.org/ip";
    static constexpr const char* DEFAULT_READER_URL = "https://r.jina.ai/";
    static constexpr const char* DEFAULT_SEARCH_URL = "https://s.jina.ai/";
    static constexpr const char* DEFAULT_TRANSPORT  = "beast";

    static constexpr const char* DEFAULT_PROXY_SCHEME = "http";
    static constexpr int         HTTP_OK              = 200;

    static constexpr int EXIT_OK               = 0;
    static constexpr int EXIT_DISPATCH_FAILURE = 1;
    static constexpr int EXIT_USAGE_ERROR      = 2;
};

inline const std::vector<std::string>& get_default_user_agents() {
    static const std::vector<std::string> agents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/91.0.4472.124 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/91.0.4472.124 Safari/537.36",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/91.0.4472.124 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:89.0) Gecko/20100101 Firefox/89.0"};
    return agents;
}

inline const std::vector<std::string>& get_accept_variants() {
    static const std::vector<std::string> variants = {
        "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8",
        "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8",
        "application/json, text/plain, */*"};
    return variants;
}

inline const std::vector<std::string>& get_accept_language_variants() {
    static const std::vector<std::string> variants = {
        "en-US,en;q=0.5", "en-US,en;q=0.9", "en-GB,en;q=0.8,en-US;q=0.6"};
    return variants;
}

}  // namespace Core
}  // namespace Egress
