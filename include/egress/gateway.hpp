#pragma once
#include <memory>
#include <string>

#include "egress/types.hpp"

namespace Egress {

namespace Core {
struct Config;
}

/**
 * @brief Front door of the library.
 *
 * Owns the I/O threads, the proxy pool, the prober and the dispatch engine.
 * The blocking calls below may be made from any thread except the I/O
 * threads themselves.
 */
class Gateway {
public:
    explicit Gateway(const Core::Config& config);
    ~Gateway();

    Gateway(const Gateway&)            = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Seeds the pool, runs the fast-start pass and starts the sweep.
    void start();
    void stop();

    // Throws std::invalid_argument for non-http(s) URLs.
    DispatchResult read(const std::string& url);
    // Throws std::invalid_argument for blank queries.
    DispatchResult search(const std::string& query);
    DispatchResult fetch(const std::string& url);

    GatewayStats stats() const;
    std::string  health() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string to_json(const DispatchResult& result, const std::string& source);
std::string to_json(const GatewayStats& stats);

}  // namespace Egress
