#pragma once
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "http_client.hpp"

namespace Egress {
namespace Network {
namespace Http {

/**
 * @brief Randomized browser-like request headers.
 *
 * Shared by health probes and live dispatch. Safe to call from any thread.
 */
class HeaderGenerator {
public:
    explicit HeaderGenerator(std::vector<std::string> user_agents = {}, unsigned int seed = 0);

    Headers generate();

    const std::vector<std::string>& user_agents() const {
        return user_agents_;
    }

private:
    std::vector<std::string> user_agents_;
    std::mt19937             rng_;
    std::mutex               mutex_;

    const std::string& pick(const std::vector<std::string>& values);
};

}  // namespace Http
}  // namespace Network
}  // namespace Egress
