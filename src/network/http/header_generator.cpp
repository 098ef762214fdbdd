#include "header_generator.hpp"
#include "../../core/types/constants.hpp"

namespace Egress {
namespace Network {
namespace Http {

using namespace Egress::Core;

HeaderGenerator::HeaderGenerator(std::vector<std::string> user_agents, unsigned int seed)
    : user_agents_(std::move(user_agents)), rng_(seed ? seed : std::random_device{}()) {
    if (user_agents_.empty())
        user_agents_ = get_default_user_agents();
}

const std::string& HeaderGenerator::pick(const std::vector<std::string>& values) {
    std::uniform_int_distribution<size_t> dist(0, values.size() - 1);
    return values[dist(rng_)];
}

Headers HeaderGenerator::generate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"User-Agent", pick(user_agents_)},
        {"Accept", pick(get_accept_variants())},
        {"Accept-Language", pick(get_accept_language_variants())},
        {"DNT", "1"},
        {"Upgrade-Insecure-Requests", "1"},
    };
}

}  // namespace Http
}  // namespace Network
}  // namespace Egress
