#pragma once
#include <cstdint>

#include "proxy_endpoint.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

enum class Classification { Untested, Working, Failed };

enum class ProbeState { None, Passed, Failed };

enum class OutcomeSource { Live, Probe };

const char* to_string(Classification classification);

struct ProxyRecord {
    ProxyEndpoint  endpoint;
    Classification classification = Classification::Untested;
    std::uint64_t  success_count  = 0;
    std::uint64_t  attempt_count  = 0;
    ProbeState     last_probe     = ProbeState::None;
    std::size_t    id             = 0;  // Insertion order

    // A record with no attempts is not penalized.
    double success_ratio() const {
        if (attempt_count == 0)
            return 1.0;
        return static_cast<double>(success_count) / static_cast<double>(attempt_count);
    }

    bool selectable() const {
        return classification != Classification::Failed;
    }
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
