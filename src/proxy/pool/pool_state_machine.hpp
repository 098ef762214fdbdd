#pragma once
#include "../../core/types/constants.hpp"
#include "proxy_record.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

struct EvictionPolicy {
    int    min_samples   = Core::Constants::DEFAULT_MIN_SAMPLES;
    double failure_floor = Core::Constants::DEFAULT_FAILURE_FLOOR;
};

struct Transition {
    Classification from    = Classification::Untested;
    Classification to      = Classification::Untested;
    bool           applied = false;  // False when the endpoint was unknown

    bool changed() const {
        return applied && from != to;
    }
};

// Probe results set the classification directly. A live success promotes
// Untested to Working; a live failure evicts once the ratio is under the floor.
// Live traffic never moves a Failed record back.
class PoolStateMachine {
public:
    explicit PoolStateMachine(EvictionPolicy policy = {});

    // Updates counters and classification of `record` in place.
    Transition apply(ProxyRecord& record, bool success, OutcomeSource source) const;

    bool below_floor(const ProxyRecord& record) const;

    const EvictionPolicy& policy() const {
        return policy_;
    }

private:
    EvictionPolicy policy_;

    Classification on_probe(const ProxyRecord& record, bool success) const;
    Classification on_live(const ProxyRecord& record, bool success) const;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
