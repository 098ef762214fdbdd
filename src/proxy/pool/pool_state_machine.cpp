#include "pool_state_machine.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

const char* to_string(Classification classification) {
    switch (classification) {
        case Classification::Untested: return "untested";
        case Classification::Working: return "working";
        case Classification::Failed: return "failed";
    }
    return "untested";
}

PoolStateMachine::PoolStateMachine(EvictionPolicy policy) : policy_(policy) {
}

bool PoolStateMachine::below_floor(const ProxyRecord& record) const {
    return record.attempt_count >= static_cast<std::uint64_t>(policy_.min_samples)
           && record.success_ratio() < policy_.failure_floor;
}

Transition PoolStateMachine::apply(ProxyRecord& record, bool success, OutcomeSource source) const {
    Transition transition;
    transition.from    = record.classification;
    transition.applied = true;

    record.attempt_count++;
    if (success)
        record.success_count++;

    if (source == OutcomeSource::Probe) {
        record.last_probe     = success ? ProbeState::Passed : ProbeState::Failed;
        record.classification = on_probe(record, success);
    }
    else {
        record.classification = on_live(record, success);
    }

    transition.to = record.classification;
    return transition;
}

Classification PoolStateMachine::on_probe(const ProxyRecord& /*record*/, bool success) const {
    return success ? Classification::Working : Classification::Failed;
}

Classification PoolStateMachine::on_live(const ProxyRecord& record, bool success) const {
    if (record.classification == Classification::Failed)
        return Classification::Failed;

    if (success)
        return Classification::Working;

    // Only a failure can lower the ratio.
    if (below_floor(record))
        return Classification::Failed;

    return record.classification;
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
