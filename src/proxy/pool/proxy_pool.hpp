#pragma once
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "egress/types.hpp"
#include "pool_state_machine.hpp"
#include "proxy_record.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

class ProxyPool {
public:
    explicit ProxyPool(EvictionPolicy policy = {});
    ProxyPool(const std::vector<std::string>& addresses, EvictionPolicy policy = {});

    ProxyPool(const ProxyPool&)            = delete;
    ProxyPool& operator=(const ProxyPool&) = delete;

    // Returns how many endpoints were new; duplicates are ignored.
    size_t add_candidates(const std::vector<ProxyEndpoint>& endpoints);

    std::optional<ProxyRecord> get(const ProxyEndpoint& endpoint) const;

    Transition record_outcome(const ProxyEndpoint& endpoint,
                              bool                 success,
                              OutcomeSource        source = OutcomeSource::Live);

    // Working and Untested records in insertion order.
    std::vector<ProxyRecord> selectable() const;

    // The selectable record at `ticket` modulo the selectable count.
    std::optional<ProxyRecord> select(size_t ticket) const;

    // Untested and Failed records in insertion order.
    std::vector<ProxyRecord> needs_probe() const;

    // Every record in insertion order.
    std::vector<ProxyRecord> records() const;

    PoolStats snapshot_stats() const;

    size_t size() const;
    bool   empty() const;

    const EvictionPolicy& policy() const {
        return state_machine_.policy();
    }

private:
    using Index = std::set<size_t>;

    std::vector<ProxyRecord>                                    records_;
    std::unordered_map<ProxyEndpoint, size_t, ProxyEndpointHash> lookup_;
    Index                                                       working_;
    Index                                                       failed_;
    Index                                                       untested_;
    std::vector<size_t>                                         selectable_;  // Sorted ids

    PoolStateMachine   state_machine_;
    mutable std::mutex mutex_;

    Index&                   index_for(Classification classification);
    void                     move_index(size_t id, Classification from, Classification to);
    std::vector<ProxyRecord> collect(const Index& a, const Index& b) const;
    void log_transition(const ProxyRecord& record, const Transition& transition) const;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
