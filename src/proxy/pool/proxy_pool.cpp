#include "proxy_pool.hpp"
#include <algorithm>
#include <cstdio>
#include <iterator>
#include "../../core/logger/logger.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

using namespace Egress::Core;

namespace {

std::string format_ratio(double ratio) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", ratio * 100.0);
    return buffer;
}

}  // namespace

ProxyPool::ProxyPool(EvictionPolicy policy) : state_machine_(policy) {
}

ProxyPool::ProxyPool(const std::vector<std::string>& addresses, EvictionPolicy policy)
    : state_machine_(policy) {
    std::vector<ProxyEndpoint> endpoints;
    endpoints.reserve(addresses.size());
    for (const auto& address : addresses)
        endpoints.push_back(ProxyEndpoint::parse(address));
    add_candidates(endpoints);
}

size_t ProxyPool::add_candidates(const std::vector<ProxyEndpoint>& endpoints) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t added = 0;
    for (const auto& endpoint : endpoints) {
        if (lookup_.count(endpoint))
            continue;

        ProxyRecord record;
        record.endpoint = endpoint;
        record.id       = records_.size();

        lookup_.emplace(endpoint, record.id);
        untested_.insert(record.id);
        selectable_.push_back(record.id);
        records_.push_back(std::move(record));
        ++added;
    }
    return added;
}

std::optional<ProxyRecord> ProxyPool::get(const ProxyEndpoint& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = lookup_.find(endpoint);
    if (it == lookup_.end())
        return std::nullopt;
    return records_[it->second];
}

ProxyPool::Index& ProxyPool::index_for(Classification classification) {
    switch (classification) {
        case Classification::Working: return working_;
        case Classification::Failed: return failed_;
        case Classification::Untested: break;
    }
    return untested_;
}

void ProxyPool::move_index(size_t id, Classification from, Classification to) {
    if (from == to)
        return;
    index_for(from).erase(id);
    index_for(to).insert(id);

    auto pos = std::lower_bound(selectable_.begin(), selectable_.end(), id);
    if (to == Classification::Failed) {
        if (pos != selectable_.end() && *pos == id)
            selectable_.erase(pos);
    }
    else if (from == Classification::Failed) {
        selectable_.insert(pos, id);
    }
}

Transition ProxyPool::record_outcome(const ProxyEndpoint& endpoint,
                                     bool                 success,
                                     OutcomeSource        source) {
    Transition  transition;
    ProxyRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = lookup_.find(endpoint);
        if (it == lookup_.end())
            return transition;

        ProxyRecord& record = records_[it->second];
        transition          = state_machine_.apply(record, success, source);
        move_index(record.id, transition.from, transition.to);
        snapshot = record;
    }

    if (transition.changed())
        log_transition(snapshot, transition);
    return transition;
}

void ProxyPool::log_transition(const ProxyRecord& record, const Transition& transition) const {
    std::string detail = record.endpoint.url() + " (" + std::to_string(record.success_count) + "/"
                         + std::to_string(record.attempt_count) + ", "
                         + format_ratio(record.success_ratio()) + ")";

    if (transition.to == Classification::Failed) {
        Logger::error("Proxy evicted [" + std::string(to_string(transition.from)) + " -> failed]: "
                      + detail);
    }
    else if (transition.from == Classification::Failed) {
        Logger::success("Proxy recovered: " + detail);
    }
    else {
        Logger::info("Proxy confirmed working: " + detail);
    }
}

std::vector<ProxyRecord> ProxyPool::collect(const Index& a, const Index& b) const {
    std::vector<size_t> ids;
    ids.reserve(a.size() + b.size());
    std::merge(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(ids));

    std::vector<ProxyRecord> out;
    out.reserve(ids.size());
    for (size_t id : ids)
        out.push_back(records_[id]);
    return out;
}

std::vector<ProxyRecord> ProxyPool::selectable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProxyRecord>    out;
    out.reserve(selectable_.size());
    for (size_t id : selectable_)
        out.push_back(records_[id]);
    return out;
}

std::optional<ProxyRecord> ProxyPool::select(size_t ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (selectable_.empty())
        return std::nullopt;
    return records_[selectable_[ticket % selectable_.size()]];
}

std::vector<ProxyRecord> ProxyPool::needs_probe() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect(untested_, failed_);
}

std::vector<ProxyRecord> ProxyPool::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

PoolStats ProxyPool::snapshot_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.total_candidates = records_.size();
    stats.working_count    = working_.size();
    stats.failed_count     = failed_.size();
    stats.untested_count   = untested_.size();
    for (const auto& record : records_) {
        stats.total_attempts += record.attempt_count;
        stats.successful_attempts += record.success_count;
    }
    stats.failed_attempts = stats.total_attempts - stats.successful_attempts;
    return stats;
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.empty();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
