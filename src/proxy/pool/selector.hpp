#pragma once
#include <atomic>
#include <optional>

#include "proxy_pool.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

// Process-wide round-robin. The pool reduces each ticket modulo the current
// selectable count, so eviction or recovery in between cannot go out of range.
class Selector {
public:
    explicit Selector(const ProxyPool& pool);

    Selector(const Selector&)            = delete;
    Selector& operator=(const Selector&) = delete;

    std::optional<ProxyRecord> next();

    size_t cursor() const {
        return cursor_.load(std::memory_order_relaxed);
    }

private:
    const ProxyPool&    pool_;
    std::atomic<size_t> cursor_{0};
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
