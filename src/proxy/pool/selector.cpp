#include "selector.hpp"

namespace Egress {
namespace Proxy {
namespace Pool {

Selector::Selector(const ProxyPool& pool) : pool_(pool) {
}

std::optional<ProxyRecord> Selector::next() {
    return pool_.select(cursor_.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Egress
