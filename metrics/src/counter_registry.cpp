#include <mutex>

#include "lb/dns/metrics/counter_registry.h"

namespace lb::dns {

CounterRegistry::Counter *CounterRegistry::find(std::string_view name) const {
    std::shared_lock l(m_mtx);
    auto it = m_counters.find(std::string{name});
    return (it != m_counters.end()) ? it->second.get() : nullptr;
}

CounterRegistry::Counter &CounterRegistry::counter(std::string_view name) {
    if (Counter *c = find(name)) {
        return *c;
    }

    std::unique_lock l(m_mtx);
    auto [it, inserted] = m_counters.try_emplace(std::string{name});
    if (inserted) {
        it->second = std::make_unique<Counter>(0);
        tracelog(m_log, "New counter: {}", name);
    }
    return *it->second;
}

void CounterRegistry::increment(std::string_view name, uint64_t delta) {
    dns::increment(counter(name), delta);
}

uint64_t CounterRegistry::get(std::string_view name) const {
    const Counter *c = find(name);
    return (c != nullptr) ? c->load(std::memory_order_relaxed) : 0;
}

CounterRegistry::Snapshot CounterRegistry::snapshot() const {
    Snapshot result;
    std::shared_lock l(m_mtx);
    for (const auto &[name, value] : m_counters) {
        result.emplace(name, value->load(std::memory_order_relaxed));
    }
    return result;
}

size_t CounterRegistry::size() const {
    std::shared_lock l(m_mtx);
    return m_counters.size();
}

} // namespace lb::dns
