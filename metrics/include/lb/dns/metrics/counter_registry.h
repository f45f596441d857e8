#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "lb/common/defs.h"
#include "lb/common/logger.h"

namespace lb::dns {

/**
 * Named monotonic 64-bit counters, safe for concurrent increment.
 *
 * A counter is created at zero on first use. Each counter is an atomic on its own,
 * so increments of unrelated counters never contend; the name map is locked exclusively
 * only when a new name appears. Counters are never removed or reset.
 */
class CounterRegistry {
public:
    using Counter = std::atomic<uint64_t>;
    using Snapshot = std::map<std::string, uint64_t, std::less<>>;

    CounterRegistry() = default;
    ~CounterRegistry() = default;

    CounterRegistry(const CounterRegistry &) = delete;
    CounterRegistry &operator=(const CounterRegistry &) = delete;
    CounterRegistry(CounterRegistry &&) = delete;
    CounterRegistry &operator=(CounterRegistry &&) = delete;

    /**
     * Add `delta` to the named counter, creating it first if needed
     */
    void increment(std::string_view name, uint64_t delta = 1);

    /**
     * Get a handle of the named counter, creating it first if needed.
     * The handle stays valid for the registry's lifetime.
     */
    Counter &counter(std::string_view name);

    /**
     * @return current value of the counter, 0 if it was never touched
     */
    uint64_t get(std::string_view name) const;

    /**
     * @return name-sorted copy of all counters. Each value is exact at the time it is read,
     *         values of different counters are not read simultaneously.
     */
    Snapshot snapshot() const;

    /**
     * @return number of known counters
     */
    size_t size() const;

private:
    Logger m_log{"counter_registry"};
    mutable std::shared_mutex m_mtx;
    // Counters are heap-allocated so that rehashing never moves them
    HashMap<std::string, std::unique_ptr<Counter>> m_counters;

    Counter *find(std::string_view name) const;
};

/**
 * Convenience increment of a counter handle
 */
inline void increment(CounterRegistry::Counter &counter, uint64_t delta = 1) {
    counter.fetch_add(delta, std::memory_order_relaxed);
}

} // namespace lb::dns
