#pragma once

#include <string>
#include <vector>

#include "lb/dns/cache/response_cache.h"
#include "lb/dns/rules/rule_engine.h"

namespace lb::dns {

/**
 * A named group of backends. Selecting a backend inside the pool is up to the `Backend` implementation.
 */
struct PoolSettings {
    /** Pool name. The empty name is the default pool. */
    std::string name;
    /** Whether responses of this pool go through the shared response cache */
    bool cache = false;
};

struct DnsBalancerSettings {
    /**
     * @brief Get the default settings:
     *        a single cache-backed default pool, no rules, default cache settings
     */
    static const DnsBalancerSettings &get_default();

    /** Known pools. Every pool referenced by a rule or by `default_pool` must be listed here. */
    std::vector<PoolSettings> pools;
    /** Rules in evaluation order */
    std::vector<RuleSettings> rules;
    /** Shared response cache settings */
    CacheSettings cache;
    /** Pool of the queries matching no rule */
    std::string default_pool;
};

} // namespace lb::dns
