#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <ldns/ldns.h>

#include "lb/common/cache.h"
#include "lb/common/clock.h"
#include "lb/common/defs.h"
#include "lb/common/logger.h"
#include "lb/dns/common/dns_message.h"
#include "lb/dns/metrics/counter_registry.h"

namespace lb::dns {

struct CacheSettings {
    size_t max_entries = 10000;          // Maximum number of cached responses, 0 disables caching
    size_t shards = 16;                  // Number of independently locked parts of the cache
    uint32_t min_ttl = 0;                // Responses with a lower TTL are not cached
    uint32_t max_ttl = 86400;            // Higher TTLs are capped to this value
    uint32_t max_negative_ttl = 3600;    // Cap for NXDOMAIN and NODATA responses
    uint32_t temporary_failure_ttl = 60; // TTL for SERVFAIL and REFUSED responses, 0 means "don't cache"
};

/**
 * Response cache shared by all frontends and pools.
 *
 * Entries are keyed on the normalized question (name, type, class, DO and CD bits). Neither the
 * transport nor the RD bit is part of the key. Entries expire lazily: an entry whose TTL has passed
 * is treated as absent on lookup, and is overwritten by the next store.
 *
 * Publishes `cache-hits`, `cache-misses` and `cache-insertions`.
 */
class ResponseCache {
public:
    ResponseCache(const CacheSettings &settings, CounterRegistry &registry);
    ~ResponseCache() = default;

    ResponseCache(const ResponseCache &) = delete;
    ResponseCache &operator=(const ResponseCache &) = delete;
    ResponseCache(ResponseCache &&) = delete;
    ResponseCache &operator=(ResponseCache &&) = delete;

    /**
     * @return canonical cache key of the query
     */
    static std::string make_key(const Query &query);

    /**
     * Look the query up. Counts a hit or a miss.
     * @return the cached response patched to answer this query (transaction id, RD bit, question,
     *         TTLs reduced by the time spent in cache), with `CACHE_HIT` provenance,
     *         or nullopt if there is no live entry
     */
    std::optional<Response> lookup(const Query &query);

    /**
     * Store the response to the query, replacing any existing entry.
     * Only backend responses are accepted.
     * @param ttl_override if set, used instead of the TTL computed from the response
     * @return true if the response was stored
     */
    bool store(const Query &query, const Response &response, std::optional<uint32_t> ttl_override = std::nullopt);

    /** Erase cached entry of the query if exists */
    void erase(const Query &query);

    void clear();

    /** @return number of stored entries, including the expired ones not yet overwritten */
    size_t size() const;

    size_t max_entries() const {
        return m_settings.max_entries;
    }

    /**
     * @return the TTL the response would be cached with, or nullopt if it is not cacheable
     */
    std::optional<uint32_t> compute_ttl(const ldns_pkt *response) const;

private:
    struct Entry {
        Uint8Vector wire; // Response without question section
        SteadyClock::time_point inserted_at;
        uint32_t ttl_secs = 0;
    };
    using Shard = WithMtx<LruCache<std::string, Entry>>;

    Logger m_log{"response_cache"};
    CacheSettings m_settings;
    std::vector<std::unique_ptr<Shard>> m_shards;
    CounterRegistry::Counter &m_hits;
    CounterRegistry::Counter &m_misses;
    CounterRegistry::Counter &m_insertions;

    Shard &shard_for(const std::string &key) const;
};

} // namespace lb::dns
