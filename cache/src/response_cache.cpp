#include <algorithm>
#include <functional>
#include <mutex>

#include "lb/common/utils.h"
#include "lb/dns/cache/response_cache.h"
#include "lb/dns/metrics/counter_names.h"

namespace lb::dns {

static uint32_t compute_min_rr_ttl(const ldns_pkt *pkt) {
    uint32_t min_rr_ttl = UINT32_MAX;
    for (size_t i = 0; i < ldns_pkt_ancount(pkt); ++i) {
        min_rr_ttl = std::min(min_rr_ttl, ldns_rr_ttl(ldns_rr_list_rr(ldns_pkt_answer(pkt), i)));
    }
    for (size_t i = 0; i < ldns_pkt_nscount(pkt); ++i) {
        min_rr_ttl = std::min(min_rr_ttl, ldns_rr_ttl(ldns_rr_list_rr(ldns_pkt_authority(pkt), i)));
    }
    for (size_t i = 0; i < ldns_pkt_arcount(pkt); ++i) {
        min_rr_ttl = std::min(min_rr_ttl, ldns_rr_ttl(ldns_rr_list_rr(ldns_pkt_additional(pkt), i)));
    }
    if (min_rr_ttl == UINT32_MAX) { // No RRs in pkt (or insanely large TTL)
        min_rr_ttl = 0;
    }
    return min_rr_ttl;
}

static bool has_soa(const ldns_pkt *pkt) {
    for (size_t i = 0; i < ldns_pkt_nscount(pkt); ++i) {
        if (ldns_rr_get_type(ldns_rr_list_rr(ldns_pkt_authority(pkt), i)) == LDNS_RR_TYPE_SOA) {
            return true;
        }
    }
    return false;
}

static void decrease_ttls(ldns_rr_list *rrs, uint32_t age) {
    for (size_t i = 0; i < ldns_rr_list_rr_count(rrs); ++i) {
        ldns_rr *rr = ldns_rr_list_rr(rrs, i);
        uint32_t ttl = ldns_rr_ttl(rr);
        ldns_rr_set_ttl(rr, (ttl > age) ? ttl - age : 0);
    }
}

ResponseCache::ResponseCache(const CacheSettings &settings, CounterRegistry &registry)
        : m_settings(settings)
        , m_hits(registry.counter(counters::CACHE_HITS))
        , m_misses(registry.counter(counters::CACHE_MISSES))
        , m_insertions(registry.counter(counters::CACHE_INSERTIONS)) {
    size_t shards = std::clamp<size_t>(m_settings.shards, 1, std::max<size_t>(1, m_settings.max_entries));
    // The first `max_entries % shards` shards take one extra entry, so the capacities sum to `max_entries`
    size_t base_capacity = m_settings.max_entries / shards;
    size_t remainder = m_settings.max_entries % shards;
    m_shards.reserve(shards);
    for (size_t i = 0; i < shards; ++i) {
        auto &shard = m_shards.emplace_back(std::make_unique<Shard>());
        shard->val.set_capacity(std::max<size_t>(1, base_capacity + (i < remainder ? 1 : 0)));
    }
    dbglog(m_log, "Cache of {} entries in {} shards", m_settings.max_entries, shards);
}

std::string ResponseCache::make_key(const Query &query) {
    // '|' is to avoid collisions
    return LB_FMT("{}|{}|{}{}|{}", (int) query.type(), (int) query.cls(), query.dnssec_ok() ? "1" : "0",
            query.cd() ? "1" : "0", query.name());
}

ResponseCache::Shard &ResponseCache::shard_for(const std::string &key) const {
    return *m_shards[std::hash<std::string>{}(key) % m_shards.size()];
}

std::optional<Response> ResponseCache::lookup(const Query &query) {
    if (m_settings.max_entries == 0) { // Caching disabled
        increment(m_misses);
        return std::nullopt;
    }

    std::string key = make_key(query);
    Uint8Vector wire;
    uint32_t age = 0;
    {
        Shard &shard = shard_for(key);
        std::scoped_lock l(shard.mtx);
        Entry *entry = shard.val.get(key);
        if (entry != nullptr) {
            auto elapsed = std::chrono::duration_cast<Secs>(SteadyClock::now() - entry->inserted_at);
            if (elapsed.count() >= (int64_t) entry->ttl_secs) {
                dbglog(m_log, "Expired cache entry for key {}", key);
                shard.val.make_lru(key);
            } else {
                wire = entry->wire;
                age = (uint32_t) std::max<int64_t>(0, elapsed.count());
            }
        }
    }

    if (wire.empty()) {
        dbglog(m_log, "Cache miss for key {}", key);
        increment(m_misses);
        return std::nullopt;
    }

    ldns_pkt *pkt = nullptr;
    if (ldns_status status = ldns_wire2pkt(&pkt, wire.data(), wire.size()); status != LDNS_STATUS_OK) {
        errlog(m_log, "Failed to decode cached response for key {}: {}", key, ldns_get_errorstr_by_id(status));
        erase(query);
        increment(m_misses);
        return std::nullopt;
    }

    Response response{ldns_pkt_ptr{pkt}, Provenance::CACHE_HIT};

    // Patch response id and flags
    ldns_pkt_set_id(pkt, query.id());
    ldns_pkt_set_rd(pkt, query.rd());

    // Patch response question section
    ldns_rr_list_deep_free(ldns_pkt_question(pkt));
    ldns_pkt_set_question(pkt, ldns_pkt_get_section_clone(query.packet(), LDNS_SECTION_QUESTION));
    ldns_pkt_set_qdcount(pkt, ldns_pkt_qdcount(query.packet()));

    // Patch response TTLs
    decrease_ttls(ldns_pkt_answer(pkt), age);
    decrease_ttls(ldns_pkt_authority(pkt), age);
    decrease_ttls(ldns_pkt_additional(pkt), age);

    tracelog(m_log, "Cache hit for key {}, age {}s", key, age);
    increment(m_hits);
    return response;
}

std::optional<uint32_t> ResponseCache::compute_ttl(const ldns_pkt *response) const {
    if (ldns_pkt_tc(response)                   // Truncated
            || ldns_pkt_qdcount(response) != 1) { // Invalid
        return std::nullopt;
    }

    uint32_t ttl = 0;
    switch (ldns_pkt_get_rcode(response)) {
    case LDNS_RCODE_NOERROR:
        if (ldns_pkt_ancount(response) > 0) {
            ttl = compute_min_rr_ttl(response);
            if (ttl < m_settings.min_ttl) {
                return std::nullopt;
            }
            ttl = std::min(ttl, m_settings.max_ttl);
            break;
        }
        [[fallthrough]]; // NODATA
    case LDNS_RCODE_NXDOMAIN:
        if (!has_soa(response)) {
            return std::nullopt;
        }
        ttl = std::min(compute_min_rr_ttl(response), m_settings.max_negative_ttl);
        break;
    case LDNS_RCODE_SERVFAIL:
    case LDNS_RCODE_REFUSED:
        ttl = m_settings.temporary_failure_ttl;
        break;
    default:
        return std::nullopt;
    }

    if (ttl == 0) {
        return std::nullopt;
    }
    return ttl;
}

bool ResponseCache::store(const Query &query, const Response &response, std::optional<uint32_t> ttl_override) {
    if (m_settings.max_entries == 0) { // Caching disabled
        return false;
    }
    if (response.provenance != Provenance::BACKEND || response.packet == nullptr) {
        // Synthesized and already cached responses never enter the cache
        return false;
    }

    std::optional<uint32_t> ttl = compute_ttl(response.packet.get());
    if (ttl_override.has_value() && !ldns_pkt_tc(response.packet.get())
            && ldns_pkt_qdcount(response.packet.get()) == 1) {
        ttl = (ttl_override.value() != 0) ? ttl_override : std::nullopt;
    }
    if (!ttl.has_value()) {
        tracelog(m_log, "Response to {} is not cacheable", query.name());
        return false;
    }

    ldns_pkt_ptr pkt{ldns_pkt_clone(response.packet.get())};

    // Will be patched when returning the cached response
    ldns_rr_list_deep_free(ldns_pkt_question(pkt.get()));
    ldns_pkt_set_question(pkt.get(), ldns_rr_list_new());
    ldns_pkt_set_qdcount(pkt.get(), 0);

    // This is NOT an authoritative answer
    ldns_pkt_set_aa(pkt.get(), false);

    Entry entry{
            .wire = encode_packet(pkt.get()),
            .inserted_at = SteadyClock::now(),
            .ttl_secs = ttl.value(),
    };
    if (entry.wire.empty()) {
        errlog(m_log, "Failed to encode response to {} for caching", query.name());
        return false;
    }

    std::string key = make_key(query);
    {
        Shard &shard = shard_for(key);
        std::scoped_lock l(shard.mtx);
        shard.val.insert(key, std::move(entry));
    }
    increment(m_insertions);
    dbglog(m_log, "Stored response for key {} with TTL {}s", key, ttl.value());
    return true;
}

void ResponseCache::erase(const Query &query) {
    std::string key = make_key(query);
    Shard &shard = shard_for(key);
    std::scoped_lock l(shard.mtx);
    shard.val.erase(key);
}

void ResponseCache::clear() {
    for (auto &shard : m_shards) {
        std::scoped_lock l(shard->mtx);
        shard->val.clear();
    }
}

size_t ResponseCache::size() const {
    size_t result = 0;
    for (const auto &shard : m_shards) {
        std::scoped_lock l(shard->mtx);
        result += shard->val.size();
    }
    return result;
}

} // namespace lb::dns
