#include <unordered_set>

#include <magic_enum.hpp>

#include "lb/common/utils.h"
#include "lb/dns/metrics/counter_names.h"
#include "lb/dns/proxy/dns_balancer.h"
#include "lb/dns/proxy/frontend_accounting.h"

#define dbglog_id(l_, pkt_, fmt_, ...) dbglog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)
#define tracelog_id(l_, pkt_, fmt_, ...) tracelog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)

namespace lb::dns {

static const DnsBalancerSettings DEFAULT_BALANCER_SETTINGS = {
        .pools = {{.name = "", .cache = true}},
        .rules = {},
        .cache = {},
        .default_pool = "",
};

const DnsBalancerSettings &DnsBalancerSettings::get_default() {
    return DEFAULT_BALANCER_SETTINGS;
}

struct DnsBalancer::Impl {
    Logger log{"DNS balancer"};
    CounterRegistry &registry;
    FrontendAccounting accounting{registry};
    CounterRegistry::Counter &queries = registry.counter(counters::QUERIES);
    CounterRegistry::Counter &rd_queries = registry.counter(counters::RD_QUERIES);
    CounterRegistry::Counter &downstream_errors = registry.counter(counters::DOWNSTREAM_ERRORS);

    DnsBalancerSettings settings;
    Backend *backend = nullptr;
    HashMap<std::string, PoolSettings> pools;
    std::unique_ptr<RuleEngine> rules;
    std::unique_ptr<ResponseCache> cache;

    DnsBalancer::InitResult fail(ConfigError error, std::string_view details = {}) {
        std::string description = details.empty()
                ? std::string{config_error_str(error)}
                : LB_FMT("{}: {}", config_error_str(error), details);
        errlog(log, "{}", description);
        return {false, std::move(description)};
    }

    explicit Impl(CounterRegistry &registry)
            : registry(registry) {
    }
};

DnsBalancer::DnsBalancer(CounterRegistry &registry)
        : m_pimpl(new Impl(registry)) {
}

DnsBalancer::~DnsBalancer() = default;

DnsBalancer::InitResult DnsBalancer::init(DnsBalancerSettings settings, Backend *backend) {
    Impl &balancer = *m_pimpl;

    infolog(balancer.log, "Initializing balancer module...");

    if (backend == nullptr) {
        return balancer.fail(ConfigError::AE_BACKEND_NOT_SET);
    }

    HashMap<std::string, PoolSettings> pools;
    for (const PoolSettings &pool : settings.pools) {
        if (!pools.emplace(pool.name, pool).second) {
            return balancer.fail(ConfigError::AE_DUPLICATE_POOL_NAME, pool.name);
        }
        dbglog(balancer.log, "Pool '{}', cache {}", pool.name, pool.cache ? "enabled" : "disabled");
    }
    if (pools.count(settings.default_pool) == 0) {
        return balancer.fail(ConfigError::AE_UNKNOWN_POOL, LB_FMT("'{}' (default pool)", settings.default_pool));
    }
    for (const RuleSettings &rule : settings.rules) {
        const auto *route = std::get_if<RouteToPool>(&rule.action);
        if (route != nullptr && pools.count(route->pool) == 0) {
            return balancer.fail(ConfigError::AE_UNKNOWN_POOL, LB_FMT("'{}' (rule {})", route->pool, rule.name));
        }
    }

    if (settings.cache.min_ttl > settings.cache.max_ttl) {
        return balancer.fail(ConfigError::AE_INVALID_CACHE_SETTINGS,
                LB_FMT("min TTL {} exceeds max TTL {}", settings.cache.min_ttl, settings.cache.max_ttl));
    }

    infolog(balancer.log, "Initializing rules...");
    auto [rules, err] = RuleEngine::create(settings.rules, balancer.registry);
    if (rules == nullptr) {
        errlog(balancer.log, "Failed to initialize rules: {}", err.value());
        return {false, std::move(err)};
    }
    infolog(balancer.log, "Rules initialized");

    balancer.cache = std::make_unique<ResponseCache>(settings.cache, balancer.registry);
    balancer.rules = std::move(rules);
    balancer.pools = std::move(pools);
    balancer.backend = backend;
    balancer.settings = std::move(settings);

    infolog(balancer.log, "Balancer module initialized");
    return {true, std::nullopt};
}

void DnsBalancer::deinit() {
    Impl &balancer = *m_pimpl;

    infolog(balancer.log, "Deinitializing...");

    balancer.rules.reset();
    if (balancer.cache != nullptr) {
        infolog(balancer.log, "Clearing cache...");
        balancer.cache.reset();
        infolog(balancer.log, "Done");
    }
    balancer.pools.clear();
    balancer.backend = nullptr;

    infolog(balancer.log, "Deinitialized");
}

const DnsBalancerSettings &DnsBalancer::get_settings() const {
    return m_pimpl->settings;
}

Response DnsBalancer::process(const Query &query, std::string_view frontend) {
    Impl &balancer = *m_pimpl;

    increment(balancer.queries);
    if (query.rd()) {
        increment(balancer.rd_queries);
    }

    if (balancer.rules == nullptr) {
        dbglog_id(balancer.log, query.packet(), "Balancer is not initialized");
        return {create_rcode_response(query.packet(), LDNS_RCODE_SERVFAIL), Provenance::SELF_GENERATED};
    }

    Verdict verdict = balancer.rules->evaluate(query, frontend);
    if (auto *synthesized = std::get_if<Synthesized>(&verdict)) {
        return std::move(synthesized->response);
    }

    const auto &routed = std::get<Routed>(verdict);
    std::string_view pool_name = routed.rule.empty() ? std::string_view{balancer.settings.default_pool} : routed.pool;
    const PoolSettings &pool = balancer.pools.find(std::string{pool_name})->second;

    if (pool.cache) {
        if (std::optional<Response> cached = balancer.cache->lookup(query)) {
            tracelog_id(balancer.log, query.packet(), "{} {} answered from cache", query.name(),
                    rr_type_name(query.type()));
            return std::move(*cached);
        }
    }

    tracelog_id(balancer.log, query.packet(), "Exchanging with pool '{}'", pool.name);
    Response response{balancer.backend->exchange(pool.name, query.packet()), Provenance::BACKEND};
    if (response.packet == nullptr) {
        dbglog_id(balancer.log, query.packet(), "Pool '{}' did not answer {}", pool.name, query.name());
        increment(balancer.downstream_errors);
        response.packet = create_rcode_response(query.packet(), LDNS_RCODE_SERVFAIL);
        return response;
    }

    ldns_pkt_set_id(response.packet.get(), query.id());
    if (pool.cache) {
        balancer.cache->store(query, response, routed.cache_ttl);
    }
    return response;
}

void DnsBalancer::complete(std::string_view frontend, const Response &response) {
    m_pimpl->accounting.record_completion(frontend, response);
}

static Response make_self_generated(ldns_pkt_ptr packet) {
    return {std::move(packet), Provenance::SELF_GENERATED};
}

Uint8Vector DnsBalancer::handle_message(Uint8View message, const DnsMessageInfo &info) {
    Impl &balancer = *m_pimpl;

    Response response;
    ldns_pkt *request = nullptr;
    ldns_status status = ldns_wire2pkt(&request, message.data(), message.size());
    if (status != LDNS_STATUS_OK) {
        uint16_t id = (message.size() >= 2) ? ldns_read_uint16(message.data()) : 0;
        dbglog(balancer.log, "[{}] Failed to parse message from {} over {}: {}", id, info.frontend,
                magic_enum::enum_name(info.proto), ldns_get_errorstr_by_id(status));
        response = make_self_generated(create_formerr_response(id));
    } else if (ldns_pkt_qdcount(request) == 0) {
        ldns_pkt_ptr questionless{request};
        dbglog_id(balancer.log, request, "Message from {} over {} has no question", info.frontend,
                magic_enum::enum_name(info.proto));
        response = make_self_generated(create_rcode_response(questionless.get(), LDNS_RCODE_SERVFAIL));
    } else {
        uint16_t id = ldns_pkt_id(request);
        auto [query, err] = Query::from_packet(ldns_pkt_ptr{request});
        if (!query.has_value()) {
            dbglog(balancer.log, "[{}] Bad query from {} over {}: {}", id, info.frontend,
                    magic_enum::enum_name(info.proto), err.value());
            response = make_self_generated(create_formerr_response(id));
        } else {
            tracelog_id(balancer.log, query->packet(), "{} {} from {} over {}", query->name(),
                    rr_type_name(query->type()), info.frontend, magic_enum::enum_name(info.proto));
            response = process(*query, info.frontend);
        }
    }

    Uint8Vector wire = encode_packet(response.packet.get());
    if (wire.empty()) {
        dbglog_id(balancer.log, response.packet.get(), "Failed to serialize response");
    }
    complete(info.frontend, response);
    return wire;
}

const CounterRegistry &DnsBalancer::counters() const {
    return m_pimpl->registry;
}

const char *DnsBalancer::version() {
    return LB_VERSION;
}

} // namespace lb::dns
