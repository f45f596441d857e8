#include <unordered_set>

#include "lb/common/utils.h"
#include "lb/dns/metrics/counter_names.h"
#include "lb/dns/rules/rule_engine.h"
#include "lb/dns/rules/selectors.h"

namespace lb::dns {

// Only response codes having a mnemonic can be synthesized, the mnemonic names the counters
static bool is_known_rcode(ldns_pkt_rcode rcode) {
    return ldns_lookup_by_id(ldns_rcodes, (int) rcode) != nullptr;
}

static bool is_valid_domain(const std::string &domain) {
    UniquePtr<ldns_rdf, &ldns_rdf_deep_free> rdf{ldns_dname_new_frm_str(domain.c_str())};
    return rdf != nullptr;
}

static std::pair<std::vector<std::string>, bool> normalize_domains(const std::vector<std::string> &domains) {
    std::vector<std::string> result;
    result.reserve(domains.size());
    for (const std::string &domain : domains) {
        std::string normalized = utils::normalize_domain(domain);
        if (!is_valid_domain(normalized)) {
            return {{}, false};
        }
        result.emplace_back(std::move(normalized));
    }
    return {std::move(result), true};
}

RuleEngine::RuleEngine(CounterRegistry &registry)
        : m_counters(registry) {
}

RuleEngine::CreateResult RuleEngine::create(const std::vector<RuleSettings> &rules, CounterRegistry &registry) {
    std::unique_ptr<RuleEngine> engine{new RuleEngine(registry)};
    engine->m_rules.reserve(rules.size());

    std::unordered_set<std::string_view> names;
    for (const RuleSettings &settings : rules) {
        if (settings.name.empty()) {
            return {nullptr, config_error_str(ConfigError::AE_EMPTY_RULE_NAME)};
        }
        if (!names.insert(settings.name).second) {
            return {nullptr, LB_FMT("{}: {}", config_error_str(ConfigError::AE_DUPLICATE_RULE_NAME), settings.name)};
        }
        if (const auto *synth = std::get_if<SynthesizeRcode>(&settings.action);
                synth != nullptr && !is_known_rcode(synth->rcode)) {
            return {nullptr, LB_FMT("{}: {} (rule {})", config_error_str(ConfigError::AE_INVALID_RCODE),
                                     (int) synth->rcode, settings.name)};
        }

        auto [domains, domains_valid] = normalize_domains(settings.domains);
        auto [exact_names, names_valid] = normalize_domains(settings.exact_names);
        if (!domains_valid || !names_valid) {
            return {nullptr, LB_FMT("{} (rule {})", config_error_str(ConfigError::AE_INVALID_DOMAIN), settings.name)};
        }

        std::vector<RuleSelector> parts;
        if (!domains.empty() && !exact_names.empty()) {
            parts.emplace_back([suffix = selectors::suffix(std::move(domains)),
                                       exact = selectors::exact(std::move(exact_names))](const Query &query) {
                return suffix(query) || exact(query);
            });
        } else if (!domains.empty()) {
            parts.emplace_back(selectors::suffix(std::move(domains)));
        } else if (!exact_names.empty()) {
            parts.emplace_back(selectors::exact(std::move(exact_names)));
        }
        if (!settings.types.empty()) {
            parts.emplace_back(selectors::qtype(settings.types));
        }
        if (settings.custom) {
            parts.emplace_back(settings.custom);
        }

        engine->m_rules.push_back(Rule{
                .name = settings.name,
                .selector = selectors::all_of(std::move(parts)),
                .action = settings.action,
                .counter = &registry.counter(counters::rule(settings.name)),
        });
        dbglog(engine->m_log, "Rule #{}: {}", engine->m_rules.size(), settings.name);
    }

    infolog(engine->m_log, "Loaded {} rules", engine->m_rules.size());
    return {std::move(engine), std::nullopt};
}

Verdict RuleEngine::evaluate(const Query &query, std::string_view frontend) const {
    for (const Rule &rule : m_rules) {
        if (!rule.selector(query)) {
            continue;
        }

        if (const auto *route = std::get_if<RouteToPool>(&rule.action)) {
            tracelog(m_log, "[{}] {} routed to pool '{}' by rule {}", query.id(), query.name(), route->pool, rule.name);
            return Routed{.pool = route->pool, .rule = rule.name, .cache_ttl = route->cache_ttl};
        }

        const auto &synth = std::get<SynthesizeRcode>(rule.action);
        dbglog(m_log, "[{}] {} answered with {} by rule {}", query.id(), query.name(), rcode_name(synth.rcode),
                rule.name);
        increment(*rule.counter);
        counters::count_frontend_rcode(m_counters, frontend, synth.rcode);
        return Synthesized{
                .response = {create_rcode_response(query.packet(), synth.rcode), Provenance::RULE_SYNTHESIZED},
                .rule = rule.name,
        };
    }

    tracelog(m_log, "[{}] {} matched no rule", query.id(), query.name());
    return Routed{.pool = DEFAULT_POOL, .rule = {}};
}

} // namespace lb::dns
