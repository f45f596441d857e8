#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <ldns/ldns.h>

#include "lb/common/defs.h"
#include "lb/common/logger.h"
#include "lb/dns/common/dns_defs.h"
#include "lb/dns/common/dns_message.h"
#include "lb/dns/metrics/counter_registry.h"

namespace lb::dns {

/** Answer the query with an empty response carrying this response code */
struct SynthesizeRcode {
    ldns_pkt_rcode rcode = LDNS_RCODE_REFUSED;
};

/** Pass the query to the backends of this pool */
struct RouteToPool {
    std::string pool;
    std::optional<uint32_t> cache_ttl; // (Optional) TTL of the cached response, overrides the one from the response
};

using RuleAction = std::variant<SynthesizeRcode, RouteToPool>;

/** Pure predicate over a query */
using RuleSelector = std::function<bool(const Query &)>;

struct RuleSettings {
    std::string name; // Unique rule name, counted as `rule-<name>`

    /**
     * The query name must be one of these domains or their subdomain.
     * If both `domains` and `exact_names` are empty, any name matches.
     */
    std::vector<std::string> domains;
    std::vector<std::string> exact_names; // The query name must be equal to one of these
    std::vector<ldns_rr_type> types;      // The query type must be one of these, empty means any type
    RuleSelector custom;                  // (Optional) additional predicate the query must satisfy

    RuleAction action;
};

/** A rule produced the response */
struct Synthesized {
    Response response;
    std::string_view rule;
};

/** The query goes to the backends */
struct Routed {
    std::string_view pool;
    std::string_view rule; // Empty if no rule matched
    std::optional<uint32_t> cache_ttl;
};

using Verdict = std::variant<Synthesized, Routed>;

/**
 * Evaluates an ordered list of rules against incoming queries.
 * The first matching rule wins, later rules are not evaluated.
 */
class RuleEngine {
public:
    using CreateResult = std::pair<std::unique_ptr<RuleEngine>, ErrString>;

    /** The pool queries matching no rule are routed to */
    static constexpr std::string_view DEFAULT_POOL = "";

    /**
     * Create the engine
     * @param rules rules in evaluation order
     * @param registry counter sink
     * @return the engine, or null and the configuration error description
     */
    static CreateResult create(const std::vector<RuleSettings> &rules, CounterRegistry &registry);

    ~RuleEngine() = default;

    RuleEngine(const RuleEngine &) = delete;
    RuleEngine &operator=(const RuleEngine &) = delete;
    RuleEngine(RuleEngine &&) = delete;
    RuleEngine &operator=(RuleEngine &&) = delete;

    /**
     * Evaluate the rules against the query received by `frontend`.
     * A synthesizing rule increments `rule-<name>` and, unless the response code is REFUSED,
     * `frontend-<frontend>-<rcode>`. Routing increments nothing.
     * @return the synthesized response, or the pool to route to (`DEFAULT_POOL` if no rule matched)
     */
    Verdict evaluate(const Query &query, std::string_view frontend) const;

    size_t size() const {
        return m_rules.size();
    }

private:
    struct Rule {
        std::string name;
        RuleSelector selector;
        RuleAction action;
        CounterRegistry::Counter *counter = nullptr;
    };

    Logger m_log{"rule_engine"};
    CounterRegistry &m_counters;
    std::vector<Rule> m_rules;

    explicit RuleEngine(CounterRegistry &registry);
};

} // namespace lb::dns
