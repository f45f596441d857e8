#include <magic_enum.hpp>

#include "lb/dns/metrics/counter_names.h"
#include "lb/dns/proxy/frontend_accounting.h"

namespace lb::dns {

FrontendAccounting::FrontendAccounting(CounterRegistry &registry)
        : m_registry(registry)
        , m_responses(registry.counter(counters::RESPONSES))
        , m_servfail_responses(registry.counter(counters::SERVFAIL_RESPONSES)) {
    // Aggregate counters are reported from the start, even before any response is sent
    for (const ldns_lookup_table *entry = ldns_rcodes; entry->name != nullptr; ++entry) {
        auto rcode = (ldns_pkt_rcode) entry->id;
        if (rcode != LDNS_RCODE_REFUSED) {
            registry.counter(counters::frontend_rcode(rcode));
        }
    }
}

void FrontendAccounting::record_completion(std::string_view frontend, const Response &response) {
    ldns_pkt_rcode rcode = response.rcode();
    tracelog(m_log, "[{}] {}: {} from {}", ldns_pkt_id(response.packet.get()), frontend, rcode_name(rcode),
            magic_enum::enum_name(response.provenance));

    increment(m_responses);
    if (response.provenance != Provenance::RULE_SYNTHESIZED) {
        counters::count_frontend_rcode(m_registry, frontend, rcode);
    }
    if (response.provenance == Provenance::BACKEND && rcode == LDNS_RCODE_SERVFAIL) {
        increment(m_servfail_responses);
    }
}

} // namespace lb::dns
