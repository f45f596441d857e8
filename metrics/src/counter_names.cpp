#include "lb/common/utils.h"
#include "lb/dns/common/dns_message.h"
#include "lb/dns/metrics/counter_names.h"

namespace lb::dns {

std::string counters::rule(std::string_view rule_name) {
    return LB_FMT("rule-{}", rule_name);
}

std::string counters::frontend_rcode(std::string_view frontend, ldns_pkt_rcode rcode) {
    return LB_FMT("frontend-{}-{}", frontend, rcode_name(rcode));
}

std::string counters::frontend_rcode(ldns_pkt_rcode rcode) {
    return LB_FMT("frontend-{}", rcode_name(rcode));
}

void counters::count_frontend_rcode(CounterRegistry &registry, std::string_view frontend, ldns_pkt_rcode rcode) {
    if (rcode == LDNS_RCODE_REFUSED) {
        return;
    }
    registry.increment(frontend_rcode(frontend, rcode));
    registry.increment(frontend_rcode(rcode));
}

} // namespace lb::dns
