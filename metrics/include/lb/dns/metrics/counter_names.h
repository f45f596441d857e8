#pragma once

#include <string>
#include <string_view>

#include <ldns/ldns.h>

#include "lb/dns/metrics/counter_registry.h"

namespace lb::dns::counters {

constexpr std::string_view QUERIES = "queries";
constexpr std::string_view RD_QUERIES = "rdqueries";
constexpr std::string_view RESPONSES = "responses";
constexpr std::string_view SERVFAIL_RESPONSES = "servfail-responses";
constexpr std::string_view DOWNSTREAM_ERRORS = "downstream-errors";
constexpr std::string_view CACHE_HITS = "cache-hits";
constexpr std::string_view CACHE_MISSES = "cache-misses";
constexpr std::string_view CACHE_INSERTIONS = "cache-insertions";

/**
 * @return `rule-<name>`
 */
std::string rule(std::string_view rule_name);

/**
 * @return `frontend-<frontend>-<rcode>`
 */
std::string frontend_rcode(std::string_view frontend, ldns_pkt_rcode rcode);

/**
 * @return `frontend-<rcode>`
 */
std::string frontend_rcode(ldns_pkt_rcode rcode);

/**
 * Count a response sent by a frontend: increments `frontend-<frontend>-<rcode>` and `frontend-<rcode>`.
 * REFUSED responses are not counted in this family.
 */
void count_frontend_rcode(CounterRegistry &registry, std::string_view frontend, ldns_pkt_rcode rcode);

} // namespace lb::dns::counters
