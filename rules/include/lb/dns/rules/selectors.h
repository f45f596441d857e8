#pragma once

#include <string>
#include <vector>

#include <ldns/ldns.h>

#include "lb/dns/rules/rule_engine.h"

namespace lb::dns::selectors {

/**
 * Match queries for any of the domains or their subdomains. Domains must be normalized.
 */
RuleSelector suffix(std::vector<std::string> domains);

/**
 * Match queries for exactly one of the names. Names must be normalized.
 */
RuleSelector exact(std::vector<std::string> names);

/**
 * Match queries of any of the types
 */
RuleSelector qtype(std::vector<ldns_rr_type> types);

/**
 * Match queries satisfying every selector. An empty list matches everything.
 */
RuleSelector all_of(std::vector<RuleSelector> selectors);

} // namespace lb::dns::selectors
