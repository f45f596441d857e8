#include <algorithm>
#include <memory>
#include <unordered_set>

#include "lb/common/utils.h"
#include "lb/dns/rules/selectors.h"

namespace lb::dns {

RuleSelector selectors::suffix(std::vector<std::string> domains) {
    return [domains = std::move(domains)](const Query &query) {
        return std::any_of(domains.begin(), domains.end(), [&query](const std::string &domain) {
            return utils::is_subdomain_or_same(query.name(), domain);
        });
    };
}

RuleSelector selectors::exact(std::vector<std::string> names) {
    auto set = std::make_shared<const std::unordered_set<std::string>>(names.begin(), names.end());
    return [set = std::move(set)](const Query &query) {
        return set->count(query.name()) != 0;
    };
}

RuleSelector selectors::qtype(std::vector<ldns_rr_type> types) {
    return [types = std::move(types)](const Query &query) {
        return std::find(types.begin(), types.end(), query.type()) != types.end();
    };
}

RuleSelector selectors::all_of(std::vector<RuleSelector> selectors) {
    return [selectors = std::move(selectors)](const Query &query) {
        return std::all_of(selectors.begin(), selectors.end(), [&query](const RuleSelector &s) {
            return s(query);
        });
    };
}

} // namespace lb::dns
