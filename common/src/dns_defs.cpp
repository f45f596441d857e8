#include "lb/dns/common/dns_defs.h"

namespace lb::dns {

const char *config_error_str(ConfigError e) {
    // clang-format off
    switch (e) {
    case ConfigError::AE_EMPTY_RULE_NAME: return "Rule name is empty";
    case ConfigError::AE_DUPLICATE_RULE_NAME: return "Rule name is not unique";
    case ConfigError::AE_INVALID_DOMAIN: return "Invalid domain name in rule selector";
    case ConfigError::AE_INVALID_RCODE: return "Response code can't be synthesized";
    case ConfigError::AE_DUPLICATE_POOL_NAME: return "Pool name is not unique";
    case ConfigError::AE_UNKNOWN_POOL: return "Rule routes to an unknown pool";
    case ConfigError::AE_BACKEND_NOT_SET: return "Backend is not set";
    case ConfigError::AE_INVALID_CACHE_SETTINGS: return "Invalid cache settings";
    }
    // clang-format on
    return "Unknown error";
}

} // namespace lb::dns
