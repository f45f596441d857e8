#pragma once

#include <cstdint>
#include <string>

#include <ldns/ldns.h>

#include "lb/common/defs.h"

namespace lb::dns {

using ldns_pkt_ptr = UniquePtr<ldns_pkt, &ldns_pkt_free>;          // NOLINT(readability-identifier-naming)
using ldns_buffer_ptr = UniquePtr<ldns_buffer, &ldns_buffer_free>; // NOLINT(readability-identifier-naming)

// An ldns_buffer grows automatically.
// We set the initial capacity so that most responses will fit without reallocations.
constexpr size_t RESPONSE_BUFFER_INITIAL_CAPACITY = 512;

/** Transport protocol over which a query was received */
enum class TransportProtocol {
    UDP,
    TCP,
    DOT,
    DOH,
};

/** Additional info about the DNS message */
struct DnsMessageInfo {
    /** Name of the frontend (listener) which received the message */
    std::string frontend;
    /** Transport protocol over which the message was received */
    TransportProtocol proto = TransportProtocol::UDP;
};

/**
 * Errors which make a configuration unusable. These are fatal at startup.
 */
enum class ConfigError {
    AE_EMPTY_RULE_NAME,
    AE_DUPLICATE_RULE_NAME,
    AE_INVALID_DOMAIN,
    AE_INVALID_RCODE,
    AE_DUPLICATE_POOL_NAME,
    AE_UNKNOWN_POOL,
    AE_BACKEND_NOT_SET,
    AE_INVALID_CACHE_SETTINGS,
};

/**
 * @return human-readable description of a configuration error
 */
const char *config_error_str(ConfigError e);

} // namespace lb::dns
