#pragma once

#include <string_view>

#include <ldns/ldns.h>

#include "lb/dns/common/dns_defs.h"

namespace lb::dns {

/**
 * Backend collaborator: picks a server of the pool and exchanges the request with it.
 * Called concurrently from any thread that handles queries.
 */
class Backend {
public:
    Backend() = default;
    virtual ~Backend() = default;

    Backend(const Backend &) = delete;
    Backend &operator=(const Backend &) = delete;
    Backend(Backend &&) = delete;
    Backend &operator=(Backend &&) = delete;

    /**
     * Send the request to a server of the pool
     * @param pool pool name
     * @param request request packet
     * @return the server's response, or null if no answer was received (timeout, network error, ...)
     */
    virtual ldns_pkt_ptr exchange(std::string_view pool, const ldns_pkt *request) = 0;
};

} // namespace lb::dns
