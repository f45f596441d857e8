#pragma once

#include <string_view>

#include "lb/common/logger.h"
#include "lb/dns/common/dns_message.h"
#include "lb/dns/metrics/counter_registry.h"

namespace lb::dns {

/**
 * Tallies completed transactions: one response on one frontend.
 */
class FrontendAccounting {
public:
    /**
     * Registers `responses`, `servfail-responses` and `frontend-<rcode>` for every response code
     * except REFUSED, so that they are reported at zero before the first transaction.
     */
    explicit FrontendAccounting(CounterRegistry &registry);

    /**
     * Record a completed transaction. Must be called exactly once per transaction.
     *
     * Increments `responses`. Unless the response was synthesized by a rule (the rule engine
     * counts those itself) or is REFUSED, increments `frontend-<frontend>-<rcode>` and `frontend-<rcode>`.
     * A SERVFAIL coming from a backend also increments `servfail-responses`.
     */
    void record_completion(std::string_view frontend, const Response &response);

private:
    Logger m_log{"frontend_accounting"};
    CounterRegistry &m_registry;
    CounterRegistry::Counter &m_responses;
    CounterRegistry::Counter &m_servfail_responses;
};

} // namespace lb::dns
