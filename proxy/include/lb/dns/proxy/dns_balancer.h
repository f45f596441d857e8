#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include "lb/common/defs.h"
#include "lb/dns/common/dns_defs.h"
#include "lb/dns/common/dns_message.h"
#include "lb/dns/metrics/counter_registry.h"
#include "lb/dns/proxy/backend.h"
#include "lb/dns/proxy/balancer_settings.h"

namespace lb::dns {

/**
 * DNS balancer module drives DNS transactions from all frontends.
 * It evaluates the rules against a query, consults the shared response cache for the cache-backed pools,
 * asks the backend otherwise, and accounts every decision in the counter registry.
 *
 * After a successful `init` the transaction methods may be called concurrently from any thread.
 */
class DnsBalancer {
public:
    using InitResult = std::pair<bool, ErrString>;

    /**
     * @param registry counter sink, must outlive the balancer
     */
    explicit DnsBalancer(CounterRegistry &registry);
    ~DnsBalancer();

    DnsBalancer(const DnsBalancer &) = delete;
    DnsBalancer(DnsBalancer &&) = delete;
    DnsBalancer &operator=(const DnsBalancer &) = delete;
    DnsBalancer &operator=(DnsBalancer &&) = delete;

    /**
     * @brief Initialize the balancer
     *
     * @param settings balancer settings (see `DnsBalancerSettings`)
     * @param backend backend collaborator, must outlive the balancer or the next `deinit`
     * @return {true, std::nullopt} or {false, error_description}
     */
    [[nodiscard]] InitResult init(DnsBalancerSettings settings, Backend *backend);

    /**
     * @brief Deinitialize the balancer. Counters keep their values.
     */
    void deinit();

    /**
     * @brief Get the balancer settings
     */
    [[nodiscard]] const DnsBalancerSettings &get_settings() const;

    /**
     * @brief Run a transaction up to the point the response is ready.
     *        The caller must pass the response to `complete` once it is sent (or given up on).
     *
     * @param query parsed query
     * @param frontend name of the frontend which received the query
     * @return the response to send
     */
    Response process(const Query &query, std::string_view frontend);

    /**
     * @brief Finish a transaction
     */
    void complete(std::string_view frontend, const Response &response);

    /**
     * @brief Handle a DNS message: parse, process, serialize and complete the transaction
     *
     * @param message message from client
     * @param info information about the frontend which received the message
     * @return the response message, or an empty buffer if the response could not be serialized.
     *         The latter implies that no response should be sent to the requestor.
     */
    Uint8Vector handle_message(Uint8View message, const DnsMessageInfo &info);

    /**
     * @brief Get the counters this balancer reports to
     */
    [[nodiscard]] const CounterRegistry &counters() const;

    /**
     * @brief Return the library version
     */
    static const char *version();

private:
    struct Impl;
    std::unique_ptr<Impl> m_pimpl;
};

} // namespace lb::dns
