#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <ldns/ldns.h>

#include "lb/common/defs.h"
#include "lb/dns/common/dns_defs.h"

namespace lb::dns {

/**
 * Normalized DNS question. Immutable once constructed.
 * Owns the parsed request packet, which is needed to build responses and to forward the query.
 */
class Query {
public:
    using ParseResult = std::pair<std::optional<Query>, ErrString>;

    /**
     * Make a query from an already parsed packet
     * @param packet the request packet
     * @return the query, or an error if the packet has no question
     */
    static ParseResult from_packet(ldns_pkt_ptr packet);

    Query(Query &&) = default;
    Query &operator=(Query &&) = default;
    Query(const Query &) = delete;
    Query &operator=(const Query &) = delete;
    ~Query() = default;

    /** Case-folded, fully-qualified name (with the trailing dot) */
    const std::string &name() const {
        return m_name;
    }

    ldns_rr_type type() const {
        return m_type;
    }

    ldns_rr_class cls() const {
        return m_class;
    }

    /** Recursion desired flag */
    bool rd() const {
        return m_rd;
    }

    /** DNSSEC OK flag */
    bool dnssec_ok() const {
        return m_do;
    }

    /** Checking disabled flag */
    bool cd() const {
        return m_cd;
    }

    uint16_t id() const {
        return m_id;
    }

    const ldns_pkt *packet() const {
        return m_packet.get();
    }

private:
    ldns_pkt_ptr m_packet;
    std::string m_name;
    ldns_rr_type m_type = LDNS_RR_TYPE_A;
    ldns_rr_class m_class = LDNS_RR_CLASS_IN;
    bool m_rd = false;
    bool m_do = false;
    bool m_cd = false;
    uint16_t m_id = 0;

    Query() = default;
};

/**
 * Where a response came from. Determines which counters fire, never serialized.
 */
enum class Provenance {
    CACHE_HIT,
    RULE_SYNTHESIZED,
    BACKEND,
    SELF_GENERATED, // Built by the pipeline itself for a malformed request
};

struct Response {
    ldns_pkt_ptr packet;
    Provenance provenance = Provenance::BACKEND;

    ldns_pkt_rcode rcode() const {
        return ldns_pkt_get_rcode(packet.get());
    }
};

/**
 * @return lower-case mnemonic of the response code, e.g. `nxdomain`
 */
std::string rcode_name(ldns_pkt_rcode rcode);

/**
 * @return mnemonic of the record type, e.g. `AAAA`
 */
std::string rr_type_name(ldns_rr_type type);

/**
 * Serialize a packet into wire format
 * @return the wire data, or an empty vector if the packet could not be serialized
 */
Uint8Vector encode_packet(const ldns_pkt *packet);

/**
 * Create response template from request:
 * transaction id, opcode, CD flag and question section are copied, QR is set,
 * and both RD and RA are set to the request's RD flag.
 */
ldns_pkt_ptr create_response_by_request(const ldns_pkt *request);

/**
 * Create an empty response with the given response code
 */
ldns_pkt_ptr create_rcode_response(const ldns_pkt *request, ldns_pkt_rcode rcode);

/**
 * Create a FORMERR response for a request which could not be parsed
 */
ldns_pkt_ptr create_formerr_response(uint16_t id);

} // namespace lb::dns
