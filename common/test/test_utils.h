#pragma once

#include <cstdint>
#include <string>

#include <gtest/gtest.h>
#include <ldns/ldns.h>

#include "lb/dns/common/dns_message.h"

namespace lb::dns::test {

static inline ldns_pkt_ptr create_request(const std::string &domain, ldns_rr_type type, uint16_t flags,
        ldns_rr_class cls = LDNS_RR_CLASS_IN) {
    ldns_pkt_ptr pkt{ldns_pkt_query_new(ldns_dname_new_frm_str(domain.c_str()), type, cls, flags)};
    ldns_pkt_set_random_id(pkt.get());
    return pkt;
}

static inline Query make_query(const std::string &domain, ldns_rr_type type = LDNS_RR_TYPE_A, uint16_t flags = LDNS_RD) {
    auto [query, err] = Query::from_packet(create_request(domain, type, flags));
    EXPECT_FALSE(err.has_value()) << *err;
    return std::move(query.value());
}

/**
 * Build a backend-like response to the request. If `rr` is not empty it is parsed
 * and pushed into `section`.
 */
static inline ldns_pkt_ptr make_response_packet(const ldns_pkt *request, ldns_pkt_rcode rcode,
        const std::string &rr = {}, ldns_pkt_section section = LDNS_SECTION_ANSWER) {
    ldns_pkt_ptr response = create_rcode_response(request, rcode);
    if (!rr.empty()) {
        ldns_rr *parsed = nullptr;
        ldns_status status = ldns_rr_new_frm_str(&parsed, rr.c_str(), 0, nullptr, nullptr);
        EXPECT_EQ(status, LDNS_STATUS_OK) << ldns_get_errorstr_by_id(status);
        if (status == LDNS_STATUS_OK) {
            ldns_pkt_push_rr(response.get(), section, parsed);
        }
    }
    return response;
}

static inline Response make_backend_response(const Query &query, ldns_pkt_rcode rcode, const std::string &rr = {},
        ldns_pkt_section section = LDNS_SECTION_ANSWER) {
    return {make_response_packet(query.packet(), rcode, rr, section), Provenance::BACKEND};
}

static inline Uint8View as_view(const Uint8Vector &data) {
    return {data.data(), data.size()};
}

static inline Uint8Vector to_wire(const ldns_pkt *pkt) {
    Uint8Vector wire = encode_packet(pkt);
    EXPECT_FALSE(wire.empty());
    return wire;
}

} // namespace lb::dns::test
