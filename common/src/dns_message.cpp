#include <cassert>

#include "lb/common/utils.h"
#include "lb/dns/common/dns_message.h"

namespace lb::dns {

Query::ParseResult Query::from_packet(ldns_pkt_ptr packet) {
    if (packet == nullptr) {
        return {std::nullopt, "Packet is null"};
    }
    const ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(packet.get()), 0);
    if (question == nullptr) {
        return {std::nullopt, "Message has no question section"};
    }

    AllocatedPtr<char> owner{ldns_rdf2str(ldns_rr_owner(question))};
    if (owner == nullptr) {
        return {std::nullopt, "Failed to convert question name"};
    }

    Query query;
    query.m_name = utils::normalize_domain(owner.get());
    query.m_type = ldns_rr_get_type(question);
    query.m_class = ldns_rr_get_class(question);
    query.m_rd = ldns_pkt_rd(packet.get());
    query.m_do = ldns_pkt_edns_do(packet.get());
    query.m_cd = ldns_pkt_cd(packet.get());
    query.m_id = ldns_pkt_id(packet.get());
    query.m_packet = std::move(packet);
    return {std::move(query), std::nullopt};
}

std::string rcode_name(ldns_pkt_rcode rcode) {
    if (const ldns_lookup_table *entry = ldns_lookup_by_id(ldns_rcodes, (int) rcode)) {
        return utils::to_lower(entry->name);
    }
    return LB_FMT("rcode{}", (int) rcode);
}

std::string rr_type_name(ldns_rr_type type) {
    AllocatedPtr<char> str{ldns_rr_type2str(type)};
    return str != nullptr ? std::string{str.get()} : LB_FMT("TYPE{}", (int) type);
}

Uint8Vector encode_packet(const ldns_pkt *packet) {
    ldns_buffer_ptr buffer{ldns_buffer_new(RESPONSE_BUFFER_INITIAL_CAPACITY)};
    if (ldns_pkt2buffer_wire(buffer.get(), packet) != LDNS_STATUS_OK) {
        return {};
    }
    return {ldns_buffer_at(buffer.get(), 0), ldns_buffer_at(buffer.get(), 0) + ldns_buffer_position(buffer.get())};
}

ldns_pkt_ptr create_response_by_request(const ldns_pkt *request) {
    ldns_pkt_ptr response{ldns_pkt_new()};
    assert(response != nullptr);
    ldns_pkt_set_id(response.get(), ldns_pkt_id(request));
    ldns_pkt_set_qr(response.get(), true); // answer flag
    ldns_pkt_set_opcode(response.get(), ldns_pkt_get_opcode(request));
    ldns_pkt_set_rd(response.get(), ldns_pkt_rd(request));
    // RA mirrors the request's RD
    ldns_pkt_set_ra(response.get(), ldns_pkt_rd(request));
    ldns_pkt_set_cd(response.get(), ldns_pkt_cd(request));
    ldns_pkt_set_qdcount(response.get(), ldns_pkt_section_count(request, LDNS_SECTION_QUESTION));
    ldns_rr_list_deep_free(ldns_pkt_question(response.get()));
    ldns_pkt_set_question(response.get(), ldns_pkt_get_section_clone(request, LDNS_SECTION_QUESTION));
    return response;
}

ldns_pkt_ptr create_rcode_response(const ldns_pkt *request, ldns_pkt_rcode rcode) {
    ldns_pkt_ptr response = create_response_by_request(request);
    ldns_pkt_set_rcode(response.get(), rcode);
    return response;
}

ldns_pkt_ptr create_formerr_response(uint16_t id) {
    ldns_pkt_ptr response{ldns_pkt_new()};
    assert(response != nullptr);
    ldns_pkt_set_id(response.get(), id);
    ldns_pkt_set_qr(response.get(), true);
    ldns_pkt_set_rcode(response.get(), LDNS_RCODE_FORMERR);
    return response;
}

} // namespace lb::dns
