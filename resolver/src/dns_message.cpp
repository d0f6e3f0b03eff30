#include <algorithm>
#include <charconv>
#include <string>

#include "shroud/common/utils.h"
#include "shroud/resolver/dns_message.h"

namespace shroud::dns {

static constexpr size_t DNS_HEADER_LENGTH = 12;

std::optional<uint16_t> parse_qtype(std::string_view qtype) {
    utils::trim(qtype);
    if (qtype.empty()) {
        return std::nullopt;
    }
    uint16_t value = 0;
    auto [ptr, ec] = std::from_chars(qtype.data(), qtype.data() + qtype.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::nullopt;
    }
    if (ec == std::errc{} && ptr == qtype.data() + qtype.size()) {
        if (value == 0) {
            return std::nullopt;
        }
        return value;
    }
    std::string name = utils::to_upper(qtype);
    ldns_rr_type type = ldns_get_rr_type_by_name(name.c_str());
    if (type == 0) {
        return std::nullopt;
    }
    switch (type) {
    case LDNS_RR_TYPE_AXFR:
    case LDNS_RR_TYPE_IXFR:
    case LDNS_RR_TYPE_OPT:
        return std::nullopt;
    default:
        return (uint16_t) type;
    }
}

Result<Query, DnsError> make_query(std::string_view domain, uint16_t qtype) {
    std::string fqdn{domain};
    if (fqdn.empty() || fqdn.back() != '.') {
        fqdn.push_back('.');
    }
    ldns_rdf *name = ldns_dname_new_frm_str(fqdn.c_str());
    if (name == nullptr) {
        return make_error(DnsError::AE_ENCODE_ERROR, "invalid name");
    }
    // Takes ownership of the name
    LdnsPktPtr pkt{ldns_pkt_query_new(name, (ldns_rr_type) qtype, LDNS_RR_CLASS_IN, LDNS_RD)};
    if (pkt == nullptr) {
        return make_error(DnsError::AE_ENCODE_ERROR, "failed to create query");
    }
    ldns_pkt_set_random_id(pkt.get());

    uint8_t *wire = nullptr;
    size_t size = 0;
    if (ldns_status status = ldns_pkt2wire(&wire, pkt.get(), &size); status != LDNS_STATUS_OK) {
        return make_error(DnsError::AE_ENCODE_ERROR, ldns_get_errorstr_by_id(status));
    }
    LdnsBufferPtr buffer{wire};
    return Query{
            .wire = Uint8Vector{wire, wire + size},
            .id = ldns_pkt_id(pkt.get()),
            .name = std::move(fqdn),
            .qtype = qtype,
    };
}

static uint32_t min_rr_ttl(const ldns_rr_list *list, uint32_t current) {
    for (size_t i = 0; i < ldns_rr_list_rr_count(list); ++i) {
        current = std::min(current, ldns_rr_ttl(ldns_rr_list_rr(list, i)));
    }
    return current;
}

static bool question_matches(const ldns_pkt *pkt, const Query &query) {
    const ldns_rr_list *questions = ldns_pkt_question(pkt);
    if (ldns_rr_list_rr_count(questions) != 1) {
        return false;
    }
    const ldns_rr *question = ldns_rr_list_rr(questions, 0);
    if (ldns_rr_get_type(question) != query.qtype || ldns_rr_get_class(question) != LDNS_RR_CLASS_IN) {
        return false;
    }
    LdnsRdfPtr expected{ldns_dname_new_frm_str(query.name.c_str())};
    // Names compare case-insensitively
    return expected != nullptr && 0 == ldns_dname_compare(ldns_rr_owner(question), expected.get());
}

Result<ResolvedResponse, DnsError> parse_reply(Uint8View reply, const Query &query, Secs negative_ttl) {
    if (reply.size() < DNS_HEADER_LENGTH) {
        return make_error(DnsError::AE_RESPONSE_PACKET_TOO_SHORT);
    }
    ldns_pkt *raw = nullptr;
    if (ldns_status status = ldns_wire2pkt(&raw, reply.data(), reply.size()); status != LDNS_STATUS_OK) {
        return make_error(DnsError::AE_DECODE_ERROR, ldns_get_errorstr_by_id(status));
    }
    LdnsPktPtr pkt{raw};
    if (ldns_pkt_id(pkt.get()) != query.id) {
        return make_error(DnsError::AE_REPLY_PACKET_ID_MISMATCH);
    }
    if (!ldns_pkt_qr(pkt.get())) {
        return make_error(DnsError::AE_BAD_RESPONSE, "not a response");
    }
    if (!question_matches(pkt.get(), query)) {
        return make_error(DnsError::AE_BAD_RESPONSE, "question mismatch");
    }
    switch (ldns_pkt_get_rcode(pkt.get())) {
    case LDNS_RCODE_SERVFAIL:
        return make_error(DnsError::AE_BAD_RESPONSE, "SERVFAIL");
    case LDNS_RCODE_REFUSED:
        return make_error(DnsError::AE_BAD_RESPONSE, "REFUSED");
    default:
        break;
    }

    uint32_t ttl = UINT32_MAX;
    ttl = min_rr_ttl(ldns_pkt_answer(pkt.get()), ttl);
    ttl = min_rr_ttl(ldns_pkt_authority(pkt.get()), ttl);
    ttl = min_rr_ttl(ldns_pkt_additional(pkt.get()), ttl);

    ResolvedResponse response{.payload = Uint8Vector{reply.begin(), reply.end()}};
    response.ttl = (ttl == UINT32_MAX) ? negative_ttl : Secs{ttl};
    return response;
}

} // namespace shroud::dns
