#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <ldns/ldns.h>

#include "shroud/cache/anonymous_cache.h"
#include "shroud/common/defs.h"
#include "shroud/common/error.h"
#include "shroud/dns/dns_defs.h"

namespace shroud::dns {

using LdnsPktPtr = UniquePtr<ldns_pkt, &ldns_pkt_free>;
using LdnsBufferPtr = UniquePtr<uint8_t, &free>;
using LdnsRdfPtr = UniquePtr<ldns_rdf, &ldns_rdf_deep_free>;

struct Query {
    Uint8Vector wire;
    uint16_t id = 0;
    /** Fully qualified name in the question */
    std::string name;
    uint16_t qtype = 0;
};

/**
 * Parse a query type given by its mnemonic ("A", "AAAA", "TYPE65") or number
 * @return nullopt if the type is unknown or is a meta type which can not be queried
 */
std::optional<uint16_t> parse_qtype(std::string_view qtype);

/**
 * Build a recursive query for the normalized domain with a random ID
 */
Result<Query, DnsError> make_query(std::string_view domain, uint16_t qtype);

/**
 * Check that the reply answers the query: it parses, the ID and the question match,
 * and the server did not refuse
 * @param negative_ttl TTL used if the reply has no records
 * @return the reply with its minimum record TTL
 */
Result<ResolvedResponse, DnsError> parse_reply(Uint8View reply, const Query &query, Secs negative_ttl);

} // namespace shroud::dns
