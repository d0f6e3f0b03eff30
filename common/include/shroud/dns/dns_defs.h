#pragma once

#include <cstdint>
#include <string>

#include "shroud/common/defs.h"
#include "shroud/common/error.h"

namespace shroud::dns {

/**
 * Errors that can happen during a DNS exchange with one server
 */
enum class DnsError {
    AE_ENCODE_ERROR,
    AE_DECODE_ERROR,
    AE_HANDSHAKE_ERROR,
    AE_REPLY_PACKET_ID_MISMATCH,
    AE_RESPONSE_PACKET_TOO_SHORT,
    AE_BAD_RESPONSE,
    AE_SOCKET_ERROR,
    AE_CONNECTION_CLOSED,
    AE_INTERNAL_ERROR,
    AE_TIMED_OUT,
    AE_SHUTTING_DOWN,
};

/**
 * Errors of a whole resolution
 */
enum class ResolveError {
    AE_NOT_INITIALIZED,
    AE_INVALID_DOMAIN,
    AE_INVALID_QTYPE,
    AE_TIMED_OUT,
    AE_RESOLUTION_FAILED,
    AE_ALL_SERVERS_UNAVAILABLE,
    AE_SHUTTING_DOWN,
};

} // namespace shroud::dns

// clang-format off
template <>
struct shroud::ErrorCodeToString<shroud::dns::DnsError> {
    std::string operator()(shroud::dns::DnsError e) {
        switch (e) {
        case decltype(e)::AE_ENCODE_ERROR: return "Can't encode request";
        case decltype(e)::AE_DECODE_ERROR: return "Can't decode reply";
        case decltype(e)::AE_HANDSHAKE_ERROR: return "Error while handshaking to server";
        case decltype(e)::AE_REPLY_PACKET_ID_MISMATCH: return "Packet ID of reply doesn't match request";
        case decltype(e)::AE_RESPONSE_PACKET_TOO_SHORT: return "Response packet too short";
        case decltype(e)::AE_BAD_RESPONSE: return "Bad response";
        case decltype(e)::AE_SOCKET_ERROR: return "Socket error";
        case decltype(e)::AE_CONNECTION_CLOSED: return "Connection closed";
        case decltype(e)::AE_INTERNAL_ERROR: return "Internal error";
        case decltype(e)::AE_TIMED_OUT: return "Timed out";
        case decltype(e)::AE_SHUTTING_DOWN: return "Shutting down";
        }
        return "Unknown error";
    }
};

template <>
struct shroud::ErrorCodeToString<shroud::dns::ResolveError> {
    std::string operator()(shroud::dns::ResolveError e) {
        switch (e) {
        case decltype(e)::AE_NOT_INITIALIZED: return "Not initialized";
        case decltype(e)::AE_INVALID_DOMAIN: return "Invalid domain name";
        case decltype(e)::AE_INVALID_QTYPE: return "Invalid query type";
        case decltype(e)::AE_TIMED_OUT: return "Resolution deadline exceeded";
        case decltype(e)::AE_RESOLUTION_FAILED: return "Resolution failed";
        case decltype(e)::AE_ALL_SERVERS_UNAVAILABLE: return "All servers are unavailable";
        case decltype(e)::AE_SHUTTING_DOWN: return "Shutting down";
        }
        return "Unknown error";
    }
};
// clang-format on
