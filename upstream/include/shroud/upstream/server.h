#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "shroud/common/clock.h"
#include "shroud/common/defs.h"
#include "shroud/common/error.h"

namespace shroud::dns {

/**
 * Encrypted transport of an upstream server. There is no plaintext protocol.
 */
enum class Protocol {
    DOT, /**< DNS-over-TLS, RFC 7858 */
    DOH, /**< DNS-over-HTTPS, RFC 8484 */
    DOQ, /**< DNS-over-QUIC, RFC 9250 */
};

/**
 * Upstream server description
 */
struct ServerConfig {
    /** Unique server name */
    std::string name;
    /** IP address literal, host names are not resolved to avoid plaintext bootstrap lookups */
    std::string address;
    uint16_t port = 853;
    Protocol protocol = Protocol::DOT;
    /** Name used for SNI and certificate verification, the address is used if empty */
    std::string tls_server_name;
    /** Higher priority servers are tried first */
    int32_t priority = 0;
};

enum class BreakerState {
    CLOSED,    /**< Requests pass */
    OPEN,      /**< Requests are rejected until the cool-down elapses */
    HALF_OPEN, /**< One trial request is allowed */
};

/**
 * Health of a server as seen by the connection pool
 */
struct ServerHealth {
    std::string name;
    Protocol protocol = Protocol::DOT;
    int32_t priority = 0;
    BreakerState state = BreakerState::CLOSED;
    uint32_t consecutive_failures = 0;
    SteadyClock::time_point last_transition{};
    /** Average latency of the last exchanges, nullopt if there were none */
    std::optional<Micros> latency;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
};

enum class PoolError {
    AE_UNKNOWN_SERVER,
    AE_CIRCUIT_OPEN,
    AE_TIMED_OUT,
    AE_CONNECT_FAILED,
    AE_SHUTTING_DOWN,
    AE_DUPLICATE_SERVER,
    AE_INVALID_SERVER,
    AE_PROTOCOL_NOT_SUPPORTED,
};

} // namespace shroud::dns

template <>
struct shroud::ErrorCodeToString<shroud::dns::PoolError> {
    std::string operator()(shroud::dns::PoolError e) {
        switch (e) {
        case decltype(e)::AE_UNKNOWN_SERVER: return "Unknown server";
        case decltype(e)::AE_CIRCUIT_OPEN: return "Circuit breaker is open";
        case decltype(e)::AE_TIMED_OUT: return "Timed out waiting for a connection";
        case decltype(e)::AE_CONNECT_FAILED: return "Failed to connect";
        case decltype(e)::AE_SHUTTING_DOWN: return "Shutting down";
        case decltype(e)::AE_DUPLICATE_SERVER: return "Server name is not unique";
        case decltype(e)::AE_INVALID_SERVER: return "Invalid server configuration";
        case decltype(e)::AE_PROTOCOL_NOT_SUPPORTED: return "No transport for the protocol";
        }
        return "Unknown error";
    }
};
