#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "shroud/cache/anonymous_cache.h"
#include "shroud/common/defs.h"
#include "shroud/common/error.h"
#include "shroud/common/logger.h"
#include "shroud/loader/source.h"
#include "shroud/loader/source_fetcher.h"
#include "shroud/loader/source_loader.h"
#include "shroud/upstream/connection.h"
#include "shroud/upstream/connection_pool.h"
#include "shroud/upstream/server.h"

namespace shroud::dns {

struct ResolveSettings {
    /** Default resolution timeout */
    Millis timeout{5000};
    /** Maximum number of servers tried for one resolution */
    uint32_t max_attempts = 3;
    /** Time given to one server before failing over to the next one, bounded by the remaining timeout */
    Millis per_server_timeout{2000};
    /** TTL of responses without records, e.g. NXDOMAIN without SOA */
    Secs negative_ttl{60};
};

/**
 * Core settings
 */
struct CoreSettings {
    /**
     * Get the default settings. They have no servers and no sources, so they do not validate as is.
     */
    static const CoreSettings &get_default();

    /** Upstream servers, encrypted only */
    std::vector<ServerConfig> servers;
    /** Blocklist sources */
    std::vector<SourceConfig> sources;

    CacheSettings cache;
    /** Period of the expired cache entries sweep, 0 disables it */
    Millis cache_sweep_interval{60000};

    /** Connection pool and circuit breaker settings */
    PoolSettings pool;

    ResolveSettings resolve;

    LoaderSettings loader;
    /** Period of the automatic source reload, 0 disables it */
    Millis source_refresh_interval{0};
    /** Maximum number of domains in one `check_batch` call */
    size_t max_batch_size = 100;

    /**
     * Transports for DOH and DOQ servers. DOT has a built-in transport which is used
     * unless a factory is given here.
     */
    HashMap<Protocol, ConnectionFactoryPtr> transports;
    /** PEM bundle trusted by the built-in DOT transport, empty for the system trust store */
    std::string ca_file;
    /** Fetcher for remote sources, only local ones are supported if null */
    SourceFetcherPtr fetcher;

    LogLevel log_level = LogLevel::LOG_LEVEL_INFO;
};

enum class CoreInitError {
    AE_ALREADY_INITIALIZED,
    AE_NO_SERVERS,
    AE_INVALID_SERVER,
    AE_PROTOCOL_NOT_SUPPORTED,
    AE_INVALID_SOURCE,
    AE_DUPLICATE_NAME,
    AE_INVALID_SETTINGS,
    AE_TRANSPORT_INIT_ERROR,
    AE_EVENT_LOOP_INIT_ERROR,
};

/**
 * Check the settings for problems which make initialization impossible
 * @return the first problem found, nullptr if there are none
 */
Error<CoreInitError> validate_settings(const CoreSettings &settings);

} // namespace shroud::dns

template <>
struct shroud::ErrorCodeToString<shroud::dns::CoreInitError> {
    std::string operator()(shroud::dns::CoreInitError e) {
        switch (e) {
        case decltype(e)::AE_ALREADY_INITIALIZED: return "Already initialized";
        case decltype(e)::AE_NO_SERVERS: return "No upstream servers configured";
        case decltype(e)::AE_INVALID_SERVER: return "Invalid server";
        case decltype(e)::AE_PROTOCOL_NOT_SUPPORTED: return "No transport for the server protocol";
        case decltype(e)::AE_INVALID_SOURCE: return "Invalid source";
        case decltype(e)::AE_DUPLICATE_NAME: return "Name is not unique";
        case decltype(e)::AE_INVALID_SETTINGS: return "Invalid settings";
        case decltype(e)::AE_TRANSPORT_INIT_ERROR: return "Failed to initialize a transport";
        case decltype(e)::AE_EVENT_LOOP_INIT_ERROR: return "Failed to create the event loop";
        }
        return "Unknown error";
    }
};
