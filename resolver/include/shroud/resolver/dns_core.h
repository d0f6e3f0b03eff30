#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shroud/blocklist/blocklist.h"
#include "shroud/cache/anonymous_cache.h"
#include "shroud/common/error.h"
#include "shroud/dns/dns_defs.h"
#include "shroud/loader/source.h"
#include "shroud/resolver/core_settings.h"
#include "shroud/stats/stats_aggregator.h"
#include "shroud/upstream/server.h"

namespace shroud::dns {

enum class CoreError {
    AE_NOT_INITIALIZED,
    AE_INVALID_QTYPE,
    AE_BATCH_TOO_LARGE,
};

struct ResolveResult {
    bool blocked = false;
    /** Category of the matched rule */
    std::optional<Category> category;
    /** Wire-format response, absent for blocked domains and on error */
    std::optional<Uint8Vector> response;
    /** The response came from the cache or from a concurrent resolution of the same query */
    bool from_cache = false;
    Error<ResolveError> error;
};

struct CoreStats {
    StatsSnapshot counters;
    /** Every configured server with its breaker state and latency estimate */
    std::vector<ServerHealth> servers;
    CacheStats cache;
    std::vector<SourceStatus> sources;
    /** Number of entries in the published snapshot */
    size_t snapshot_entries = 0;
};

/**
 * Blocklist matching and anonymous encrypted resolution.
 * Owns all the state: matching engine, source loader, cache, connection pool, stats and timers.
 * All methods except `init` and `deinit` may be called concurrently.
 */
class DnsCore {
public:
    using CheckResultEx = Result<CheckResult, CoreError>;
    using BatchCheckResult = Result<std::vector<CheckResult>, CoreError>;

    DnsCore();
    ~DnsCore();

    DnsCore(const DnsCore &) = delete;
    DnsCore(DnsCore &&) = delete;
    DnsCore &operator=(const DnsCore &) = delete;
    DnsCore &operator=(DnsCore &&) = delete;

    /**
     * Validate the settings, create the subsystems and load the sources.
     * Source load failures are not fatal, they are reported in `stats()`.
     * @return nullptr on success
     */
    [[nodiscard]] Error<CoreInitError> init(CoreSettings settings);

    /**
     * Stop the timers and drop all state
     */
    void deinit();

    /**
     * Check a domain against the blocklist
     * @param qtype query type mnemonic or number, the verdict does not depend on it
     */
    [[nodiscard]] CheckResultEx check(std::string_view domain, std::string_view qtype = "A") const;

    /**
     * Check up to `max_batch_size` domains against one snapshot
     */
    [[nodiscard]] BatchCheckResult check_batch(const std::vector<std::string> &domains) const;

    /**
     * Check the domain and resolve it if it is not blocked
     * @param timeout resolution deadline, the default timeout if nullopt
     */
    ResolveResult resolve(std::string_view domain, std::string_view qtype, std::optional<Millis> timeout = std::nullopt);

    ResolveResult resolve(std::string_view domain, uint16_t qtype, std::optional<Millis> timeout = std::nullopt);

    /**
     * Replace the source list and reload all sources
     */
    std::vector<ReloadResult> reload(std::vector<SourceConfig> sources);

    /**
     * Reload the current source list
     */
    std::vector<ReloadResult> reload();

    [[nodiscard]] CoreStats stats() const;

    /**
     * Measure how long the server takes to answer an A query for `domain` over a new connection.
     * The server does not have to be configured, but a transport for its protocol must be.
     * The exchange bypasses the pool and the circuit breakers and is not counted in the stats.
     * @return round trip time including the connection setup
     */
    Result<Micros, DnsError> test_server(const ServerConfig &server, std::string_view domain, Millis timeout);

    void clear_cache();

    [[nodiscard]] bool initialized() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_pimpl;
};

} // namespace shroud::dns

template <>
struct shroud::ErrorCodeToString<shroud::dns::CoreError> {
    std::string operator()(shroud::dns::CoreError e) {
        switch (e) {
        case decltype(e)::AE_NOT_INITIALIZED: return "Not initialized";
        case decltype(e)::AE_INVALID_QTYPE: return "Invalid query type";
        case decltype(e)::AE_BATCH_TOO_LARGE: return "Too many domains in the batch";
        }
        return "Unknown error";
    }
};
