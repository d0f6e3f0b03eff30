#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "shroud/common/cache.h"
#include "shroud/common/clock.h"
#include "shroud/common/defs.h"
#include "shroud/common/logger.h"
#include "shroud/dns/dns_defs.h"

namespace shroud::dns {

/** SHA-256 digest of the normalized domain and the query type */
using CacheKey = std::array<uint8_t, 32>;

/**
 * Compute the cache key: SHA-256(lowercase(domain) || 0x00 || qtype as 2 bytes big endian).
 * The domain itself is never stored by the cache.
 * @return the key, or nullopt if the digest could not be computed
 */
std::optional<CacheKey> make_cache_key(std::string_view domain, uint16_t qtype);

struct CacheSettings {
    /** Maximum number of entries in the whole cache */
    size_t capacity = 10000;
    /** TTL bounds applied to the stored responses */
    Secs min_ttl{0};
    Secs max_ttl{3600};
    /** Number of independently locked shards */
    size_t shard_count = 8;
};

struct CacheEntry {
    Uint8Vector payload;
    SteadyClock::time_point created_at;
    SteadyClock::time_point expires_at;
    Secs ttl{0};
    uint64_t access_count = 0;
    /** Cache-wide recency stamp, the smallest one is evicted first */
    uint64_t last_access = 0;
};

/**
 * Response produced by a resolver callback
 */
struct ResolvedResponse {
    Uint8Vector payload;
    /** Minimum TTL of the response records, 0 means "do not cache" */
    Secs ttl{0};
};

struct CacheLookup {
    Uint8Vector payload;
    /** Remaining lifetime for a cached response, the stored TTL for a fresh one */
    Secs ttl{0};
    /** The response was taken from the cache */
    bool from_cache = false;
    /** The response was produced by a concurrent call for the same key */
    bool shared = false;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    /** Calls served by waiting for a concurrent resolution */
    uint64_t coalesced = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    size_t size = 0;
    size_t capacity = 0;
};

/**
 * Response cache keyed by hashed names with single-flight resolution.
 * Thread-safe. Entries are sharded, each shard has its own lock, LRU list and in-flight table.
 * The capacity bounds the whole cache: once it is exceeded the least recently used entry
 * among all shards is evicted.
 */
class AnonymousCache {
public:
    using ResolveResult = Result<ResolvedResponse, ResolveError>;
    /**
     * Resolver callback, receives the deadline of the leading caller
     */
    using ResolveFn = std::function<ResolveResult(SteadyClock::time_point deadline)>;

    explicit AnonymousCache(CacheSettings settings);
    ~AnonymousCache();

    /**
     * Get a fresh entry. Expired entries are removed.
     */
    std::optional<CacheEntry> get(std::string_view domain, uint16_t qtype);

    /**
     * Store a response. Responses with zero TTL are not stored.
     * @return true if the response was stored
     */
    bool put(std::string_view domain, uint16_t qtype, Uint8Vector payload, Secs ttl);

    /**
     * Return a fresh cached response or resolve it.
     * Concurrent calls for the same key share one resolution: the first caller runs `resolve`,
     * the others wait for its result until their own deadline.
     * Failed resolutions are passed to the waiting callers and are not cached.
     */
    Result<CacheLookup, ResolveError> get_or_resolve(
            std::string_view domain, uint16_t qtype, const ResolveFn &resolve, SteadyClock::time_point deadline);

    /**
     * Remove expired entries
     * @return number of removed entries
     */
    size_t sweep();

    /**
     * Remove all entries
     */
    void clear();

    [[nodiscard]] CacheStats stats() const;

    [[nodiscard]] size_t size() const;

    AnonymousCache(const AnonymousCache &) = delete;
    AnonymousCache &operator=(const AnonymousCache &) = delete;
    AnonymousCache(AnonymousCache &&) = delete;
    AnonymousCache &operator=(AnonymousCache &&) = delete;

private:
    /** Single-flight call, explicit state machine */
    struct InflightCall {
        enum class State {
            PENDING,
            COMPLETED,
        };

        std::mutex mtx;
        std::condition_variable cv;
        State state = State::PENDING;
        std::optional<ResolveResult> result;
    };
    using InflightCallPtr = std::shared_ptr<InflightCall>;

    struct KeyHash {
        size_t operator()(const CacheKey &key) const;
    };

    struct Shard {
        explicit Shard(size_t capacity)
                : entries(capacity) {
        }

        std::mutex mtx;
        LruCache<CacheKey, CacheEntry, KeyHash> entries;
        std::unordered_map<CacheKey, InflightCallPtr, KeyHash> inflight;
    };

    Logger m_log{"anonymous_cache"};
    CacheSettings m_settings;
    std::vector<std::unique_ptr<Shard>> m_shards;

    std::atomic<uint64_t> m_hits = 0;
    std::atomic<uint64_t> m_misses = 0;
    std::atomic<uint64_t> m_coalesced = 0;
    std::atomic<uint64_t> m_evictions = 0;
    std::atomic<uint64_t> m_expirations = 0;
    std::atomic<uint64_t> m_access_tick = 0;
    std::atomic<size_t> m_size = 0;

    Shard &shard_for(const CacheKey &key);
    Secs clamp_ttl(Secs ttl) const;
    /** Must be called with the shard locked, follow with `evict_excess` once it is unlocked */
    void store(Shard &shard, const CacheKey &key, Uint8Vector payload, Secs ttl);
    void evict_excess();
    bool evict_oldest();
    std::optional<CacheLookup> lookup(Shard &shard, const CacheKey &key);
    static void complete(InflightCall &call, ResolveResult result);
};

} // namespace shroud::dns
