#include <algorithm>
#include <cstring>

#include <openssl/evp.h>

#include "shroud/cache/anonymous_cache.h"
#include "shroud/common/utils.h"

namespace shroud::dns {

std::optional<CacheKey> make_cache_key(std::string_view domain, uint16_t qtype) {
    std::string data = utils::to_lower(domain);
    data.push_back('\0');
    data.push_back((char) (qtype >> 8));
    data.push_back((char) (qtype & 0xff));

    CacheKey key{};
    unsigned int len = key.size();
    if (!EVP_Digest(data.data(), data.size(), key.data(), &len, EVP_sha256(), nullptr) || len != key.size()) {
        return std::nullopt;
    }
    return key;
}

size_t AnonymousCache::KeyHash::operator()(const CacheKey &key) const {
    size_t h;
    std::memcpy(&h, key.data(), sizeof(h));
    return h;
}

AnonymousCache::AnonymousCache(CacheSettings settings)
        : m_settings(std::move(settings)) {
    m_settings.shard_count = std::max<size_t>(m_settings.shard_count, 1);
    m_settings.capacity = std::max<size_t>(m_settings.capacity, 1);
    if (m_settings.max_ttl < m_settings.min_ttl) {
        m_settings.max_ttl = m_settings.min_ttl;
    }

    // A shard reaches the whole capacity only if it holds every entry, its own LRU is then the global one
    m_shards.reserve(m_settings.shard_count);
    for (size_t i = 0; i < m_settings.shard_count; ++i) {
        m_shards.emplace_back(std::make_unique<Shard>(m_settings.capacity));
    }
    dbglog(m_log, "Created: capacity={} shards={} ttl=[{}, {}]", m_settings.capacity, m_settings.shard_count,
            m_settings.min_ttl, m_settings.max_ttl);
}

AnonymousCache::~AnonymousCache() = default;

AnonymousCache::Shard &AnonymousCache::shard_for(const CacheKey &key) {
    uint64_t h;
    std::memcpy(&h, key.data() + 8, sizeof(h));
    return *m_shards[h % m_shards.size()];
}

Secs AnonymousCache::clamp_ttl(Secs ttl) const {
    return std::clamp(ttl, m_settings.min_ttl, m_settings.max_ttl);
}

void AnonymousCache::store(Shard &shard, const CacheKey &key, Uint8Vector payload, Secs ttl) {
    SteadyClock::time_point now = SteadyClock::now();
    Secs clamped = clamp_ttl(ttl);
    size_t evicted = 0;
    bool inserted = shard.entries.insert(key,
            CacheEntry{
                    .payload = std::move(payload),
                    .created_at = now,
                    .expires_at = now + clamped,
                    .ttl = clamped,
                    .access_count = 0,
                    .last_access = ++m_access_tick,
            },
            &evicted);
    m_evictions += evicted;
    if (inserted && evicted == 0) {
        ++m_size;
    }
}

void AnonymousCache::evict_excess() {
    size_t size = m_size.load();
    while (size > m_settings.capacity) {
        if (!m_size.compare_exchange_weak(size, size - 1)) {
            continue;
        }
        if (!evict_oldest()) {
            ++m_size;
            return;
        }
        ++m_evictions;
        size = m_size.load();
    }
}

bool AnonymousCache::evict_oldest() {
    while (true) {
        Shard *victim = nullptr;
        uint64_t oldest = 0;
        for (auto &shard : m_shards) {
            std::scoped_lock l(shard->mtx);
            const auto *node = shard->entries.oldest();
            if (node != nullptr && (victim == nullptr || node->second.last_access < oldest)) {
                victim = shard.get();
                oldest = node->second.last_access;
            }
        }
        if (victim == nullptr) {
            return false;
        }

        std::scoped_lock l(victim->mtx);
        const auto *node = victim->entries.oldest();
        // The tail moved while the shards were unlocked
        if (node == nullptr || node->second.last_access != oldest) {
            continue;
        }
        CacheKey key = node->first;
        victim->entries.erase(key);
        return true;
    }
}

std::optional<CacheLookup> AnonymousCache::lookup(Shard &shard, const CacheKey &key) {
    auto acc = shard.entries.get(key);
    if (!acc) {
        return std::nullopt;
    }
    SteadyClock::time_point now = SteadyClock::now();
    if (acc->expires_at <= now) {
        shard.entries.erase(key);
        --m_size;
        ++m_expirations;
        return std::nullopt;
    }
    ++acc->access_count;
    acc->last_access = ++m_access_tick;
    return CacheLookup{
            .payload = acc->payload,
            .ttl = std::chrono::ceil<Secs>(acc->expires_at - now),
            .from_cache = true,
    };
}

std::optional<CacheEntry> AnonymousCache::get(std::string_view domain, uint16_t qtype) {
    std::optional<CacheKey> key = make_cache_key(domain, qtype);
    if (!key.has_value()) {
        ++m_misses;
        return std::nullopt;
    }
    Shard &shard = shard_for(*key);
    std::scoped_lock l(shard.mtx);
    if (!lookup(shard, *key).has_value()) {
        ++m_misses;
        return std::nullopt;
    }
    ++m_hits;
    return *shard.entries.get(*key);
}

bool AnonymousCache::put(std::string_view domain, uint16_t qtype, Uint8Vector payload, Secs ttl) {
    if (ttl <= Secs{0}) {
        return false;
    }
    std::optional<CacheKey> key = make_cache_key(domain, qtype);
    if (!key.has_value()) {
        warnlog(m_log, "Failed to compute cache key");
        return false;
    }
    Shard &shard = shard_for(*key);
    {
        std::scoped_lock l(shard.mtx);
        store(shard, *key, std::move(payload), ttl);
    }
    evict_excess();
    return true;
}

void AnonymousCache::complete(InflightCall &call, ResolveResult result) {
    {
        std::scoped_lock l(call.mtx);
        call.result = std::move(result);
        call.state = InflightCall::State::COMPLETED;
    }
    call.cv.notify_all();
}

Result<CacheLookup, ResolveError> AnonymousCache::get_or_resolve(
        std::string_view domain, uint16_t qtype, const ResolveFn &resolve, SteadyClock::time_point deadline) {
    std::optional<CacheKey> maybe_key = make_cache_key(domain, qtype);
    if (!maybe_key.has_value()) {
        warnlog(m_log, "Failed to compute cache key, resolving without the cache");
        ++m_misses;
        ResolveResult result = resolve(deadline);
        if (result.has_error()) {
            return result.error();
        }
        return CacheLookup{.payload = std::move(result->payload), .ttl = clamp_ttl(result->ttl)};
    }
    const CacheKey &key = *maybe_key;
    Shard &shard = shard_for(key);

    InflightCallPtr call;
    bool leader = false;
    {
        std::scoped_lock l(shard.mtx);
        if (auto cached = lookup(shard, key); cached.has_value()) {
            ++m_hits;
            return std::move(*cached);
        }
        auto [it, inserted] = shard.inflight.try_emplace(key, nullptr);
        if (inserted) {
            it->second = std::make_shared<InflightCall>();
            leader = true;
        }
        call = it->second;
    }

    if (!leader) {
        ++m_coalesced;
        std::unique_lock l(call->mtx);
        bool completed = call->cv.wait_for(l, deadline - SteadyClock::now(), [&call] {
            return call->state == InflightCall::State::COMPLETED;
        });
        if (!completed) {
            return make_error(ResolveError::AE_TIMED_OUT);
        }
        const ResolveResult &result = *call->result;
        if (result.has_error()) {
            return result.error();
        }
        return CacheLookup{.payload = result->payload, .ttl = clamp_ttl(result->ttl), .shared = true};
    }

    ++m_misses;
    // The in-flight record is released on every exit
    utils::ScopeExit release_call([this, &shard, &key, &call] {
        {
            std::scoped_lock l(shard.mtx);
            shard.inflight.erase(key);
        }
        if (call->state != InflightCall::State::COMPLETED) {
            complete(*call, make_error(ResolveError::AE_RESOLUTION_FAILED));
        }
    });

    ResolveResult result = resolve(deadline);
    if (result.has_error()) {
        complete(*call, result);
        return result.error();
    }

    CacheLookup lookup_result{.payload = result->payload, .ttl = clamp_ttl(result->ttl)};
    if (result->ttl > Secs{0}) {
        {
            std::scoped_lock l(shard.mtx);
            store(shard, key, result->payload, result->ttl);
        }
        evict_excess();
    }
    complete(*call, std::move(result));
    return lookup_result;
}

size_t AnonymousCache::sweep() {
    SteadyClock::time_point now = SteadyClock::now();
    size_t removed = 0;
    for (auto &shard : m_shards) {
        std::scoped_lock l(shard->mtx);
        size_t n = shard->entries.erase_if([now](const CacheKey &, const CacheEntry &e) {
            return e.expires_at <= now;
        });
        m_size -= n;
        removed += n;
    }
    m_expirations += removed;
    if (removed != 0) {
        dbglog(m_log, "Swept {} expired entries", removed);
    }
    return removed;
}

void AnonymousCache::clear() {
    for (auto &shard : m_shards) {
        std::scoped_lock l(shard->mtx);
        m_size -= shard->entries.size();
        shard->entries.clear();
    }
    infolog(m_log, "Cleared");
}

size_t AnonymousCache::size() const {
    return m_size.load();
}

CacheStats AnonymousCache::stats() const {
    return CacheStats{
            .hits = m_hits.load(),
            .misses = m_misses.load(),
            .coalesced = m_coalesced.load(),
            .evictions = m_evictions.load(),
            .expirations = m_expirations.load(),
            .size = size(),
            .capacity = m_settings.capacity,
    };
}

} // namespace shroud::dns
