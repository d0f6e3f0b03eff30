#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "shroud/cache/anonymous_cache.h"

namespace shroud::dns::test {

using namespace std::chrono_literals;

static constexpr uint16_t QTYPE_A = 1;
static constexpr uint16_t QTYPE_AAAA = 28;

static Uint8Vector payload(std::string_view s) {
    return {s.begin(), s.end()};
}

class AnonymousCacheTest : public ::testing::Test {
protected:
    std::unique_ptr<AnonymousCache> cache;

    void SetUp() override {
        cache = std::make_unique<AnonymousCache>(
                CacheSettings{.capacity = 100, .min_ttl = Secs{0}, .max_ttl = Secs{3600}, .shard_count = 1});
    }

    void TearDown() override {
        SteadyClock::reset_time_shift();
    }
};

TEST_F(AnonymousCacheTest, KeyIsHashed) {
    auto key = make_cache_key("Example.COM", QTYPE_A);
    ASSERT_TRUE(key.has_value());
    ASSERT_TRUE(key == make_cache_key("example.com", QTYPE_A));
    ASSERT_TRUE(key != make_cache_key("example.com", QTYPE_AAAA));
    ASSERT_TRUE(key != make_cache_key("example.org", QTYPE_A));

    std::string_view raw{(const char *) key->data(), key->size()};
    ASSERT_EQ(raw.find("example"), std::string_view::npos);
}

TEST_F(AnonymousCacheTest, PutAndGet) {
    ASSERT_TRUE(cache->put("example.com", QTYPE_A, payload("response"), Secs{60}));
    auto entry = cache->get("example.com", QTYPE_A);
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->payload, payload("response"));
    ASSERT_EQ(entry->ttl, Secs{60});
    ASSERT_EQ(entry->access_count, 1u);
    ASSERT_EQ(cache->get("example.com", QTYPE_A)->access_count, 2u);

    ASSERT_FALSE(cache->get("example.com", QTYPE_AAAA).has_value());

    CacheStats stats = cache->stats();
    ASSERT_EQ(stats.hits, 2u);
    ASSERT_EQ(stats.misses, 1u);
    ASSERT_EQ(stats.size, 1u);
}

TEST_F(AnonymousCacheTest, ZeroTtlIsNotCached) {
    ASSERT_FALSE(cache->put("example.com", QTYPE_A, payload("r"), Secs{0}));
    ASSERT_FALSE(cache->get("example.com", QTYPE_A).has_value());

    auto r = cache->get_or_resolve(
            "zero.example.com", QTYPE_A,
            [](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
                return ResolvedResponse{.payload = payload("r"), .ttl = Secs{0}};
            },
            SteadyClock::now() + 1s);
    ASSERT_FALSE(r.has_error());
    ASSERT_EQ(cache->size(), 0u);
}

TEST_F(AnonymousCacheTest, TtlIsClamped) {
    cache = std::make_unique<AnonymousCache>(
            CacheSettings{.capacity = 10, .min_ttl = Secs{30}, .max_ttl = Secs{120}, .shard_count = 1});
    cache->put("long.example.com", QTYPE_A, payload("r"), Secs{86400});
    cache->put("short.example.com", QTYPE_A, payload("r"), Secs{1});
    ASSERT_EQ(cache->get("long.example.com", QTYPE_A)->ttl, Secs{120});
    ASSERT_EQ(cache->get("short.example.com", QTYPE_A)->ttl, Secs{30});
}

TEST_F(AnonymousCacheTest, EntryExpires) {
    cache->put("example.com", QTYPE_A, payload("r"), Secs{1});
    ASSERT_TRUE(cache->get("example.com", QTYPE_A).has_value());

    SteadyClock::add_time_shift(1100ms);
    ASSERT_FALSE(cache->get("example.com", QTYPE_A).has_value());
    ASSERT_EQ(cache->size(), 0u);
    ASSERT_EQ(cache->stats().expirations, 1u);

    // an expired entry is resolved again
    std::atomic<int> calls = 0;
    auto resolve = [&calls](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
        ++calls;
        return ResolvedResponse{.payload = payload("fresh"), .ttl = Secs{1}};
    };
    auto r = cache->get_or_resolve("example.com", QTYPE_A, resolve, SteadyClock::now() + 1s);
    ASSERT_FALSE(r.has_error());
    ASSERT_FALSE(r->from_cache);
    r = cache->get_or_resolve("example.com", QTYPE_A, resolve, SteadyClock::now() + 1s);
    ASSERT_TRUE(r->from_cache);
    ASSERT_EQ(calls.load(), 1);

    SteadyClock::add_time_shift(1100ms);
    r = cache->get_or_resolve("example.com", QTYPE_A, resolve, SteadyClock::now() + 1s);
    ASSERT_FALSE(r->from_cache);
    ASSERT_EQ(calls.load(), 2);
}

TEST_F(AnonymousCacheTest, Sweep) {
    cache->put("a.example.com", QTYPE_A, payload("r"), Secs{1});
    cache->put("b.example.com", QTYPE_A, payload("r"), Secs{10});
    SteadyClock::add_time_shift(2s);
    ASSERT_EQ(cache->sweep(), 1u);
    ASSERT_EQ(cache->size(), 1u);
    ASSERT_TRUE(cache->get("b.example.com", QTYPE_A).has_value());
}

TEST_F(AnonymousCacheTest, LruEvictionRegardlessOfTtl) {
    cache = std::make_unique<AnonymousCache>(CacheSettings{.capacity = 2, .shard_count = 1});
    cache->put("a.example.com", QTYPE_A, payload("a"), Secs{3600});
    cache->put("b.example.com", QTYPE_A, payload("b"), Secs{10});
    ASSERT_TRUE(cache->get("a.example.com", QTYPE_A).has_value());
    cache->put("c.example.com", QTYPE_A, payload("c"), Secs{10});

    ASSERT_TRUE(cache->get("a.example.com", QTYPE_A).has_value());
    ASSERT_FALSE(cache->get("b.example.com", QTYPE_A).has_value());
    ASSERT_TRUE(cache->get("c.example.com", QTYPE_A).has_value());
    ASSERT_EQ(cache->stats().evictions, 1u);
}

TEST_F(AnonymousCacheTest, ShardedCacheHoldsFullCapacity) {
    static constexpr size_t CAPACITY = 8;
    cache = std::make_unique<AnonymousCache>(CacheSettings{.capacity = CAPACITY});
    for (size_t i = 0; i < CAPACITY; ++i) {
        ASSERT_TRUE(cache->put(fmt::format("host{}.example.com", i), QTYPE_A, payload("r"), Secs{60}));
    }
    ASSERT_EQ(cache->size(), CAPACITY);
    ASSERT_EQ(cache->stats().evictions, 0u);
    for (size_t i = 0; i < CAPACITY; ++i) {
        ASSERT_TRUE(cache->get(fmt::format("host{}.example.com", i), QTYPE_A).has_value()) << i;
    }
}

TEST_F(AnonymousCacheTest, ShardedCacheEvictsLeastRecentlyUsed) {
    static constexpr size_t CAPACITY = 8;
    static constexpr size_t STALE = 3;
    cache = std::make_unique<AnonymousCache>(CacheSettings{.capacity = CAPACITY});
    for (size_t i = 0; i < CAPACITY; ++i) {
        cache->put(fmt::format("host{}.example.com", i), QTYPE_A, payload("r"), Secs{60});
    }
    for (size_t i = 0; i < CAPACITY; ++i) {
        if (i != STALE) {
            ASSERT_TRUE(cache->get(fmt::format("host{}.example.com", i), QTYPE_A).has_value()) << i;
        }
    }

    cache->put("fresh.example.com", QTYPE_A, payload("r"), Secs{60});
    ASSERT_EQ(cache->size(), CAPACITY);
    ASSERT_EQ(cache->stats().evictions, 1u);
    ASSERT_FALSE(cache->get(fmt::format("host{}.example.com", STALE), QTYPE_A).has_value());
    for (size_t i = 0; i < CAPACITY; ++i) {
        if (i != STALE) {
            ASSERT_TRUE(cache->get(fmt::format("host{}.example.com", i), QTYPE_A).has_value()) << i;
        }
    }
    ASSERT_TRUE(cache->get("fresh.example.com", QTYPE_A).has_value());
}

TEST_F(AnonymousCacheTest, ClearResetsSize) {
    cache = std::make_unique<AnonymousCache>(CacheSettings{.capacity = 4});
    for (size_t i = 0; i < 4; ++i) {
        cache->put(fmt::format("host{}.example.com", i), QTYPE_A, payload("r"), Secs{60});
    }
    cache->clear();
    ASSERT_EQ(cache->size(), 0u);
    for (size_t i = 0; i < 4; ++i) {
        cache->put(fmt::format("other{}.example.com", i), QTYPE_A, payload("r"), Secs{60});
    }
    ASSERT_EQ(cache->size(), 4u);
    ASSERT_EQ(cache->stats().evictions, 0u);
}

TEST_F(AnonymousCacheTest, Clear) {
    cache->put("a.example.com", QTYPE_A, payload("a"), Secs{60});
    cache->put("b.example.com", QTYPE_A, payload("b"), Secs{60});
    cache->clear();
    ASSERT_EQ(cache->size(), 0u);
    ASSERT_FALSE(cache->get("a.example.com", QTYPE_A).has_value());
}

TEST_F(AnonymousCacheTest, SingleFlight) {
    static constexpr int CALLERS = 50;
    std::atomic<int> resolver_calls = 0;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    auto resolve = [&](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
        ++resolver_calls;
        released.wait();
        return ResolvedResponse{.payload = payload("shared"), .ttl = Secs{60}};
    };

    std::vector<std::future<Result<CacheLookup, ResolveError>>> results;
    for (int i = 0; i < CALLERS; ++i) {
        results.push_back(std::async(std::launch::async, [&] {
            return cache->get_or_resolve("hot.example.com", QTYPE_A, resolve, SteadyClock::now() + 10s);
        }));
    }

    // let the callers pile up behind the leader
    std::this_thread::sleep_for(200ms);
    release.set_value();

    int shared = 0;
    for (auto &f : results) {
        auto r = f.get();
        ASSERT_FALSE(r.has_error());
        ASSERT_EQ(r->payload, payload("shared"));
        shared += r->shared ? 1 : 0;
    }
    ASSERT_EQ(resolver_calls.load(), 1);
    ASSERT_GT(shared, 0);
    CacheStats stats = cache->stats();
    ASSERT_EQ(stats.misses, 1u);
    ASSERT_EQ(stats.hits + stats.coalesced, (uint64_t) CALLERS - 1);
}

TEST_F(AnonymousCacheTest, DifferentKeysDoNotWait) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto slow = std::async(std::launch::async, [&] {
        return cache->get_or_resolve(
                "slow.example.com", QTYPE_A,
                [&](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
                    released.wait();
                    return ResolvedResponse{.payload = payload("slow"), .ttl = Secs{60}};
                },
                SteadyClock::now() + 10s);
    });
    std::this_thread::sleep_for(50ms);

    auto fast = cache->get_or_resolve(
            "fast.example.com", QTYPE_A,
            [](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
                return ResolvedResponse{.payload = payload("fast"), .ttl = Secs{60}};
            },
            SteadyClock::now() + 1s);
    ASSERT_FALSE(fast.has_error());
    ASSERT_EQ(fast->payload, payload("fast"));

    release.set_value();
    ASSERT_FALSE(slow.get().has_error());
}

TEST_F(AnonymousCacheTest, WaiterHonoursItsDeadline) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto resolve = [&](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
        released.wait();
        return ResolvedResponse{.payload = payload("late"), .ttl = Secs{60}};
    };

    auto leader = std::async(std::launch::async, [&] {
        return cache->get_or_resolve("slow.example.com", QTYPE_A, resolve, SteadyClock::now() + 10s);
    });
    std::this_thread::sleep_for(50ms);

    auto waiter = cache->get_or_resolve("slow.example.com", QTYPE_A, resolve, SteadyClock::now() + 100ms);
    ASSERT_TRUE(waiter.has_error());
    ASSERT_EQ(waiter.error()->value(), ResolveError::AE_TIMED_OUT);

    release.set_value();
    auto r = leader.get();
    ASSERT_FALSE(r.has_error());
    ASSERT_EQ(r->payload, payload("late"));
}

TEST_F(AnonymousCacheTest, FailureIsSharedAndNotCached) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<int> calls = 0;
    auto failing = [&](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
        ++calls;
        released.wait();
        return make_error(ResolveError::AE_ALL_SERVERS_UNAVAILABLE);
    };

    auto leader = std::async(std::launch::async, [&] {
        return cache->get_or_resolve("down.example.com", QTYPE_A, failing, SteadyClock::now() + 10s);
    });
    std::this_thread::sleep_for(50ms);
    auto waiter = std::async(std::launch::async, [&] {
        return cache->get_or_resolve("down.example.com", QTYPE_A, failing, SteadyClock::now() + 10s);
    });
    std::this_thread::sleep_for(50ms);
    release.set_value();

    auto l = leader.get();
    auto w = waiter.get();
    ASSERT_TRUE(l.has_error());
    ASSERT_TRUE(w.has_error());
    ASSERT_EQ(w.error()->value(), ResolveError::AE_ALL_SERVERS_UNAVAILABLE);
    ASSERT_EQ(calls.load(), 1);
    ASSERT_EQ(cache->size(), 0u);

    auto retry = cache->get_or_resolve(
            "down.example.com", QTYPE_A,
            [](SteadyClock::time_point) -> AnonymousCache::ResolveResult {
                return ResolvedResponse{.payload = payload("up"), .ttl = Secs{60}};
            },
            SteadyClock::now() + 1s);
    ASSERT_FALSE(retry.has_error());
    ASSERT_FALSE(retry->from_cache);
}

} // namespace shroud::dns::test
