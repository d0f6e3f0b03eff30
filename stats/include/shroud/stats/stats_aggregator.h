#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "shroud/blocklist/blocklist.h"
#include "shroud/common/clock.h"
#include "shroud/common/defs.h"
#include "shroud/upstream/server.h"

namespace shroud::dns {

/** Stage of query processing whose latency is measured */
enum class Stage : uint8_t {
    CHECK,
    CACHE,
    UPSTREAM,
    TOTAL,
};

static constexpr size_t STAGE_COUNT = 4;

enum class ResolutionOutcome : uint8_t {
    SUCCESS,
    FAILURE,
    TIMEOUT,
};

/** A domain was checked against the blocklist */
struct LookupEvent {
    bool blocked = false;
    std::optional<Category> category;
};

/** A cache lookup finished */
struct CacheEvent {
    bool hit = false;
};

struct LatencyEvent {
    Stage stage = Stage::TOTAL;
    Micros elapsed{0};
};

/** A source finished loading, `source` is the configured source name */
struct SourceEntriesEvent {
    std::string source;
    size_t entries = 0;
    /** The source is no longer configured */
    bool removed = false;
};

/** `server` is the configured server name */
struct BreakerTransitionEvent {
    std::string server;
    BreakerState from = BreakerState::CLOSED;
    BreakerState to = BreakerState::CLOSED;
};

struct ResolutionEvent {
    ResolutionOutcome outcome = ResolutionOutcome::SUCCESS;
};

/**
 * Every event carries numbers, enums and configuration names only
 */
using StatsEvent = std::variant<LookupEvent, CacheEvent, LatencyEvent, SourceEntriesEvent, BreakerTransitionEvent,
        ResolutionEvent>;

struct StatsSnapshot {
    uint64_t lookups = 0;
    uint64_t blocked = 0;
    std::array<uint64_t, CATEGORY_COUNT> blocked_by_category{};
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    /** Hits divided by all cache lookups, 0 if there were none */
    double cache_hit_rate = 0;
    /** Average latency per stage, indexed by `Stage` */
    std::array<Micros, STAGE_COUNT> avg_latency{};
    std::map<std::string, size_t> source_entries;
    /** Number of transitions into each breaker state, indexed by `BreakerState` */
    std::array<uint64_t, 3> breaker_transitions{};
    uint64_t resolutions_succeeded = 0;
    uint64_t resolutions_failed = 0;
    uint64_t resolutions_timed_out = 0;
    Secs uptime{0};

    [[nodiscard]] uint64_t blocked_in(Category category) const {
        return blocked_by_category[(size_t) category];
    }

    [[nodiscard]] Micros latency_of(Stage stage) const {
        return avg_latency[(size_t) stage];
    }
};

/**
 * Anonymous counters. Thread-safe, counters are lock-free.
 */
class StatsAggregator {
public:
    StatsAggregator();

    void record(const StatsEvent &event);

    [[nodiscard]] StatsSnapshot snapshot() const;

    StatsAggregator(const StatsAggregator &) = delete;
    StatsAggregator &operator=(const StatsAggregator &) = delete;
    StatsAggregator(StatsAggregator &&) = delete;
    StatsAggregator &operator=(StatsAggregator &&) = delete;

private:
    struct LatencyCounter {
        std::atomic<uint64_t> total_us{0};
        std::atomic<uint64_t> samples{0};
    };

    SteadyClock::time_point m_started_at;

    std::atomic<uint64_t> m_lookups{0};
    std::atomic<uint64_t> m_blocked{0};
    std::array<std::atomic<uint64_t>, CATEGORY_COUNT> m_blocked_by_category{};
    std::atomic<uint64_t> m_cache_hits{0};
    std::atomic<uint64_t> m_cache_misses{0};
    std::array<LatencyCounter, STAGE_COUNT> m_latency{};
    std::array<std::atomic<uint64_t>, 3> m_breaker_transitions{};
    std::atomic<uint64_t> m_resolutions_succeeded{0};
    std::atomic<uint64_t> m_resolutions_failed{0};
    std::atomic<uint64_t> m_resolutions_timed_out{0};

    mutable WithMtx<std::map<std::string, size_t>> m_source_entries;

    void on(const LookupEvent &e);
    void on(const CacheEvent &e);
    void on(const LatencyEvent &e);
    void on(const SourceEntriesEvent &e);
    void on(const BreakerTransitionEvent &e);
    void on(const ResolutionEvent &e);
};

} // namespace shroud::dns
