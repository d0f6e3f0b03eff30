#include "shroud/stats/stats_aggregator.h"

namespace shroud::dns {

static constexpr auto RELAXED = std::memory_order_relaxed;

StatsAggregator::StatsAggregator()
        : m_started_at(SteadyClock::now()) {
}

void StatsAggregator::record(const StatsEvent &event) {
    std::visit(
            [this](const auto &e) {
                on(e);
            },
            event);
}

void StatsAggregator::on(const LookupEvent &e) {
    m_lookups.fetch_add(1, RELAXED);
    if (!e.blocked) {
        return;
    }
    m_blocked.fetch_add(1, RELAXED);
    if (e.category.has_value() && (size_t) *e.category < CATEGORY_COUNT) {
        m_blocked_by_category[(size_t) *e.category].fetch_add(1, RELAXED);
    }
}

void StatsAggregator::on(const CacheEvent &e) {
    (e.hit ? m_cache_hits : m_cache_misses).fetch_add(1, RELAXED);
}

void StatsAggregator::on(const LatencyEvent &e) {
    if ((size_t) e.stage >= STAGE_COUNT || e.elapsed.count() < 0) {
        return;
    }
    LatencyCounter &counter = m_latency[(size_t) e.stage];
    counter.total_us.fetch_add(e.elapsed.count(), RELAXED);
    counter.samples.fetch_add(1, RELAXED);
}

void StatsAggregator::on(const SourceEntriesEvent &e) {
    std::scoped_lock l(m_source_entries.mtx);
    if (e.removed) {
        m_source_entries.val.erase(e.source);
    } else {
        m_source_entries.val[e.source] = e.entries;
    }
}

void StatsAggregator::on(const BreakerTransitionEvent &e) {
    m_breaker_transitions[(size_t) e.to].fetch_add(1, RELAXED);
}

void StatsAggregator::on(const ResolutionEvent &e) {
    switch (e.outcome) {
    case ResolutionOutcome::SUCCESS:
        m_resolutions_succeeded.fetch_add(1, RELAXED);
        break;
    case ResolutionOutcome::FAILURE:
        m_resolutions_failed.fetch_add(1, RELAXED);
        break;
    case ResolutionOutcome::TIMEOUT:
        m_resolutions_timed_out.fetch_add(1, RELAXED);
        break;
    }
}

StatsSnapshot StatsAggregator::snapshot() const {
    StatsSnapshot s;
    s.lookups = m_lookups.load(RELAXED);
    s.blocked = m_blocked.load(RELAXED);
    for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
        s.blocked_by_category[i] = m_blocked_by_category[i].load(RELAXED);
    }
    s.cache_hits = m_cache_hits.load(RELAXED);
    s.cache_misses = m_cache_misses.load(RELAXED);
    if (uint64_t total = s.cache_hits + s.cache_misses; total != 0) {
        s.cache_hit_rate = (double) s.cache_hits / (double) total;
    }
    for (size_t i = 0; i < STAGE_COUNT; ++i) {
        uint64_t samples = m_latency[i].samples.load(RELAXED);
        if (samples != 0) {
            s.avg_latency[i] = Micros{m_latency[i].total_us.load(RELAXED) / samples};
        }
    }
    for (size_t i = 0; i < s.breaker_transitions.size(); ++i) {
        s.breaker_transitions[i] = m_breaker_transitions[i].load(RELAXED);
    }
    s.resolutions_succeeded = m_resolutions_succeeded.load(RELAXED);
    s.resolutions_failed = m_resolutions_failed.load(RELAXED);
    s.resolutions_timed_out = m_resolutions_timed_out.load(RELAXED);
    {
        std::scoped_lock l(m_source_entries.mtx);
        s.source_entries = m_source_entries.val;
    }
    s.uptime = std::chrono::duration_cast<Secs>(SteadyClock::now() - m_started_at);
    return s;
}

} // namespace shroud::dns
