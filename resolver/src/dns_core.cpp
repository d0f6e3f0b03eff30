#include <algorithm>
#include <functional>

#include <magic_enum.hpp>

#include "shroud/blocklist/domain.h"
#include "shroud/blocklist/matching_engine.h"
#include "shroud/common/event_loop.h"
#include "shroud/common/logger.h"
#include "shroud/common/utils.h"
#include "shroud/loader/source_loader.h"
#include "shroud/resolver/dns_core.h"
#include "shroud/resolver/dns_message.h"
#include "shroud/upstream/connection_pool.h"
#include "shroud/upstream/dot_connection.h"

namespace shroud::dns {

// Members are destroyed bottom up: the loop stops first, the stats used by the pool listener go last
struct DnsCore::Impl {
    Logger log{"dns_core"};
    CoreSettings settings;
    ConnectionPool::FactoryMap transports;
    StatsAggregator stats;
    MatchingEngine engine;
    std::unique_ptr<SourceLoader> loader;
    std::unique_ptr<AnonymousCache> cache;
    std::unique_ptr<ConnectionPool> pool;
    WithMtx<std::vector<SourceConfig>> sources;
    EventLoopPtr loop;

    void record_lookup(const CheckResult &verdict, Micros elapsed);
    void schedule_periodic(Millis interval, std::function<void()> task);
    std::vector<ReloadResult> reload(const std::vector<SourceConfig> &new_sources);
    AnonymousCache::ResolveResult resolve_upstream(
            std::string_view domain, uint16_t qtype, SteadyClock::time_point deadline);
};

void DnsCore::Impl::record_lookup(const CheckResult &verdict, Micros elapsed) {
    if (!verdict.ready) {
        return;
    }
    stats.record(LookupEvent{.blocked = verdict.blocked, .category = verdict.category});
    stats.record(LatencyEvent{.stage = Stage::CHECK, .elapsed = elapsed});
}

void DnsCore::Impl::schedule_periodic(Millis interval, std::function<void()> task) {
    if (interval.count() <= 0) {
        return;
    }
    loop->schedule(interval, [this, interval, task = std::move(task)]() mutable {
        task();
        schedule_periodic(interval, std::move(task));
    });
}

std::vector<ReloadResult> DnsCore::Impl::reload(const std::vector<SourceConfig> &new_sources) {
    std::vector<ReloadResult> results = loader->reload(new_sources);
    HashSet<std::string> configured;
    for (const SourceConfig &source : new_sources) {
        if (source.enabled) {
            configured.insert(source.name);
        }
    }
    for (const ReloadResult &result : results) {
        stats.record(SourceEntriesEvent{
                .source = result.source_name,
                .entries = result.entry_count,
                .removed = configured.count(result.source_name) == 0,
        });
    }
    return results;
}

AnonymousCache::ResolveResult DnsCore::Impl::resolve_upstream(
        std::string_view domain, uint16_t qtype, SteadyClock::time_point deadline) {
    utils::Timer timer;
    utils::ScopeExit record_latency([&] {
        stats.record(LatencyEvent{.stage = Stage::UPSTREAM, .elapsed = timer.elapsed<Micros>()});
    });

    auto query = make_query(domain, qtype);
    if (query.has_error()) {
        return make_error(ResolveError::AE_RESOLUTION_FAILED, query.error());
    }

    uint32_t attempts = 0;
    uint32_t timeouts = 0;
    bool any_eligible = false;
    std::string last_error;
    for (const ServerConfig &server : pool->servers()) {
        if (attempts >= settings.resolve.max_attempts) {
            break;
        }
        auto remaining = std::chrono::duration_cast<Millis>(deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            return make_error(ResolveError::AE_TIMED_OUT);
        }
        // A silent server may only use its share, the rest of the deadline is left for the next ones
        auto attempt_deadline = SteadyClock::now() + std::min(remaining, settings.resolve.per_server_timeout);

        auto conn = pool->acquire(
                server.name, server.protocol, std::chrono::duration_cast<Millis>(attempt_deadline - SteadyClock::now()));
        if (conn.has_error()) {
            switch (conn.error()->value()) {
            case PoolError::AE_CIRCUIT_OPEN:
                continue;
            case PoolError::AE_SHUTTING_DOWN:
                return make_error(ResolveError::AE_SHUTTING_DOWN);
            case PoolError::AE_TIMED_OUT:
                ++timeouts;
                [[fallthrough]];
            default:
                ++attempts;
                any_eligible = true;
                last_error = SHROUD_FMT("{}: {}", server.name, conn.error()->str());
                dbglog(log, "{}", last_error);
                continue;
            }
        }
        ++attempts;
        any_eligible = true;

        auto budget = std::chrono::duration_cast<Millis>(attempt_deadline - SteadyClock::now());
        auto reply = (*conn)->exchange({query->wire.data(), query->wire.size()}, std::max(budget, Millis{1}));
        if (reply.has_error()) {
            // A failed or timed out exchange leaves the stream in an unknown state
            pool->release(std::move(conn.value()), true);
            if (reply.error()->value() == DnsError::AE_TIMED_OUT) {
                ++timeouts;
            }
            last_error = SHROUD_FMT("{}: {}", server.name, reply.error()->str());
            dbglog(log, "{}", last_error);
            continue;
        }

        auto response = parse_reply({reply->data(), reply->size()}, *query, settings.resolve.negative_ttl);
        if (response.has_error()) {
            pool->release(std::move(conn.value()), true);
            last_error = SHROUD_FMT("{}: {}", server.name, response.error()->str());
            dbglog(log, "{}", last_error);
            continue;
        }
        pool->release(std::move(conn.value()), false);
        return std::move(response.value());
    }

    if (!any_eligible) {
        return make_error(ResolveError::AE_ALL_SERVERS_UNAVAILABLE);
    }
    if (SteadyClock::now() >= deadline || timeouts == attempts) {
        return make_error(ResolveError::AE_TIMED_OUT);
    }
    return make_error(ResolveError::AE_RESOLUTION_FAILED, last_error);
}

DnsCore::DnsCore() = default;

DnsCore::~DnsCore() {
    deinit();
}

Error<CoreInitError> DnsCore::init(CoreSettings settings) {
    if (m_pimpl != nullptr) {
        return make_error(CoreInitError::AE_ALREADY_INITIALIZED);
    }
    if (auto err = validate_settings(settings)) {
        return err;
    }
    set_default_log_level(settings.log_level);

    auto impl = std::make_unique<Impl>();

    ConnectionPool::FactoryMap transports = settings.transports;
    bool needs_dot = std::any_of(settings.servers.begin(), settings.servers.end(), [](const ServerConfig &s) {
        return s.protocol == Protocol::DOT;
    });
    if (needs_dot && transports[Protocol::DOT] == nullptr) {
        auto dot = DotConnectionFactory::create(settings.ca_file);
        if (dot.has_error()) {
            return make_error(CoreInitError::AE_TRANSPORT_INIT_ERROR, dot.error());
        }
        transports[Protocol::DOT] = std::move(dot.value());
    }

    impl->transports = transports;
    auto pool = ConnectionPool::create(settings.pool, settings.servers, std::move(transports),
            [stats = &impl->stats](const std::string &server, BreakerState from, BreakerState to) {
                stats->record(BreakerTransitionEvent{.server = server, .from = from, .to = to});
            });
    if (pool.has_error()) {
        switch (pool.error()->value()) {
        case PoolError::AE_DUPLICATE_SERVER:
            return make_error(CoreInitError::AE_DUPLICATE_NAME, pool.error());
        case PoolError::AE_PROTOCOL_NOT_SUPPORTED:
            return make_error(CoreInitError::AE_PROTOCOL_NOT_SUPPORTED, pool.error());
        default:
            return make_error(CoreInitError::AE_INVALID_SERVER, pool.error());
        }
    }
    impl->pool = std::move(pool.value());
    impl->cache = std::make_unique<AnonymousCache>(settings.cache);
    impl->loader = std::make_unique<SourceLoader>(settings.loader, impl->engine, settings.fetcher);
    impl->loop = EventLoop::create();
    if (impl->loop == nullptr) {
        return make_error(CoreInitError::AE_EVENT_LOOP_INIT_ERROR);
    }

    impl->sources.val = settings.sources;
    impl->settings = std::move(settings);

    std::vector<ReloadResult> loaded = impl->reload(impl->sources.val);
    size_t failed = std::count_if(loaded.begin(), loaded.end(), [](const ReloadResult &r) {
        return r.error.has_value();
    });
    if (failed != 0) {
        warnlog(impl->log, "{} of {} sources failed to load", failed, loaded.size());
    }

    Impl *self = impl.get();
    self->schedule_periodic(self->settings.cache_sweep_interval, [self] {
        size_t removed = self->cache->sweep();
        if (removed != 0) {
            dbglog(self->log, "Cache sweep removed {} entries", removed);
        }
    });
    self->schedule_periodic(self->settings.pool.idle_timeout, [self] {
        self->pool->sweep_idle();
    });
    self->schedule_periodic(self->settings.source_refresh_interval, [self] {
        std::vector<SourceConfig> sources;
        {
            std::scoped_lock l(self->sources.mtx);
            sources = self->sources.val;
        }
        self->reload(sources);
    });

    SnapshotPtr snapshot = self->engine.snapshot();
    infolog(self->log, "Initialized: servers={} sources={} entries={}", self->settings.servers.size(),
            self->sources.val.size(), snapshot ? snapshot->size() : 0);
    m_pimpl = std::move(impl);
    return {};
}

void DnsCore::deinit() {
    if (m_pimpl == nullptr) {
        return;
    }
    m_pimpl->loop->stop();
    m_pimpl->loop->join();
    m_pimpl->pool->shutdown();
    infolog(m_pimpl->log, "Deinitialized");
    m_pimpl.reset();
}

bool DnsCore::initialized() const {
    return m_pimpl != nullptr;
}

DnsCore::CheckResultEx DnsCore::check(std::string_view domain, std::string_view qtype) const {
    if (m_pimpl == nullptr) {
        return make_error(CoreError::AE_NOT_INITIALIZED);
    }
    if (!parse_qtype(qtype).has_value()) {
        return make_error(CoreError::AE_INVALID_QTYPE);
    }
    utils::Timer timer;
    CheckResult verdict = m_pimpl->engine.check(domain);
    m_pimpl->record_lookup(verdict, timer.elapsed<Micros>());
    return verdict;
}

DnsCore::BatchCheckResult DnsCore::check_batch(const std::vector<std::string> &domains) const {
    if (m_pimpl == nullptr) {
        return make_error(CoreError::AE_NOT_INITIALIZED);
    }
    if (domains.size() > m_pimpl->settings.max_batch_size) {
        return make_error(CoreError::AE_BATCH_TOO_LARGE,
                SHROUD_FMT("{} domains, limit is {}", domains.size(), m_pimpl->settings.max_batch_size));
    }
    utils::Timer timer;
    std::vector<CheckResult> verdicts = m_pimpl->engine.check_batch(domains);
    Micros per_domain = domains.empty() ? Micros{0} : timer.elapsed<Micros>() / (int64_t) domains.size();
    for (const CheckResult &verdict : verdicts) {
        m_pimpl->record_lookup(verdict, per_domain);
    }
    return verdicts;
}

ResolveResult DnsCore::resolve(std::string_view domain, std::string_view qtype, std::optional<Millis> timeout) {
    std::optional<uint16_t> type = parse_qtype(qtype);
    if (!type.has_value()) {
        return {.error = make_error(ResolveError::AE_INVALID_QTYPE)};
    }
    return resolve(domain, *type, timeout);
}

ResolveResult DnsCore::resolve(std::string_view domain, uint16_t qtype, std::optional<Millis> timeout) {
    if (m_pimpl == nullptr) {
        return {.error = make_error(ResolveError::AE_NOT_INITIALIZED)};
    }
    Impl &impl = *m_pimpl;
    if (qtype == 0) {
        return {.error = make_error(ResolveError::AE_INVALID_QTYPE)};
    }
    auto normalized = normalize_domain(domain);
    if (normalized.has_error()) {
        return {.error = make_error(ResolveError::AE_INVALID_DOMAIN, normalized.error())};
    }

    utils::Timer total;
    utils::ScopeExit record_total([&] {
        impl.stats.record(LatencyEvent{.stage = Stage::TOTAL, .elapsed = total.elapsed<Micros>()});
    });
    auto deadline = SteadyClock::now() + timeout.value_or(impl.settings.resolve.timeout);

    utils::Timer check_timer;
    CheckResult verdict = impl.engine.check(*normalized);
    impl.record_lookup(verdict, check_timer.elapsed<Micros>());

    ResolveResult result{.category = verdict.category};
    if (verdict.blocked) {
        result.blocked = true;
        return result;
    }

    utils::Timer cache_timer;
    const std::string &name = *normalized;
    auto lookup = impl.cache->get_or_resolve(
            name, qtype,
            [&impl, &name, qtype](SteadyClock::time_point leader_deadline) {
                return impl.resolve_upstream(name, qtype, leader_deadline);
            },
            deadline);

    if (lookup.has_error()) {
        impl.stats.record(CacheEvent{.hit = false});
        ResolutionOutcome outcome = (lookup.error()->value() == ResolveError::AE_TIMED_OUT)
                ? ResolutionOutcome::TIMEOUT
                : ResolutionOutcome::FAILURE;
        impl.stats.record(ResolutionEvent{.outcome = outcome});
        result.error = lookup.error();
        return result;
    }

    result.from_cache = lookup->from_cache || lookup->shared;
    impl.stats.record(CacheEvent{.hit = result.from_cache});
    if (lookup->from_cache) {
        impl.stats.record(LatencyEvent{.stage = Stage::CACHE, .elapsed = cache_timer.elapsed<Micros>()});
    }
    impl.stats.record(ResolutionEvent{.outcome = ResolutionOutcome::SUCCESS});
    result.response = std::move(lookup->payload);
    return result;
}

std::vector<ReloadResult> DnsCore::reload(std::vector<SourceConfig> sources) {
    if (m_pimpl == nullptr) {
        return {};
    }
    {
        std::scoped_lock l(m_pimpl->sources.mtx);
        m_pimpl->sources.val = sources;
    }
    return m_pimpl->reload(sources);
}

std::vector<ReloadResult> DnsCore::reload() {
    if (m_pimpl == nullptr) {
        return {};
    }
    std::vector<SourceConfig> sources;
    {
        std::scoped_lock l(m_pimpl->sources.mtx);
        sources = m_pimpl->sources.val;
    }
    return m_pimpl->reload(sources);
}

CoreStats DnsCore::stats() const {
    if (m_pimpl == nullptr) {
        return {};
    }
    SnapshotPtr snapshot = m_pimpl->engine.snapshot();
    return CoreStats{
            .counters = m_pimpl->stats.snapshot(),
            .servers = m_pimpl->pool->health(),
            .cache = m_pimpl->cache->stats(),
            .sources = m_pimpl->loader->statuses(),
            .snapshot_entries = snapshot ? snapshot->size() : 0,
    };
}

Result<Micros, DnsError> DnsCore::test_server(const ServerConfig &server, std::string_view domain, Millis timeout) {
    if (m_pimpl == nullptr) {
        return make_error(DnsError::AE_INTERNAL_ERROR, "not initialized");
    }
    Impl &impl = *m_pimpl;
    auto factory = impl.transports.find(server.protocol);
    if (factory == impl.transports.end() || factory->second == nullptr) {
        return make_error(DnsError::AE_INTERNAL_ERROR,
                SHROUD_FMT("no transport for {}", magic_enum::enum_name(server.protocol)));
    }
    auto normalized = normalize_domain(domain);
    if (normalized.has_error()) {
        return make_error(DnsError::AE_ENCODE_ERROR, normalized.error());
    }
    auto query = make_query(*normalized, LDNS_RR_TYPE_A);
    if (query.has_error()) {
        return query.error();
    }

    // A throwaway connection: neither the pool nor the circuit breakers see this exchange
    utils::Timer timer;
    auto deadline = SteadyClock::now() + timeout;
    auto conn = factory->second->connect(server, timeout);
    if (conn.has_error()) {
        dbglog(impl.log, "{}: test connection failed: {}", server.name, conn.error()->str());
        return conn.error();
    }
    auto remaining = std::chrono::duration_cast<Millis>(deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
        return make_error(DnsError::AE_TIMED_OUT);
    }
    auto reply = (*conn)->exchange({query->wire.data(), query->wire.size()}, remaining);
    if (reply.has_error()) {
        dbglog(impl.log, "{}: test exchange failed: {}", server.name, reply.error()->str());
        return reply.error();
    }
    auto response = parse_reply({reply->data(), reply->size()}, *query, impl.settings.resolve.negative_ttl);
    if (response.has_error()) {
        dbglog(impl.log, "{}: test reply rejected: {}", server.name, response.error()->str());
        return response.error();
    }
    auto elapsed = timer.elapsed<Micros>();
    dbglog(impl.log, "{}: test query answered in {}us", server.name, elapsed.count());
    return elapsed;
}

void DnsCore::clear_cache() {
    if (m_pimpl != nullptr) {
        m_pimpl->cache->clear();
    }
}

} // namespace shroud::dns
