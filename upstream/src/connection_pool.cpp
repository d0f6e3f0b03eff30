#include <condition_variable>
#include <list>
#include <mutex>

#include <magic_enum.hpp>

#include "shroud/common/utils.h"
#include "shroud/upstream/connection_pool.h"

namespace shroud::dns {

static constexpr size_t LATENCY_WINDOW_SIZE = 10;

namespace detail {

struct PoolSlot {
    struct IdleConnection {
        ConnectionPtr conn;
        SteadyClock::time_point since;
    };

    ServerConfig config;
    ConnectionFactoryPtr factory;
    CircuitBreaker breaker;

    std::mutex mtx;
    std::condition_variable cv;
    // Most recently used at the back
    std::list<IdleConnection> idle;
    size_t in_use = 0;
    bool shutting_down = false;
    std::optional<RunningAverage<Micros, LATENCY_WINDOW_SIZE>> latency;
    uint64_t successes = 0;
    uint64_t failures = 0;

    PoolSlot(ServerConfig config, ConnectionFactoryPtr factory, BreakerSettings breaker_settings,
            CircuitBreaker::StateListener listener)
            : config(std::move(config))
            , factory(std::move(factory))
            , breaker(std::move(breaker_settings), std::move(listener)) {
    }
};

} // namespace detail

PooledConnection::PooledConnection(std::shared_ptr<detail::PoolSlot> slot, ConnectionPtr conn, bool trial)
        : m_slot(std::move(slot))
        , m_conn(std::move(conn))
        , m_trial(trial) {
}

PooledConnection::~PooledConnection() {
    if (m_slot == nullptr) {
        return;
    }
    // Dropped without release: give the place back without a verdict
    {
        std::scoped_lock l(m_slot->mtx);
        --m_slot->in_use;
    }
    m_slot->cv.notify_one();
    if (m_trial) {
        m_slot->breaker.cancel_trial();
    }
}

Connection::ExchangeResult PooledConnection::exchange(Uint8View request, Millis timeout) {
    utils::Timer timer;
    auto result = m_conn->exchange(request, timeout);
    if (result.has_value()) {
        m_latency = timer.elapsed<Micros>();
    }
    return result;
}

const std::string &PooledConnection::server_name() const {
    return m_slot->config.name;
}

Protocol PooledConnection::protocol() const {
    return m_slot->config.protocol;
}

ConnectionPool::ConnectionPool(PoolSettings settings)
        : m_settings(std::move(settings)) {
    m_settings.max_connections_per_server = std::max<size_t>(m_settings.max_connections_per_server, 1);
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

ConnectionPool::CreateResult ConnectionPool::create(PoolSettings settings, const std::vector<ServerConfig> &servers,
        FactoryMap factories, BreakerListener listener) {
    std::unique_ptr<ConnectionPool> pool{new ConnectionPool(std::move(settings))};
    for (const ServerConfig &server : servers) {
        if (server.name.empty() || server.address.empty()) {
            return make_error(PoolError::AE_INVALID_SERVER, "name and address are required");
        }
        if (pool->m_slots_by_name.count(server.name) != 0) {
            return make_error(PoolError::AE_DUPLICATE_SERVER, server.name);
        }
        auto factory = factories.find(server.protocol);
        if (factory == factories.end() || factory->second == nullptr) {
            return make_error(PoolError::AE_PROTOCOL_NOT_SUPPORTED,
                    SHROUD_FMT("{}: {}", server.name, magic_enum::enum_name(server.protocol)));
        }
        // Slots may outlive the pool, so the listener owns everything it uses
        CircuitBreaker::StateListener on_transition = [log = pool->m_log, listener, name = server.name](
                                                              BreakerState from, BreakerState to) {
            infolog(log, "{}: circuit breaker {} -> {}", name, magic_enum::enum_name(from),
                    magic_enum::enum_name(to));
            if (listener) {
                listener(name, from, to);
            }
        };
        auto slot = std::make_shared<detail::PoolSlot>(
                server, factory->second, pool->m_settings.breaker, std::move(on_transition));
        pool->m_slots.push_back(slot);
        pool->m_slots_by_name.emplace(server.name, std::move(slot));
    }
    return std::move(pool);
}

std::shared_ptr<detail::PoolSlot> ConnectionPool::find_slot(std::string_view server) const {
    auto it = m_slots_by_name.find(std::string{server});
    return (it != m_slots_by_name.end()) ? it->second : nullptr;
}

ConnectionPool::AcquireResult ConnectionPool::acquire(std::string_view server, Protocol protocol, Millis timeout) {
    std::shared_ptr<detail::PoolSlot> slot = find_slot(server);
    if (slot == nullptr || slot->config.protocol != protocol) {
        return make_error(PoolError::AE_UNKNOWN_SERVER);
    }
    if (m_shutting_down) {
        return make_error(PoolError::AE_SHUTTING_DOWN);
    }
    CircuitBreaker::Admission admission = slot->breaker.try_acquire();
    if (!admission.allowed) {
        return make_error(PoolError::AE_CIRCUIT_OPEN);
    }
    utils::ScopeExit cancel_trial([&] {
        if (admission.trial) {
            slot->breaker.cancel_trial();
        }
    });

    auto deadline = SteadyClock::now() + timeout;
    std::vector<ConnectionPtr> stale;
    std::unique_lock l(slot->mtx);
    for (;;) {
        if (slot->shutting_down) {
            return make_error(PoolError::AE_SHUTTING_DOWN);
        }

        while (!slot->idle.empty()) {
            detail::PoolSlot::IdleConnection idle = std::move(slot->idle.back());
            slot->idle.pop_back();
            if (SteadyClock::now() - idle.since < m_settings.idle_timeout && idle.conn->is_open()) {
                ++slot->in_use;
                cancel_trial.release();
                return PooledConnectionPtr{new PooledConnection(slot, std::move(idle.conn), admission.trial)};
            }
            stale.emplace_back(std::move(idle.conn));
        }

        auto remaining = std::chrono::duration_cast<Millis>(deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            return make_error(PoolError::AE_TIMED_OUT);
        }

        if (slot->in_use < m_settings.max_connections_per_server) {
            ++slot->in_use;
            l.unlock();
            stale.clear();
            auto result = slot->factory->connect(slot->config, remaining);
            if (result.has_error()) {
                {
                    std::scoped_lock sl(slot->mtx);
                    --slot->in_use;
                    ++slot->failures;
                }
                slot->cv.notify_one();
                cancel_trial.release();
                slot->breaker.record_failure(admission.trial);
                dbglog(m_log, "{}: failed to connect: {}", slot->config.name, result.error()->str());
                return make_error(PoolError::AE_CONNECT_FAILED, result.error());
            }
            cancel_trial.release();
            return PooledConnectionPtr{new PooledConnection(slot, std::move(result.value()), admission.trial)};
        }

        slot->cv.wait_for(l, remaining);
    }
}

void ConnectionPool::release(PooledConnectionPtr conn, bool was_error) {
    if (conn == nullptr || conn->m_slot == nullptr) {
        return;
    }
    std::shared_ptr<detail::PoolSlot> slot = std::move(conn->m_slot);
    ConnectionPtr to_close;
    {
        std::scoped_lock l(slot->mtx);
        --slot->in_use;
        if (was_error) {
            ++slot->failures;
            to_close = std::move(conn->m_conn);
        } else {
            ++slot->successes;
            if (conn->m_latency.has_value()) {
                if (!slot->latency.has_value()) {
                    slot->latency.emplace(*conn->m_latency);
                } else {
                    slot->latency->update(*conn->m_latency);
                }
            }
            if (slot->shutting_down) {
                to_close = std::move(conn->m_conn);
            } else {
                slot->idle.push_back({.conn = std::move(conn->m_conn), .since = SteadyClock::now()});
            }
        }
    }
    slot->cv.notify_one();

    if (was_error) {
        slot->breaker.record_failure(conn->m_trial);
    } else {
        slot->breaker.record_success(conn->m_trial);
    }
}

size_t ConnectionPool::sweep_idle() {
    size_t closed = 0;
    auto now = SteadyClock::now();
    for (const auto &slot : m_slots) {
        std::vector<ConnectionPtr> stale;
        {
            std::scoped_lock l(slot->mtx);
            for (auto it = slot->idle.begin(); it != slot->idle.end();) {
                if (now - it->since >= m_settings.idle_timeout || !it->conn->is_open()) {
                    stale.emplace_back(std::move(it->conn));
                    it = slot->idle.erase(it);
                } else {
                    ++it;
                }
            }
        }
        if (!stale.empty()) {
            dbglog(m_log, "{}: closing {} idle connections", slot->config.name, stale.size());
        }
        closed += stale.size();
    }
    return closed;
}

void ConnectionPool::shutdown() {
    if (m_shutting_down.exchange(true)) {
        return;
    }
    for (const auto &slot : m_slots) {
        std::list<detail::PoolSlot::IdleConnection> idle;
        {
            std::scoped_lock l(slot->mtx);
            slot->shutting_down = true;
            idle.swap(slot->idle);
        }
        slot->cv.notify_all();
    }
}

std::vector<ServerConfig> ConnectionPool::servers() const {
    std::vector<ServerConfig> result;
    result.reserve(m_slots.size());
    for (const auto &slot : m_slots) {
        result.push_back(slot->config);
    }
    std::stable_sort(result.begin(), result.end(), [](const ServerConfig &l, const ServerConfig &r) {
        return l.priority > r.priority;
    });
    return result;
}

std::vector<ServerHealth> ConnectionPool::health() const {
    std::vector<ServerHealth> result;
    result.reserve(m_slots.size());
    for (const auto &slot : m_slots) {
        ServerHealth &h = result.emplace_back();
        h.name = slot->config.name;
        h.protocol = slot->config.protocol;
        h.priority = slot->config.priority;
        h.state = slot->breaker.state();
        h.consecutive_failures = slot->breaker.consecutive_failures();
        h.last_transition = slot->breaker.last_transition();
        std::scoped_lock l(slot->mtx);
        if (slot->latency.has_value()) {
            h.latency = slot->latency->get();
        }
        h.idle_connections = slot->idle.size();
        h.active_connections = slot->in_use;
        h.successes = slot->successes;
        h.failures = slot->failures;
    }
    return result;
}

std::optional<BreakerState> ConnectionPool::breaker_state(std::string_view server) const {
    std::shared_ptr<detail::PoolSlot> slot = find_slot(server);
    if (slot == nullptr) {
        return std::nullopt;
    }
    return slot->breaker.state();
}

} // namespace shroud::dns
