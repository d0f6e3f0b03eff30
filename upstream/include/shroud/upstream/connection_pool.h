#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <iterator>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

#include "shroud/common/clock.h"
#include "shroud/common/defs.h"
#include "shroud/common/error.h"
#include "shroud/common/logger.h"
#include "shroud/upstream/circuit_breaker.h"
#include "shroud/upstream/connection.h"
#include "shroud/upstream/server.h"

namespace shroud::dns {

/**
 * Average over a sliding window of the last N samples
 */
template <typename T, size_t N>
class RunningAverage {
public:
    explicit RunningAverage(T init) {
        set(init);
    }

    void update(T new_val) {
        m_vals[m_idx] = new_val; // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
        m_idx = (m_idx + 1) % N;
    }

    [[nodiscard]] T get() const {
        return std::accumulate(std::begin(m_vals), std::end(m_vals), T{}) / N;
    }

    void set(T value) {
        std::fill(std::begin(m_vals), std::end(m_vals), value);
    }

private:
    T m_vals[N]{};
    size_t m_idx = 0;
};

struct PoolSettings {
    /** Upper bound of open connections (idle and in use) per server */
    size_t max_connections_per_server = 10;
    /** Idle connections older than this are closed */
    Millis idle_timeout{30000};
    BreakerSettings breaker;
};

namespace detail {
struct PoolSlot;
} // namespace detail

class ConnectionPool;

/**
 * Connection borrowed from the pool.
 * Must be given back with `ConnectionPool::release` which reports the outcome to the circuit breaker.
 * A connection dropped without release is closed and reports nothing.
 */
class PooledConnection {
public:
    ~PooledConnection();

    PooledConnection(const PooledConnection &) = delete;
    PooledConnection &operator=(const PooledConnection &) = delete;
    PooledConnection(PooledConnection &&) = delete;
    PooledConnection &operator=(PooledConnection &&) = delete;

    /**
     * Exchange a message over the connection, the latency is recorded for the server
     */
    Connection::ExchangeResult exchange(Uint8View request, Millis timeout);

    [[nodiscard]] const std::string &server_name() const;
    [[nodiscard]] Protocol protocol() const;

    /** @return true if the connection carries the half-open trial request */
    [[nodiscard]] bool is_trial() const {
        return m_trial;
    }

private:
    friend class ConnectionPool;

    std::shared_ptr<detail::PoolSlot> m_slot;
    ConnectionPtr m_conn;
    bool m_trial = false;
    std::optional<Micros> m_latency;

    PooledConnection(std::shared_ptr<detail::PoolSlot> slot, ConnectionPtr conn, bool trial);
};

using PooledConnectionPtr = std::unique_ptr<PooledConnection>;

/**
 * Bounded pool of encrypted connections per upstream server, with a circuit breaker per server.
 * Thread-safe.
 */
class ConnectionPool {
public:
    using BreakerListener = std::function<void(const std::string &server, BreakerState from, BreakerState to)>;
    using FactoryMap = HashMap<Protocol, ConnectionFactoryPtr>;
    using CreateResult = Result<std::unique_ptr<ConnectionPool>, PoolError>;
    using AcquireResult = Result<PooledConnectionPtr, PoolError>;

    /**
     * Create a pool for the given servers
     * @param factories transports by protocol, a server without a transport for its protocol is a configuration error
     * @param listener called on every breaker state change
     */
    static CreateResult create(PoolSettings settings, const std::vector<ServerConfig> &servers, FactoryMap factories,
            BreakerListener listener = nullptr);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;
    ConnectionPool(ConnectionPool &&) = delete;
    ConnectionPool &operator=(ConnectionPool &&) = delete;

    /**
     * Borrow a connection to the server: an idle one if available, otherwise a new one while under the limit,
     * otherwise wait until one is released or the timeout passes.
     */
    AcquireResult acquire(std::string_view server, Protocol protocol, Millis timeout);

    /**
     * Give a connection back
     * @param was_error true if the exchange failed: the connection is closed and the breaker records a failure
     */
    void release(PooledConnectionPtr conn, bool was_error);

    /**
     * Close idle connections older than the idle timeout and those closed by the peer
     * @return number of closed connections
     */
    size_t sweep_idle();

    /**
     * Close every idle connection and fail all waiters, further acquisitions fail too
     */
    void shutdown();

    /**
     * @return servers in the order they should be tried: priority descending, then configuration order
     */
    [[nodiscard]] std::vector<ServerConfig> servers() const;

    [[nodiscard]] std::vector<ServerHealth> health() const;

    [[nodiscard]] std::optional<BreakerState> breaker_state(std::string_view server) const;

private:
    Logger m_log{"connection_pool"};
    PoolSettings m_settings;
    std::vector<std::shared_ptr<detail::PoolSlot>> m_slots;
    HashMap<std::string, std::shared_ptr<detail::PoolSlot>> m_slots_by_name;
    std::atomic_bool m_shutting_down{false};

    explicit ConnectionPool(PoolSettings settings);

    [[nodiscard]] std::shared_ptr<detail::PoolSlot> find_slot(std::string_view server) const;
};

} // namespace shroud::dns
