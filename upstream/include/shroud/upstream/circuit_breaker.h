#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

#include "shroud/common/clock.h"
#include "shroud/common/defs.h"
#include "shroud/upstream/server.h"

namespace shroud::dns {

struct BreakerSettings {
    /** Consecutive failures which open the circuit */
    uint32_t failure_threshold = 5;
    /** Initial cool-down of an open circuit */
    Millis cooldown{30000};
    /** Cool-down multiplier applied when a half-open trial fails */
    double backoff_multiplier = 2.0;
    /** Upper bound of the cool-down */
    Millis max_cooldown{300000};
};

/**
 * Per-server circuit breaker.
 *
 * CLOSED -> OPEN after `failure_threshold` consecutive failures.
 * OPEN -> HALF_OPEN on the first request after the cool-down.
 * HALF_OPEN admits exactly one trial: success -> CLOSED, failure -> OPEN with a longer cool-down.
 */
class CircuitBreaker {
public:
    using StateListener = std::function<void(BreakerState from, BreakerState to)>;

    struct Admission {
        bool allowed = false;
        /** The request is the half-open trial, its verdict decides the next state */
        bool trial = false;
    };

    explicit CircuitBreaker(BreakerSettings settings, StateListener listener = nullptr);

    /**
     * Ask for permission to send a request
     */
    Admission try_acquire();

    /**
     * Report a successful request
     */
    void record_success(bool trial);

    /**
     * Report a failed request
     */
    void record_failure(bool trial);

    /**
     * Give the trial slot back without a verdict, e.g. the request never reached the server
     */
    void cancel_trial();

    [[nodiscard]] BreakerState state() const;
    [[nodiscard]] uint32_t consecutive_failures() const;
    [[nodiscard]] SteadyClock::time_point last_transition() const;
    [[nodiscard]] Millis current_cooldown() const;

private:
    BreakerSettings m_settings;
    StateListener m_listener;

    mutable std::mutex m_mtx;
    BreakerState m_state = BreakerState::CLOSED;
    uint32_t m_consecutive_failures = 0;
    SteadyClock::time_point m_last_transition = SteadyClock::now();
    Millis m_cooldown;
    bool m_trial_in_flight = false;

    // Must be called with the lock held, returns the previous state
    BreakerState transition(BreakerState to);
    void notify(BreakerState from, BreakerState to);
};

} // namespace shroud::dns
