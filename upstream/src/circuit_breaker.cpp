#include <algorithm>

#include "shroud/upstream/circuit_breaker.h"

namespace shroud::dns {

CircuitBreaker::CircuitBreaker(BreakerSettings settings, StateListener listener)
        : m_settings(std::move(settings))
        , m_listener(std::move(listener))
        , m_cooldown(m_settings.cooldown) {
    m_settings.failure_threshold = std::max<uint32_t>(m_settings.failure_threshold, 1);
    m_settings.backoff_multiplier = std::max(m_settings.backoff_multiplier, 1.0);
    m_settings.max_cooldown = std::max(m_settings.max_cooldown, m_settings.cooldown);
}

BreakerState CircuitBreaker::transition(BreakerState to) {
    BreakerState from = m_state;
    m_state = to;
    m_last_transition = SteadyClock::now();
    return from;
}

void CircuitBreaker::notify(BreakerState from, BreakerState to) {
    if (from != to && m_listener) {
        m_listener(from, to);
    }
}

CircuitBreaker::Admission CircuitBreaker::try_acquire() {
    std::unique_lock l(m_mtx);
    switch (m_state) {
    case BreakerState::CLOSED:
        return {.allowed = true};
    case BreakerState::OPEN: {
        if (SteadyClock::now() - m_last_transition < m_cooldown) {
            return {};
        }
        BreakerState from = transition(BreakerState::HALF_OPEN);
        m_trial_in_flight = true;
        l.unlock();
        notify(from, BreakerState::HALF_OPEN);
        return {.allowed = true, .trial = true};
    }
    case BreakerState::HALF_OPEN:
        if (m_trial_in_flight) {
            return {};
        }
        m_trial_in_flight = true;
        return {.allowed = true, .trial = true};
    }
    return {};
}

void CircuitBreaker::record_success(bool trial) {
    std::unique_lock l(m_mtx);
    switch (m_state) {
    case BreakerState::CLOSED:
        m_consecutive_failures = 0;
        break;
    case BreakerState::OPEN:
        // A late verdict of a request admitted before the circuit opened
        break;
    case BreakerState::HALF_OPEN: {
        if (!trial) {
            break;
        }
        m_trial_in_flight = false;
        m_consecutive_failures = 0;
        m_cooldown = m_settings.cooldown;
        BreakerState from = transition(BreakerState::CLOSED);
        l.unlock();
        notify(from, BreakerState::CLOSED);
        break;
    }
    }
}

void CircuitBreaker::record_failure(bool trial) {
    std::unique_lock l(m_mtx);
    switch (m_state) {
    case BreakerState::CLOSED: {
        if (++m_consecutive_failures < m_settings.failure_threshold) {
            break;
        }
        BreakerState from = transition(BreakerState::OPEN);
        l.unlock();
        notify(from, BreakerState::OPEN);
        break;
    }
    case BreakerState::OPEN:
        break;
    case BreakerState::HALF_OPEN: {
        if (!trial) {
            break;
        }
        m_trial_in_flight = false;
        ++m_consecutive_failures;
        auto next = std::chrono::duration_cast<Millis>(m_cooldown * m_settings.backoff_multiplier);
        m_cooldown = std::min(next, m_settings.max_cooldown);
        BreakerState from = transition(BreakerState::OPEN);
        l.unlock();
        notify(from, BreakerState::OPEN);
        break;
    }
    }
}

void CircuitBreaker::cancel_trial() {
    std::scoped_lock l(m_mtx);
    if (m_state == BreakerState::HALF_OPEN) {
        m_trial_in_flight = false;
    }
}

BreakerState CircuitBreaker::state() const {
    std::scoped_lock l(m_mtx);
    return m_state;
}

uint32_t CircuitBreaker::consecutive_failures() const {
    std::scoped_lock l(m_mtx);
    return m_consecutive_failures;
}

SteadyClock::time_point CircuitBreaker::last_transition() const {
    std::scoped_lock l(m_mtx);
    return m_last_transition;
}

Millis CircuitBreaker::current_cooldown() const {
    std::scoped_lock l(m_mtx);
    return m_cooldown;
}

} // namespace shroud::dns
