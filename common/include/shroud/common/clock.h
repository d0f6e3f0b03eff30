#pragma once

#include <atomic>
#include <chrono>

namespace shroud {

/**
 * Steady clock with time shifting.
 * Time shifting MUST ONLY be used for testing in controlled environments.
 */
class SteadyClock : public std::chrono::steady_clock {
public:
    using Base = std::chrono::steady_clock;

    /**
     * Return (Base::now() + get_time_shift()). Hides now() from base class.
     * @return the shifted time
     */
    static time_point now() noexcept {
        return Base::now() + get_time_shift();
    }

    static duration get_time_shift() noexcept {
        return duration{m_time_shift.load(std::memory_order_relaxed)};
    }

    /**
     * Intended only for testing
     */
    static void add_time_shift(duration value) {
        m_time_shift.fetch_add(value.count(), std::memory_order_relaxed);
    }

    /**
     * Intended only for testing
     */
    static void reset_time_shift() {
        m_time_shift.store(0, std::memory_order_relaxed);
    }

private:
    static std::atomic<duration::rep> m_time_shift;
};

/**
 * Wall clock time for timestamps that are reported outside (creation and update times)
 */
using SystemClock = std::chrono::system_clock;

} // namespace shroud
