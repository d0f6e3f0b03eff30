#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "shroud/upstream/circuit_breaker.h"

namespace shroud::dns::test {

using namespace std::chrono_literals;

class CircuitBreakerTest : public ::testing::Test {
protected:
    std::vector<std::pair<BreakerState, BreakerState>> transitions;
    CircuitBreaker breaker{
            BreakerSettings{.failure_threshold = 3, .cooldown = Millis{1000}, .backoff_multiplier = 2.0,
                    .max_cooldown = Millis{3000}},
            [this](BreakerState from, BreakerState to) {
                transitions.emplace_back(from, to);
            }};

    void TearDown() override {
        SteadyClock::reset_time_shift();
    }

    void open() {
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(breaker.try_acquire().allowed);
            breaker.record_failure(false);
        }
        ASSERT_EQ(breaker.state(), BreakerState::OPEN);
    }
};

TEST_F(CircuitBreakerTest, OpensAfterConsecutiveFailures) {
    breaker.record_failure(false);
    breaker.record_failure(false);
    ASSERT_EQ(breaker.state(), BreakerState::CLOSED);
    breaker.record_failure(false);
    ASSERT_EQ(breaker.state(), BreakerState::OPEN);
    ASSERT_FALSE(breaker.try_acquire().allowed);
    ASSERT_EQ(transitions.size(), 1);
    ASSERT_EQ(transitions[0], std::make_pair(BreakerState::CLOSED, BreakerState::OPEN));
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureCount) {
    breaker.record_failure(false);
    breaker.record_failure(false);
    breaker.record_success(false);
    breaker.record_failure(false);
    breaker.record_failure(false);
    ASSERT_EQ(breaker.state(), BreakerState::CLOSED);
    ASSERT_EQ(breaker.consecutive_failures(), 2);
}

TEST_F(CircuitBreakerTest, SingleTrialAfterCooldown) {
    open();
    SteadyClock::add_time_shift(1100ms);

    auto trial = breaker.try_acquire();
    ASSERT_TRUE(trial.allowed);
    ASSERT_TRUE(trial.trial);
    ASSERT_EQ(breaker.state(), BreakerState::HALF_OPEN);

    // Only one request passes while the trial is in flight
    ASSERT_FALSE(breaker.try_acquire().allowed);
    ASSERT_FALSE(breaker.try_acquire().allowed);

    breaker.record_success(true);
    ASSERT_EQ(breaker.state(), BreakerState::CLOSED);
    ASSERT_EQ(breaker.consecutive_failures(), 0);
    ASSERT_TRUE(breaker.try_acquire().allowed);

    ASSERT_EQ(transitions.size(), 3);
    ASSERT_EQ(transitions[1], std::make_pair(BreakerState::OPEN, BreakerState::HALF_OPEN));
    ASSERT_EQ(transitions[2], std::make_pair(BreakerState::HALF_OPEN, BreakerState::CLOSED));
}

TEST_F(CircuitBreakerTest, FailedTrialExtendsCooldown) {
    open();
    ASSERT_EQ(breaker.current_cooldown(), Millis{1000});

    SteadyClock::add_time_shift(1100ms);
    ASSERT_TRUE(breaker.try_acquire().trial);
    breaker.record_failure(true);
    ASSERT_EQ(breaker.state(), BreakerState::OPEN);
    ASSERT_EQ(breaker.current_cooldown(), Millis{2000});

    SteadyClock::add_time_shift(1100ms);
    ASSERT_FALSE(breaker.try_acquire().allowed);

    SteadyClock::add_time_shift(1000ms);
    ASSERT_TRUE(breaker.try_acquire().trial);
    breaker.record_failure(true);
    // Capped at the maximum
    ASSERT_EQ(breaker.current_cooldown(), Millis{3000});

    SteadyClock::add_time_shift(3100ms);
    ASSERT_TRUE(breaker.try_acquire().trial);
    breaker.record_success(true);
    ASSERT_EQ(breaker.state(), BreakerState::CLOSED);
    ASSERT_EQ(breaker.current_cooldown(), Millis{1000});
}

TEST_F(CircuitBreakerTest, CancelledTrialFreesSlot) {
    open();
    SteadyClock::add_time_shift(1100ms);
    ASSERT_TRUE(breaker.try_acquire().trial);
    breaker.cancel_trial();
    ASSERT_EQ(breaker.state(), BreakerState::HALF_OPEN);
    ASSERT_TRUE(breaker.try_acquire().trial);
}

TEST_F(CircuitBreakerTest, LateVerdictsAreIgnored) {
    open();
    // Requests admitted before the circuit opened report after it
    breaker.record_success(false);
    ASSERT_EQ(breaker.state(), BreakerState::OPEN);

    SteadyClock::add_time_shift(1100ms);
    ASSERT_TRUE(breaker.try_acquire().trial);
    breaker.record_success(false);
    breaker.record_failure(false);
    ASSERT_EQ(breaker.state(), BreakerState::HALF_OPEN);
}

} // namespace shroud::dns::test
