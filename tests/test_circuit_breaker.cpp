// tests/test_circuit_breaker.cpp
// Tests for the delivery circuit breaker, driven by a manual clock

#include <gtest/gtest.h>
#include "telemetry/circuit_breaker.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace telemetry;
using testing_support::ManualClock;

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        breaker_ = std::make_unique<CircuitBreaker>(3, std::chrono::milliseconds(1000), clock_);
    }

    void fail_times(int count) {
        for (int i = 0; i < count; ++i) {
            ASSERT_TRUE(breaker_->allow_request());
            breaker_->record_failure();
        }
    }

    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<CircuitBreaker> breaker_;
};

TEST_F(CircuitBreakerTest, TestOpensAfterThreshold) {
    fail_times(2);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::CLOSED);
    EXPECT_EQ(breaker_->snapshot().consecutive_failures, 2);

    fail_times(1);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::OPEN);
    EXPECT_FALSE(breaker_->allow_request());
    EXPECT_TRUE(breaker_->snapshot().opened_at.has_value());
}

TEST_F(CircuitBreakerTest, TestSuccessResetsFailureCount) {
    fail_times(2);
    breaker_->record_success();
    fail_times(2);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::CLOSED);
}

TEST_F(CircuitBreakerTest, TestSingleHalfOpenTrial) {
    fail_times(3);

    clock_->advance(std::chrono::milliseconds(999));
    EXPECT_FALSE(breaker_->allow_request());

    clock_->advance(std::chrono::milliseconds(1));
    EXPECT_TRUE(breaker_->allow_request());
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::HALF_OPEN);

    // Only one trial is let through
    EXPECT_FALSE(breaker_->allow_request());
    EXPECT_FALSE(breaker_->allow_request());

    breaker_->record_success();
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::CLOSED);
    EXPECT_TRUE(breaker_->allow_request());
    EXPECT_EQ(breaker_->outage_duration().count(), 0);
}

TEST_F(CircuitBreakerTest, TestConcurrentCallersGetOneHalfOpenTrial) {
    fail_times(3);
    clock_->advance(std::chrono::milliseconds(1000));

    constexpr int kThreads = 16;
    constexpr int kCallsPerThread = 200;
    std::atomic<bool> go{false};
    std::atomic<int> ready{0};
    std::atomic<int> allowed{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            ready++;
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < kCallsPerThread; ++i) {
                if (breaker_->allow_request()) {
                    allowed++;
                }
            }
        });
    }
    while (ready.load() < kThreads) {
        std::this_thread::yield();
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(allowed.load(), 1);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::HALF_OPEN);

    breaker_->record_success();
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::CLOSED);
}

TEST_F(CircuitBreakerTest, TestFailedTrialRestartsRecoveryTimer) {
    fail_times(3);
    clock_->advance(std::chrono::milliseconds(1000));
    ASSERT_TRUE(breaker_->allow_request());

    clock_->advance(std::chrono::milliseconds(200));
    breaker_->record_failure();
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::OPEN);

    // Timer restarts from the re-open, not the original open
    clock_->advance(std::chrono::milliseconds(900));
    EXPECT_FALSE(breaker_->allow_request());
    clock_->advance(std::chrono::milliseconds(100));
    EXPECT_TRUE(breaker_->allow_request());
}

TEST_F(CircuitBreakerTest, TestOutageDurationSpansReopens) {
    fail_times(3);
    clock_->advance(std::chrono::milliseconds(1000));
    ASSERT_TRUE(breaker_->allow_request());
    breaker_->record_failure();

    clock_->advance(std::chrono::milliseconds(500));
    EXPECT_EQ(breaker_->outage_duration().count(), 1500);
    EXPECT_TRUE(breaker_->snapshot().outage_started_at.has_value());
}

TEST_F(CircuitBreakerTest, TestReset) {
    fail_times(3);
    breaker_->reset();
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::CLOSED);
    EXPECT_TRUE(breaker_->allow_request());
    EXPECT_EQ(circuit_state_to_string(CircuitBreaker::State::HALF_OPEN), "half_open");
}
