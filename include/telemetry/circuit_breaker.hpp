// include/telemetry/circuit_breaker.hpp
// Purpose: Circuit breaker gating outbound delivery attempts
// CLOSED -> OPEN after consecutive failures, one HALF_OPEN trial after the recovery timeout

#pragma once

#include "clock.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace telemetry {

class CircuitBreaker {
public:
    enum class State {
        CLOSED,    // Normal operation
        OPEN,      // Failing fast
        HALF_OPEN  // One trial delivery outstanding
    };

    struct Snapshot {
        State state = State::CLOSED;
        int consecutive_failures = 0;
        std::optional<Clock::TimePoint> opened_at;
        std::optional<Clock::TimePoint> outage_started_at;
    };

    CircuitBreaker(int failure_threshold = 5,
                   std::chrono::milliseconds recovery_timeout = std::chrono::milliseconds(30000),
                   std::shared_ptr<Clock> clock = SystemClock::instance());

    // Single read entry point. In HALF_OPEN exactly one caller gets true.
    bool allow_request();

    void record_success();
    void record_failure();

    State state() const;
    Snapshot snapshot() const;

    // Time since the breaker last left CLOSED, zero while CLOSED
    std::chrono::milliseconds outage_duration() const;

    int failure_threshold() const { return failure_threshold_; }
    std::chrono::milliseconds recovery_timeout() const { return recovery_timeout_; }

    void reset();

private:
    mutable std::mutex mutex_;
    const int failure_threshold_;
    const std::chrono::milliseconds recovery_timeout_;
    std::shared_ptr<Clock> clock_;

    State state_;
    int failure_count_;
    bool trial_in_flight_;
    Clock::TimePoint opened_at_;
    std::optional<Clock::TimePoint> outage_started_at_;

    void open_locked(Clock::TimePoint now);
};

std::string circuit_state_to_string(CircuitBreaker::State state);

} // namespace telemetry
