// src/circuit_breaker.cpp
// Implementation of the delivery circuit breaker

#include "telemetry/circuit_breaker.hpp"
#include "telemetry/logging.hpp"

namespace telemetry {

CircuitBreaker::CircuitBreaker(int failure_threshold,
                               std::chrono::milliseconds recovery_timeout,
                               std::shared_ptr<Clock> clock)
    : failure_threshold_(failure_threshold < 1 ? 1 : failure_threshold),
      recovery_timeout_(recovery_timeout),
      clock_(clock ? std::move(clock) : SystemClock::instance()),
      state_(State::CLOSED), failure_count_(0), trial_in_flight_(false) {}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == State::CLOSED) {
        return true;
    }

    if (state_ == State::OPEN) {
        auto now = clock_->steady_now();
        if (now - opened_at_ >= recovery_timeout_) {
            state_ = State::HALF_OPEN;
            trial_in_flight_ = true;
            Logging::logger()->info("Circuit half-open, allowing one trial delivery");
            return true;
        }
        return false;
    }

    // HALF_OPEN: only the single trial is let through
    if (!trial_in_flight_) {
        trial_in_flight_ = true;
        return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == State::HALF_OPEN) {
        state_ = State::CLOSED;
        failure_count_ = 0;
        trial_in_flight_ = false;
        outage_started_at_.reset();
        Logging::logger()->info("Circuit closed after successful trial delivery");
    } else if (state_ == State::CLOSED) {
        failure_count_ = 0;
    }
    // A late success reported while OPEN belongs to an attempt started before
    // the breaker opened and does not close it.
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->steady_now();

    if (state_ == State::HALF_OPEN) {
        failure_count_++;
        trial_in_flight_ = false;
        open_locked(now);
        Logging::logger()->warn("Trial delivery failed, circuit re-opened");
        return;
    }

    if (state_ == State::OPEN) {
        failure_count_++;
        return;
    }

    failure_count_++;
    if (failure_count_ >= failure_threshold_) {
        outage_started_at_ = now;
        open_locked(now);
        Logging::logger()->warn("Circuit opened after {} consecutive delivery failures", failure_count_);
    }
}

void CircuitBreaker::open_locked(Clock::TimePoint now) {
    state_ = State::OPEN;
    opened_at_ = now;
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot s;
    s.state = state_;
    s.consecutive_failures = failure_count_;
    if (state_ != State::CLOSED) {
        s.opened_at = opened_at_;
    }
    s.outage_started_at = outage_started_at_;
    return s;
}

std::chrono::milliseconds CircuitBreaker::outage_duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!outage_started_at_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_->steady_now() - *outage_started_at_);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::CLOSED;
    failure_count_ = 0;
    trial_in_flight_ = false;
    outage_started_at_.reset();
}

std::string circuit_state_to_string(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::CLOSED: return "closed";
        case CircuitBreaker::State::OPEN: return "open";
        case CircuitBreaker::State::HALF_OPEN: return "half_open";
        default: return "unknown";
    }
}

} // namespace telemetry
