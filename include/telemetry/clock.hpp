// include/telemetry/clock.hpp
// Purpose: Time source used by the circuit breaker, spans and event stamping
// Injectable so timing behaviour can be driven deterministically

#pragma once

#include "types.hpp"
#include <chrono>
#include <memory>

namespace telemetry {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    // Monotonic time for intervals and timeouts
    virtual TimePoint steady_now() const = 0;

    // Wall clock in milliseconds since the epoch
    virtual Timestamp system_now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint steady_now() const override { return std::chrono::steady_clock::now(); }
    Timestamp system_now_ms() const override { return Utils::now_milliseconds(); }

    // Process-wide stateless instance
    static std::shared_ptr<Clock> instance() {
        static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
        return clock;
    }
};

} // namespace telemetry
