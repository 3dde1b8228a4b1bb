// tests/test_helpers.hpp
// Shared test doubles: a manually advanced clock and a scripted sink

#pragma once

#include "telemetry/batch.hpp"
#include "telemetry/clock.hpp"
#include "telemetry/errors.hpp"
#include "telemetry/sink.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace telemetry {
namespace testing_support {

// Only moves when told to
class ManualClock : public Clock {
public:
    ManualClock() : steady_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)) {}

    TimePoint steady_now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    Timestamp system_now_ms() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return system_ms_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        steady_ += delta;
        system_ms_ += static_cast<Timestamp>(delta.count());
    }

private:
    mutable std::mutex mutex_;
    TimePoint steady_;
    Timestamp system_ms_ = 1700000000000ULL;
};

// Replays scripted outcomes, then keeps returning the default one.
// A scripted step either returns a SendResult or throws.
class ScriptedSink : public TelemetrySink {
public:
    using Step = std::function<SendResult(const Batch&)>;

    SendResult send(const Batch& batch) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_++;
            if (!script_.empty()) {
                step = std::move(script_.front());
                script_.pop_front();
            } else {
                step = fallback_;
            }
        }

        SendResult result = step ? step(batch) : SendResult{DeliveryOutcome::SUCCESS, batch.size(), 0, ""};

        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TelemetryItem> copy(batch.items().begin(), batch.items().end());
        delivered_.push_back(std::move(copy));
        return result;
    }

    std::string name() const override { return "scripted"; }
    void close() override { closed_ = true; }

    void push(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(step));
    }

    void set_default(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(step);
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::vector<TelemetryItem>> delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

    bool closed() const { return closed_.load(); }

    static Step fail_transient() {
        return [](const Batch&) -> SendResult { throw Errors::send_failed("connection reset"); };
    }

    static Step fail_permanent() {
        return [](const Batch&) -> SendResult { throw Errors::authentication_failed(401); };
    }

    static Step partial(size_t rejected) {
        return [rejected](const Batch& batch) {
            return SendResult{DeliveryOutcome::PARTIAL, batch.size() - rejected, rejected, "schema mismatch"};
        };
    }

private:
    mutable std::mutex mutex_;
    std::deque<Step> script_;
    Step fallback_;
    size_t calls_ = 0;
    std::vector<std::vector<TelemetryItem>> delivered_;
    std::atomic<bool> closed_{false};
};

inline Event make_event(const std::string& message, LogLevel level = LogLevel::INFO) {
    Event event;
    event.event_id = Utils::generate_event_id();
    event.timestamp = Utils::now_milliseconds();
    event.level = level;
    event.component = Components::AGENT_CORE;
    event.event_type = EventTypes::SYSTEM;
    event.message = message;
    return event;
}

inline Batch make_batch(size_t items) {
    Batch batch;
    for (size_t i = 0; i < items; ++i) {
        batch.add_item(make_event("item " + std::to_string(i)));
    }
    return batch;
}

// Polls until the predicate holds or the timeout elapses
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace testing_support
} // namespace telemetry
