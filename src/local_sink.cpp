// src/local_sink.cpp
// Bounded in-memory fallback sink

#include "telemetry/local_sink.hpp"
#include "telemetry/batch.hpp"
#include "telemetry/logging.hpp"
#include <type_traits>

namespace telemetry {

LocalSink::LocalSink(size_t capacity, bool echo_to_console)
    : capacity_(capacity == 0 ? 1 : capacity), echo_to_console_(echo_to_console) {}

SendResult LocalSink::send(const Batch& batch) {
    SendResult result;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : batch.items()) {
            if (ring_.size() >= capacity_) {
                ring_.pop_front();
                overwritten_++;
            }
            ring_.push_back(item);
            total_received_++;
            if (echo_to_console_) {
                echo(item);
            }
        }
        result.accepted = batch.size();
    } catch (const std::exception& e) {
        Logging::logger()->error("Local sink failed to store batch {}: {}", batch.id(), e.what());
        result.outcome = DeliveryOutcome::FAILURE;
        result.rejected = batch.size();
        result.detail = e.what();
    }
    return result;
}

void LocalSink::echo(const TelemetryItem& item) const {
    auto logger = Logging::logger();
    std::visit([&logger](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Event>) {
            logger->info("[{}] {}/{}: {}", Utils::log_level_to_string(value.level),
                         value.component, value.event_type, value.message);
        } else if constexpr (std::is_same_v<T, MetricSample>) {
            logger->info("[METRIC] {} = {}{}", value.name, value.value,
                         value.unit ? " " + *value.unit : std::string());
        } else {
            logger->info("[HEALTH] {} ({}): {}", value.service_name,
                         Utils::health_status_to_string(value.status), value.message);
        }
    }, item);
}

std::vector<TelemetryItem> LocalSink::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<TelemetryItem>(ring_.begin(), ring_.end());
}

std::vector<Event> LocalSink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> result;
    for (const auto& item : ring_) {
        if (const auto* event = std::get_if<Event>(&item)) {
            result.push_back(*event);
        }
    }
    return result;
}

size_t LocalSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ring_.size();
}

void LocalSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_.clear();
}

} // namespace telemetry
