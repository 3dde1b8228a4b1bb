// include/telemetry/metrics.hpp
// Purpose: Metric definitions and running aggregates owned by a monitor
// Unknown metric names are registered as gauges on first use

#pragma once

#include "types.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace telemetry {

enum class MetricType {
    COUNTER = 0,        // Monotonically increasing (events, requests)
    GAUGE = 1,          // Current value (memory, connections)
    HISTOGRAM = 2,      // Value distribution (latencies, sizes)
    SUMMARY = 3         // Pre-aggregated quantiles
};

std::string metric_type_to_string(MetricType type);

struct MetricDefinition {
    std::string name;
    std::string description;
    std::string unit;
    MetricType type = MetricType::GAUGE;
};

// Definition plus the aggregate of every recorded value
struct MetricSnapshot {
    MetricDefinition definition;
    double last_value = 0.0;
    uint64_t count = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
    Timestamp last_updated = 0;

    double average() const {
        return count > 0 ? sum / count : 0.0;
    }
};

// A single metric's running aggregate
class Metric {
public:
    explicit Metric(MetricDefinition definition)
        : definition_(std::move(definition)) {}

    void record(double value, Timestamp timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ == 0) {
            min_ = value;
            max_ = value;
        } else {
            min_ = std::min(min_, value);
            max_ = std::max(max_, value);
        }
        last_value_ = value;
        sum_ += value;
        count_++;
        last_updated_ = timestamp;
    }

    void set_definition(const MetricDefinition& definition) {
        std::lock_guard<std::mutex> lock(mutex_);
        definition_ = definition;
    }

    MetricSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        MetricSnapshot s;
        s.definition = definition_;
        s.last_value = last_value_;
        s.count = count_;
        s.sum = sum_;
        s.min = min_;
        s.max = max_;
        s.last_updated = last_updated_;
        return s;
    }

private:
    mutable std::mutex mutex_;
    MetricDefinition definition_;
    double last_value_ = 0.0;
    uint64_t count_ = 0;
    double sum_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
    Timestamp last_updated_ = 0;
};

class MetricRegistry {
public:
    MetricRegistry() = default;

    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    // Registers or replaces the definition; recorded aggregates are kept
    void register_metric(const MetricDefinition& definition);

    // Records against the named metric, auto-registering a gauge when unknown
    void record(const std::string& name, double value,
                const std::optional<std::string>& unit, Timestamp timestamp);

    bool contains(const std::string& name) const;
    std::optional<MetricSnapshot> get(const std::string& name) const;
    std::vector<MetricSnapshot> all() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Metric>> metrics_;
};

// Process resource sampling (Linux /proc)
namespace ResourceMonitor {

ResourceUsage current_usage();

} // namespace ResourceMonitor

} // namespace telemetry
