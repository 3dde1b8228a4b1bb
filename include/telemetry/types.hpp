// include/telemetry/types.hpp
// Purpose: Core records, enums and aliases shared by every telemetry component
// Events, metric samples and health reports are the items that flow through batching

#pragma once

#include <string>
#include <unordered_map>
#include <map>
#include <set>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>

namespace telemetry {

// Type aliases for clarity
using Timestamp = uint64_t;      // milliseconds since the unix epoch
using BatchId = uint64_t;
using TraceId = std::string;     // 32 lowercase hex characters
using SpanId = std::string;      // 16 lowercase hex characters
using Tags = std::set<std::string>;
using MetricTags = std::map<std::string, std::string>;

// Structured data value
using PropertyValue = std::variant<
    std::string,
    int64_t,
    double,
    bool,
    std::nullptr_t
>;

class Properties {
public:
    using Container = std::unordered_map<std::string, PropertyValue>;
    using iterator = Container::iterator;
    using const_iterator = Container::const_iterator;

    Properties() = default;
    Properties(std::initializer_list<std::pair<const std::string, PropertyValue>> init)
        : data_(init) {}

    // Element access
    PropertyValue& operator[](const std::string& key) { return data_[key]; }
    const PropertyValue& at(const std::string& key) const { return data_.at(key); }

    // Iterators
    iterator begin() { return data_.begin(); }
    const_iterator begin() const { return data_.begin(); }
    iterator end() { return data_.end(); }
    const_iterator end() const { return data_.end(); }

    // Capacity
    bool empty() const { return data_.empty(); }
    size_t size() const { return data_.size(); }

    // Modifiers
    void clear() { data_.clear(); }
    std::pair<iterator, bool> insert(const std::pair<std::string, PropertyValue>& value) {
        return data_.insert(value);
    }
    size_t erase(const std::string& key) { return data_.erase(key); }

    // Copies every entry of other, overwriting existing keys
    void merge(const Properties& other) {
        for (const auto& [key, value] : other) {
            data_[key] = value;
        }
    }

    bool contains(const std::string& key) const {
        return data_.find(key) != data_.end();
    }

    bool operator==(const Properties& other) const { return data_ == other.data_; }
    bool operator!=(const Properties& other) const { return !(*this == other); }

private:
    Container data_;
};

// Severity, ordered so that a numeric comparison is a severity comparison
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// Well known component names
namespace Components {
    constexpr const char* AGENT_CORE = "agent_core";
    constexpr const char* MODEL_SERVICE = "model_service";
    constexpr const char* TOOL_SERVICE = "tool_service";
    constexpr const char* API_GATEWAY = "api_gateway";
    constexpr const char* INFRASTRUCTURE = "infrastructure";
    constexpr const char* DATABASE = "database";
    constexpr const char* MESSAGING = "messaging";
    constexpr const char* SYSTEM = "system";
    constexpr const char* TELEMETRY = "telemetry";
} // namespace Components

// Well known event types
namespace EventTypes {
    constexpr const char* REQUEST = "request";
    constexpr const char* RESPONSE = "response";
    constexpr const char* EXCEPTION = "exception";
    constexpr const char* METRIC = "metric";
    constexpr const char* LIFECYCLE = "lifecycle";
    constexpr const char* VALIDATION = "validation";
    constexpr const char* AUTHENTICATION = "authentication";
    constexpr const char* SYSTEM = "system";
    constexpr const char* SPAN = "span";
    constexpr const char* HEALTH = "health";
    constexpr const char* ALERT = "alert";
    constexpr const char* DELIVERY_FAILURE = "delivery_failure";
} // namespace EventTypes

// Structured log event. Built once at the call site and never mutated afterwards.
struct Event {
    std::string event_id;
    Timestamp timestamp = 0;
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string event_type;
    std::string message;
    Properties data;
    Tags tags;
    std::optional<TraceId> trace_id;
    std::optional<SpanId> span_id;
    std::optional<SpanId> parent_span_id;
};

bool operator==(const Event& lhs, const Event& rhs);
inline bool operator!=(const Event& lhs, const Event& rhs) { return !(lhs == rhs); }

struct MetricSample {
    std::string name;
    double value = 0.0;
    std::optional<std::string> unit;
    MetricTags tags;
    Timestamp timestamp = 0;
};

bool operator==(const MetricSample& lhs, const MetricSample& rhs);

enum class HealthStatus : uint8_t {
    HEALTHY = 0,
    DEGRADED = 1,
    UNHEALTHY = 2
};

struct ResourceUsage {
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    uint64_t memory_rss_bytes = 0;
    uint64_t disk_io_read_bytes = 0;
    uint64_t disk_io_write_bytes = 0;
    uint64_t network_recv_bytes = 0;
    uint64_t network_sent_bytes = 0;
    uint32_t open_file_descriptors = 0;
};

// Point-in-time health snapshot. A newer report for the same service replaces the older one.
struct HealthReport {
    std::string service_id;
    std::string service_name;
    HealthStatus status = HealthStatus::HEALTHY;
    std::string message;
    std::string version;
    double uptime_seconds = 0.0;
    ResourceUsage resource_usage;
    std::map<std::string, bool> checks;
    Timestamp timestamp = 0;
};

bool operator==(const HealthReport& lhs, const HealthReport& rhs);

// Anything the batching engine can carry
using TelemetryItem = std::variant<Event, MetricSample, HealthReport>;

// Result of handing a batch to a sink
enum class DeliveryOutcome : uint8_t {
    SUCCESS = 0,   // every item accepted
    PARTIAL = 1,   // envelope accepted, some items rejected by the backend
    FAILURE = 2    // nothing delivered
};

namespace Utils {

// Get current timestamp in milliseconds
inline Timestamp now_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string log_level_to_string(LogLevel level);
std::optional<LogLevel> string_to_log_level(const std::string& level);

std::string health_status_to_string(HealthStatus status);
std::optional<HealthStatus> string_to_health_status(const std::string& status);

std::string delivery_outcome_to_string(DeliveryOutcome outcome);

} // namespace Utils

} // namespace telemetry
