// src/types.cpp
// Implementation of enum conversions and record comparisons

#include "telemetry/types.hpp"
#include "telemetry/utils.hpp"

namespace telemetry {

bool operator==(const Event& lhs, const Event& rhs) {
    return lhs.event_id == rhs.event_id &&
           lhs.timestamp == rhs.timestamp &&
           lhs.level == rhs.level &&
           lhs.component == rhs.component &&
           lhs.event_type == rhs.event_type &&
           lhs.message == rhs.message &&
           lhs.data == rhs.data &&
           lhs.tags == rhs.tags &&
           lhs.trace_id == rhs.trace_id &&
           lhs.span_id == rhs.span_id &&
           lhs.parent_span_id == rhs.parent_span_id;
}

bool operator==(const MetricSample& lhs, const MetricSample& rhs) {
    return lhs.name == rhs.name &&
           lhs.value == rhs.value &&
           lhs.unit == rhs.unit &&
           lhs.tags == rhs.tags &&
           lhs.timestamp == rhs.timestamp;
}

static bool same_usage(const ResourceUsage& a, const ResourceUsage& b) {
    return a.cpu_percent == b.cpu_percent &&
           a.memory_percent == b.memory_percent &&
           a.memory_rss_bytes == b.memory_rss_bytes &&
           a.disk_io_read_bytes == b.disk_io_read_bytes &&
           a.disk_io_write_bytes == b.disk_io_write_bytes &&
           a.network_recv_bytes == b.network_recv_bytes &&
           a.network_sent_bytes == b.network_sent_bytes &&
           a.open_file_descriptors == b.open_file_descriptors;
}

bool operator==(const HealthReport& lhs, const HealthReport& rhs) {
    return lhs.service_id == rhs.service_id &&
           lhs.service_name == rhs.service_name &&
           lhs.status == rhs.status &&
           lhs.message == rhs.message &&
           lhs.version == rhs.version &&
           lhs.uptime_seconds == rhs.uptime_seconds &&
           same_usage(lhs.resource_usage, rhs.resource_usage) &&
           lhs.checks == rhs.checks &&
           lhs.timestamp == rhs.timestamp;
}

namespace Utils {

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "INFO";
    }
}

std::optional<LogLevel> string_to_log_level(const std::string& level) {
    std::string upper = to_upper(trim(level));
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL" || upper == "FATAL") return LogLevel::CRITICAL;
    return std::nullopt;
}

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
        default: return "unknown";
    }
}

std::optional<HealthStatus> string_to_health_status(const std::string& status) {
    std::string lower = to_lower(trim(status));
    if (lower == "healthy") return HealthStatus::HEALTHY;
    if (lower == "degraded") return HealthStatus::DEGRADED;
    if (lower == "unhealthy") return HealthStatus::UNHEALTHY;
    return std::nullopt;
}

std::string delivery_outcome_to_string(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::SUCCESS: return "success";
        case DeliveryOutcome::PARTIAL: return "partial";
        case DeliveryOutcome::FAILURE: return "failure";
        default: return "failure";
    }
}

} // namespace Utils

} // namespace telemetry
