// include/telemetry/utils.hpp
// Purpose: Utility functions and helpers for the telemetry client
// Identifier generation, time formatting, host information and backoff

#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <functional>

namespace telemetry {
namespace Utils {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
std::vector<std::string> split(const std::string& str, char delimiter);
bool starts_with(const std::string& str, const std::string& prefix);
bool is_hex_string(const std::string& str);

// Network utilities
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint);
std::string get_hostname();
std::string get_os_info();

// Identifier generation
TraceId generate_trace_id();      // 32 hex chars, never all zero
SpanId generate_span_id();        // 16 hex chars, never all zero
std::string generate_event_id();  // UUID v4 text form
BatchId generate_batch_id();

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms);
std::optional<Timestamp> iso8601_to_timestamp(const std::string& iso);

// Exponential backoff calculator
class ExponentialBackoff {
public:
    ExponentialBackoff(std::chrono::milliseconds base_delay,
                       double multiplier = 2.0,
                       std::chrono::milliseconds max_delay = std::chrono::milliseconds(30000));

    std::chrono::milliseconds next_delay();
    void reset();
    int attempt_count() const;

private:
    std::chrono::milliseconds base_delay_;
    double multiplier_;
    std::chrono::milliseconds max_delay_;
    int attempts_;
    std::chrono::milliseconds current_delay_;
};

// RAII timer for performance measurement
class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double, std::milli>;

    explicit ScopedTimer(std::function<void(Duration)> callback);
    ~ScopedTimer();

    Duration elapsed() const;

private:
    Clock::time_point start_time_;
    std::function<void(Duration)> callback_;
};

} // namespace Utils
} // namespace telemetry
