// include/telemetry/monitor.hpp
// Purpose: Main monitoring interface used by application code
// Logging, spans, metrics, health and alerts funnel into one batching and delivery path

#pragma once

#include "alerts.hpp"
#include "batch.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "local_sink.hpp"
#include "metrics.hpp"
#include "pipeline.hpp"
#include "sampler.hpp"
#include "sink.hpp"
#include "trace.hpp"
#include "types.hpp"
#include "utils.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <typeinfo>
#include <vector>

namespace telemetry {

// Which events are kept before sampling. Empty include sets admit everything.
struct LogConfig {
    LogLevel min_level = LogLevel::INFO;
    std::set<std::string> include_components;
    std::set<std::string> exclude_components;
    std::set<std::string> include_event_types;
    std::set<std::string> exclude_event_types;

    bool allows(LogLevel level, const std::string& component, const std::string& event_type) const;
};

// Self-introspection of the delivery path
struct TelemetryHealth {
    HealthStatus status = HealthStatus::HEALTHY;
    CircuitBreaker::State circuit_state = CircuitBreaker::State::CLOSED;
    bool remote_backend = false;
    size_t queue_depth = 0;
    size_t queue_capacity = 0;
    size_t retry_buffer_depth = 0;
    uint64_t dropped_items = 0;
    uint64_t dropped_batches = 0;
    uint64_t delivery_failures = 0;
    uint64_t fallback_batches = 0;
    std::chrono::milliseconds outage_duration{0};
};

struct MonitorStats {
    uint64_t events_logged = 0;
    uint64_t events_filtered = 0;
    uint64_t events_rejected = 0;
    uint64_t values_redacted = 0;
    uint64_t metrics_recorded = 0;
    uint64_t metrics_rejected = 0;  // non-finite values
    uint64_t health_reports = 0;
    Sampler::Snapshot sampler;
    TraceContextManager::Snapshot spans;
    BatchStats::Snapshot batch;
    PipelineStats::Snapshot pipeline;
    CircuitBreaker::State circuit_state = CircuitBreaker::State::CLOSED;
};

class Monitor {
public:
    // Throws ConfigError for an invalid config. Without a sink, a TcpSink is
    // created when the config names a remote backend; otherwise everything
    // is routed to the local sink.
    explicit Monitor(const Config& config,
                     std::shared_ptr<TelemetrySink> sink = nullptr,
                     std::shared_ptr<Clock> clock = SystemClock::instance());
    ~Monitor();

    // Non-copyable, movable
    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;
    Monitor(Monitor&&) noexcept;
    Monitor& operator=(Monitor&&) noexcept;

    // Structured logging. Never throws and never waits on the network.
    void log(LogLevel level, const std::string& message,
             const std::string& component = Components::SYSTEM,
             const std::string& event_type = EventTypes::SYSTEM,
             const Properties& data = {}, const Tags& tags = {});
    void debug(const std::string& message, const std::string& component = Components::SYSTEM,
               const std::string& event_type = EventTypes::SYSTEM,
               const Properties& data = {}, const Tags& tags = {});
    void info(const std::string& message, const std::string& component = Components::SYSTEM,
              const std::string& event_type = EventTypes::SYSTEM,
              const Properties& data = {}, const Tags& tags = {});
    void warning(const std::string& message, const std::string& component = Components::SYSTEM,
                 const std::string& event_type = EventTypes::SYSTEM,
                 const Properties& data = {}, const Tags& tags = {});
    void error(const std::string& message, const std::string& component = Components::SYSTEM,
               const std::string& event_type = EventTypes::SYSTEM,
               const Properties& data = {}, const Tags& tags = {});
    // Also swaps the current batch out for immediate delivery
    void critical(const std::string& message, const std::string& component = Components::SYSTEM,
                  const std::string& event_type = EventTypes::SYSTEM,
                  const Properties& data = {}, const Tags& tags = {});

    // Tracing. start_span returns null only if the span could not be created.
    std::shared_ptr<Span> start_span(const std::string& name,
                                     const std::string& component = Components::SYSTEM,
                                     const std::optional<SpanContext>& parent = std::nullopt,
                                     const Properties& attributes = {});
    bool end_span(const std::shared_ptr<Span>& span, SpanStatus status = SpanStatus::OK,
                  const Properties& data = {}, const std::string& error_message = "");
    std::shared_ptr<Span> current_span() const;
    void inject_context(TracePropagation::Headers& headers) const;
    std::optional<SpanContext> extract_context(const TracePropagation::Headers& headers) const;

    // Metrics
    void record_metric(const std::string& name, double value,
                       const std::optional<std::string>& unit = std::nullopt,
                       const MetricTags& tags = {});
    void register_metric(const MetricDefinition& definition);
    std::vector<MetricSnapshot> get_metrics() const;
    std::optional<MetricSnapshot> get_metric(const std::string& name) const;

    void record_api_call(const std::string& endpoint, const std::string& method,
                         int status_code, double duration_ms,
                         const std::string& component = Components::API_GATEWAY,
                         const std::string& error_message = "");
    void record_performance(const std::string& operation, double duration_ms,
                            const std::string& component = Components::SYSTEM,
                            bool success = true, const Properties& details = {});
    // ERROR event when validation failed, INFO otherwise
    void record_model_validation(const std::string& model_name, bool success,
                                 const Properties& data = {}, const std::string& error = "",
                                 const std::string& component = Components::SYSTEM);

    // Health
    void record_health_status(const HealthReport& report);
    std::optional<HealthReport> get_health_status(const std::string& service_id) const;
    std::vector<HealthReport> get_health_statuses() const;
    TelemetryHealth telemetry_health() const;

    // Alerts. create_alert and update_alert throw ValidationError for bad input.
    AlertConfig create_alert(const AlertConfig& config);
    std::optional<AlertConfig> update_alert(const std::string& alert_id, const AlertUpdate& update);
    bool delete_alert(const std::string& alert_id);
    std::optional<AlertConfig> get_alert(const std::string& alert_id) const;
    std::vector<AlertConfig> get_alerts(const std::optional<std::string>& component = std::nullopt) const;
    std::optional<AlertInstance> trigger_alert(const std::string& alert_id, double value,
                                               const std::string& message,
                                               const Properties& metadata = {});
    std::vector<AlertInstance> get_alert_instances(
        const std::optional<std::string>& alert_id = std::nullopt,
        const std::optional<AlertStatus>& status = std::nullopt) const;
    std::optional<AlertInstance> acknowledge_alert(const std::string& instance_id,
                                                   const std::string& acknowledged_by);
    std::optional<AlertInstance> resolve_alert(const std::string& instance_id,
                                               const std::optional<std::string>& resolution_message = std::nullopt);

    // Filtering
    void update_log_config(const LogConfig& log_config);
    LogConfig get_log_config() const;

    // Lifecycle. Neither throws; flush returns whether everything pending was delivered.
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    void shutdown();
    bool is_running() const;

    MonitorStats stats() const;
    const Config& config() const;
    LocalSink& local_sink();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Opens a span on construction and ends it on every exit path.
// Leaving the scope by exception ends the span with ERROR status.
class ScopedSpan {
public:
    ScopedSpan(Monitor& monitor, const std::string& name,
               const std::string& component = Components::SYSTEM,
               const Properties& attributes = {});
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    const std::shared_ptr<Span>& span() const { return span_; }

    void set_attribute(const std::string& key, const PropertyValue& value);
    void add_data(const std::string& key, const PropertyValue& value);
    void mark_error(const std::string& message, const std::string& error_type = "");

    // Ends the span early; the destructor then does nothing
    void end();

private:
    Monitor& monitor_;
    std::shared_ptr<Span> span_;
    int uncaught_on_entry_;
    Properties end_data_;
    bool failed_ = false;
    std::string error_message_;
};

// Times a block inside its own span and reports it through record_performance
// on exit. Leaving the scope by exception records a failed operation.
class PerformanceTracker {
public:
    PerformanceTracker(Monitor& monitor, const std::string& operation,
                       const std::string& component = Components::SYSTEM,
                       const Properties& details = {});
    ~PerformanceTracker() = default;

    PerformanceTracker(const PerformanceTracker&) = delete;
    PerformanceTracker& operator=(const PerformanceTracker&) = delete;

    // Goes into both the performance event and the span end data
    void add_data(const std::string& key, const PropertyValue& value);
    void mark_error(const std::string& message, const std::string& error_type = "");

    double elapsed_ms() const { return timer_.elapsed().count(); }

private:
    void report(Utils::ScopedTimer::Duration elapsed);

    Monitor& monitor_;
    std::string operation_;
    std::string component_;
    Properties details_;
    bool failed_ = false;
    int uncaught_on_entry_;
    ScopedSpan span_;
    Utils::ScopedTimer timer_;  // destroyed first, so the report lands before the span ends
};

// Runs fn inside a span. An exception ends the span with ERROR and is rethrown.
template <typename Fn>
auto traced(Monitor& monitor, const std::string& name, const std::string& component, Fn&& fn)
    -> decltype(fn()) {
    ScopedSpan scope(monitor, name, component);
    try {
        return fn();
    } catch (const std::exception& e) {
        scope.mark_error(e.what(), typeid(e).name());
        throw;
    }
}

// Runs fn under a PerformanceTracker. An exception is recorded and rethrown.
template <typename Fn>
auto track_performance(Monitor& monitor, const std::string& operation, const std::string& component, Fn&& fn)
    -> decltype(fn()) {
    PerformanceTracker tracker(monitor, operation, component);
    try {
        return fn();
    } catch (const std::exception& e) {
        tracker.mark_error(e.what(), typeid(e).name());
        throw;
    }
}

// Explicit process-wide lifecycle; nothing in the library holds the handle
using MonitorHandle = std::shared_ptr<Monitor>;

MonitorHandle init(const Config& config, std::shared_ptr<TelemetrySink> sink = nullptr);
void shutdown(const MonitorHandle& handle);

} // namespace telemetry
