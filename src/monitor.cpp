// src/monitor.cpp
// Monitor facade implementation

#include "telemetry/monitor.hpp"
#include "telemetry/errors.hpp"
#include "telemetry/logging.hpp"
#include "telemetry/network.hpp"
#include "telemetry/redaction.hpp"
#include "telemetry/utils.hpp"
#include <atomic>
#include <cmath>
#include <map>
#include <mutex>

namespace telemetry {

// Includes are allow-lists when non-empty; excludes always win
bool LogConfig::allows(LogLevel level, const std::string& component, const std::string& event_type) const {
    if (level < min_level) {
        return false;
    }
    if (!include_components.empty() && include_components.count(component) == 0) {
        return false;
    }
    if (exclude_components.count(component) > 0) {
        return false;
    }
    if (!include_event_types.empty() && include_event_types.count(event_type) == 0) {
        return false;
    }
    return exclude_event_types.count(event_type) == 0;
}

namespace {

// An injected sink takes precedence over the configured backend
std::shared_ptr<TelemetrySink> make_remote_sink(const Config& config, std::shared_ptr<TelemetrySink> sink) {
    if (sink) {
        return sink;
    }
    if (config.has_remote_backend()) {
        return std::make_shared<TcpSink>(TcpSinkConfig::from_config(config));
    }
    return nullptr;
}

// Runs validation inside the member initialiser list, before any thread starts
const Config& validated(const Config& config) {
    config.validate();
    return config;
}

LogLevel level_for_health(HealthStatus status) {
    switch (status) {
        case HealthStatus::DEGRADED: return LogLevel::WARNING;
        case HealthStatus::UNHEALTHY: return LogLevel::ERROR;
        default: return LogLevel::INFO;
    }
}

std::string alert_component(const std::string& component) {
    return component.empty() ? std::string(Components::SYSTEM) : component;
}

} // anonymous namespace

// Monitor implementation
//
// Producer calls build an item and hand it to batch_. Nothing on the
// producer path touches the network, and nothing on it throws.
class Monitor::Impl {
public:
    Impl(const Config& config, std::shared_ptr<TelemetrySink> sink, std::shared_ptr<Clock> clock)
        : config_(validated(config)),
          clock_(clock ? std::move(clock) : SystemClock::instance()),
          hostname_(Utils::get_hostname()),
          sampler_(config_.sample_rate()),
          redactor_(config_.redact_keys()),
          tracer_(clock_),
          local_(std::make_shared<LocalSink>(config_.fallback().capacity,
                                             config_.fallback().echo_to_console)),
          pipeline_(config_, make_remote_sink(config_, std::move(sink)), local_, clock_),
          batch_(config_.batch(), [this](Batch batch) { pipeline_.deliver(std::move(batch)); }) {

        Logging::configure(config_.logging());
        log_config_.min_level = config_.min_log_level();

        // Wiring: spans emit through dispatch, delivery failures come back as
        // self-reports, idle workers drive the retry buffer, shutdown cancels backoff

        tracer_.set_emit_callback([this](Event event) { dispatch(std::move(event)); });
        pipeline_.set_enqueue_callback([this](TelemetryItem item) {
            return batch_.enqueue(std::move(item));
        });
        batch_.set_wake_callback([this]() { pipeline_.drain_retry_buffer(); });
        batch_.set_cancel_callback([this]() { pipeline_.cancel(); });

        batch_.start();
        running_ = true;

        Logging::logger()->info("Telemetry monitor started for '{}' on {} ({}, {} sink)",
                                config_.service_name(), hostname_, Utils::get_os_info(),
                                pipeline_.has_remote_sink() ? "remote" : "local");
    }

    ~Impl() {
        shutdown();
    }

    void log(LogLevel level, const std::string& message, const std::string& component,
             const std::string& event_type, const Properties& data, const Tags& tags) noexcept {
        try {
            Event event;
            event.event_id = Utils::generate_event_id();
            event.timestamp = clock_->system_now_ms();
            event.level = level;
            event.component = component;
            event.event_type = event_type;
            event.message = message;
            event.data = data;
            event.tags = tags;

            // Inherit the calling thread's active span
            auto span = tracer_.current_span();
            if (span) {
                event.trace_id = span->trace_id();
                event.span_id = span->span_id();
            }
            dispatch(std::move(event));
        } catch (const std::exception& e) {
            stats_.events_rejected++;
            Logging::logger()->warn("Dropping log event: {}", e.what());
        }
    }

    // Filter, sample, redact, decorate, enqueue
    bool dispatch(Event event) noexcept {
        try {
            {
                std::lock_guard<std::mutex> lock(log_config_mutex_);
                if (!log_config_.allows(event.level, event.component, event.event_type)) {
                    stats_.events_filtered++;
                    return false;
                }
            }
            if (!sampler_.admit(event)) {
                return false;
            }

            // Redact before metadata so service fields are never masked
            stats_.values_redacted += redactor_.redact(event.data);
            if (config_.enable_metadata()) {
                add_metadata(event.data);
            }

            // Read before the move
            const bool critical = event.level == LogLevel::CRITICAL;
            if (!batch_.enqueue(TelemetryItem(std::move(event)))) {
                stats_.events_rejected++;
                return false;
            }
            stats_.events_logged++;
            if (critical) {
                batch_.trigger_flush();
            }
            return true;
        } catch (const std::exception& e) {
            stats_.events_rejected++;
            Logging::logger()->warn("Dropping event: {}", e.what());
            return false;
        }
    }

    std::shared_ptr<Span> start_span(const std::string& name, const std::string& component,
                                     const std::optional<SpanContext>& parent,
                                     const Properties& attributes) noexcept {
        try {
            return tracer_.start_span(name, component, parent, redactor_.redacted(attributes));
        } catch (const std::exception& e) {
            Logging::logger()->warn("Failed to start span '{}': {}", name, e.what());
            return nullptr;
        }
    }

    bool end_span(const std::shared_ptr<Span>& span, SpanStatus status,
                  const Properties& data, const std::string& error_message) noexcept {
        if (!span) {
            return false;
        }
        try {
            return tracer_.end_span(span, status, redactor_.redacted(data), error_message);
        } catch (const std::exception& e) {
            Logging::logger()->warn("Failed to end span '{}': {}", span->name(), e.what());
            return false;
        }
    }

    void record_metric(const std::string& name, double value, const std::optional<std::string>& unit,
                       const MetricTags& tags) noexcept {
        // NaN and infinities have no JSON encoding, so they never reach the queue
        if (!std::isfinite(value)) {
            stats_.metrics_rejected++;
            Logging::logger()->warn("Rejecting non-finite value for metric '{}'", name);
            return;
        }
        try {
            MetricSample sample;
            sample.name = name;
            sample.value = value;
            sample.unit = unit;
            sample.tags = tags;
            sample.timestamp = clock_->system_now_ms();

            // Aggregates count the sample even if the queue later drops it
            metrics_.record(name, value, unit, sample.timestamp);
            stats_.metrics_recorded++;
            batch_.enqueue(TelemetryItem(std::move(sample)));
        } catch (const std::exception& e) {
            Logging::logger()->warn("Dropping metric '{}': {}", name, e.what());
        }
    }

    void record_health_status(const HealthReport& report) noexcept {
        try {
            HealthReport stored = report;
            // 0 means the caller left it unset
            if (stored.timestamp == 0) {
                stored.timestamp = clock_->system_now_ms();
            }
            {
                std::lock_guard<std::mutex> lock(health_mutex_);
                health_[stored.service_id] = stored;
            }
            stats_.health_reports++;

            Properties data{
                {"service_id", stored.service_id},
                {"service_name", stored.service_name},
                {"status", Utils::health_status_to_string(stored.status)},
                {"message", stored.message},
                {"version", stored.version},
                {"uptime_seconds", stored.uptime_seconds},
                {"cpu_percent", stored.resource_usage.cpu_percent},
                {"memory_percent", stored.resource_usage.memory_percent},
                {"memory_rss_bytes", static_cast<int64_t>(stored.resource_usage.memory_rss_bytes)}
            };
            for (const auto& check : stored.checks) {
                data["check." + check.first] = check.second;
            }

            log(level_for_health(stored.status),
                "Health status: " + Utils::health_status_to_string(stored.status) + " - " + stored.message,
                Components::SYSTEM, EventTypes::HEALTH, data, {});

            // The report travels twice: as a readable event and as a typed item
            batch_.enqueue(TelemetryItem(stored));

            MetricTags tags{{"service_id", stored.service_id}};
            record_metric("cpu_usage_percent", stored.resource_usage.cpu_percent, std::string("percent"), tags);
            record_metric("memory_usage_percent", stored.resource_usage.memory_percent, std::string("percent"), tags);
            record_metric("memory_rss_bytes", static_cast<double>(stored.resource_usage.memory_rss_bytes),
                          std::string("bytes"), tags);
        } catch (const std::exception& e) {
            Logging::logger()->warn("Dropping health report for '{}': {}", report.service_id, e.what());
        }
    }

    std::optional<HealthReport> get_health_status(const std::string& service_id) const {
        std::lock_guard<std::mutex> lock(health_mutex_);
        auto it = health_.find(service_id);
        if (it == health_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<HealthReport> get_health_statuses() const {
        std::lock_guard<std::mutex> lock(health_mutex_);
        std::vector<HealthReport> result;
        result.reserve(health_.size());
        for (const auto& entry : health_) {
            result.push_back(entry.second);
        }
        return result;
    }

    TelemetryHealth telemetry_health() const {
        TelemetryHealth health;
        auto batch_stats = batch_.get_stats();
        auto pipeline_stats = pipeline_.get_stats();

        health.circuit_state = pipeline_.circuit_breaker().state();
        health.remote_backend = pipeline_.has_remote_sink();
        health.queue_depth = batch_.pending_count();
        health.queue_capacity = batch_.get_config().max_queue_size;
        health.retry_buffer_depth = pipeline_.retry_buffer_size();
        health.dropped_items = batch_stats.dropped;
        health.dropped_batches = pipeline_stats.dropped_batches;
        health.delivery_failures = pipeline_stats.failures;
        health.fallback_batches = pipeline_stats.fallback_batches;
        health.outage_duration = pipeline_.circuit_breaker().outage_duration();

        // UNHEALTHY while the circuit is open. DEGRADED on a trial, a
        // non-empty retry buffer, or a queue at 80% or more of capacity.
        if (health.circuit_state == CircuitBreaker::State::OPEN) {
            health.status = HealthStatus::UNHEALTHY;
        } else if (health.circuit_state == CircuitBreaker::State::HALF_OPEN ||
                   health.retry_buffer_depth > 0 ||
                   health.queue_depth * 10 >= health.queue_capacity * 8) {
            health.status = HealthStatus::DEGRADED;
        }
        return health;
    }

    void emit_alert_event(const std::string& message, const std::string& component, Properties data) {
        log(LogLevel::INFO, message, alert_component(component), EventTypes::ALERT, data, {});
    }

    bool flush(std::chrono::milliseconds timeout) noexcept {
        try {
            return batch_.flush(timeout);
        } catch (const std::exception& e) {
            Logging::logger()->warn("Flush failed: {}", e.what());
            return false;
        }
    }

    void shutdown() noexcept {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
        try {
            // Batch first: its drain still needs the pipeline open
            batch_.shutdown();
            pipeline_.close();
            auto stats = batch_.get_stats();
            Logging::logger()->info("Telemetry monitor stopped: {} enqueued, {} delivered batches, {} dropped",
                                    stats.enqueued, stats.batches_delivered, stats.dropped);
            Logging::logger()->flush();
        } catch (const std::exception& e) {
            Logging::logger()->error("Error during telemetry shutdown: {}", e.what());
        }
    }

    MonitorStats stats() const {
        MonitorStats s;
        s.events_logged = stats_.events_logged.load();
        s.events_filtered = stats_.events_filtered.load();
        s.events_rejected = stats_.events_rejected.load();
        s.values_redacted = stats_.values_redacted.load();
        s.metrics_recorded = stats_.metrics_recorded.load();
        s.metrics_rejected = stats_.metrics_rejected.load();
        s.health_reports = stats_.health_reports.load();
        s.sampler = sampler_.snapshot();
        s.spans = tracer_.snapshot();
        s.batch = batch_.get_stats();
        s.pipeline = pipeline_.get_stats();
        s.circuit_state = pipeline_.circuit_breaker().state();
        return s;
    }

    void update_log_config(const LogConfig& log_config) {
        std::lock_guard<std::mutex> lock(log_config_mutex_);
        log_config_ = log_config;
    }

    LogConfig get_log_config() const {
        std::lock_guard<std::mutex> lock(log_config_mutex_);
        return log_config_;
    }

    Timestamp now() const { return clock_->system_now_ms(); }

    const Config config_;
    const std::shared_ptr<Clock> clock_;
    const std::string hostname_;

    Sampler sampler_;
    Redactor redactor_;
    MetricRegistry metrics_;
    AlertRegistry alerts_;
    TraceContextManager tracer_;
    std::shared_ptr<LocalSink> local_;
    // Declaration order matters: batch_ workers call into pipeline_, so batch_
    // is constructed after it and destroyed before it
    DeliveryPipeline pipeline_;
    BatchManager batch_;

private:
    struct Counters {
        std::atomic<uint64_t> events_logged{0};
        std::atomic<uint64_t> events_filtered{0};
        std::atomic<uint64_t> events_rejected{0};
        std::atomic<uint64_t> values_redacted{0};
        std::atomic<uint64_t> metrics_recorded{0};
        std::atomic<uint64_t> metrics_rejected{0};
        std::atomic<uint64_t> health_reports{0};
    };

    mutable std::mutex log_config_mutex_;
    LogConfig log_config_;
    mutable std::mutex health_mutex_;
    std::map<std::string, HealthReport> health_;
    Counters stats_;
    std::atomic<bool> running_{false};

    // Caller-supplied values win
    void add_metadata(Properties& data) const {
        if (!data.contains("service_name")) data["service_name"] = config_.service_name();
        if (!data.contains("environment")) data["environment"] = config_.environment();
        if (!data.contains("hostname")) data["hostname"] = hostname_;
    }
};

Monitor::Monitor(const Config& config, std::shared_ptr<TelemetrySink> sink, std::shared_ptr<Clock> clock)
    : pimpl_(std::make_unique<Impl>(config, std::move(sink), std::move(clock))) {}

Monitor::~Monitor() = default;

Monitor::Monitor(Monitor&&) noexcept = default;
Monitor& Monitor::operator=(Monitor&&) noexcept = default;

// Events

void Monitor::log(LogLevel level, const std::string& message, const std::string& component,
                  const std::string& event_type, const Properties& data, const Tags& tags) {
    pimpl_->log(level, message, component, event_type, data, tags);
}

void Monitor::debug(const std::string& message, const std::string& component,
                    const std::string& event_type, const Properties& data, const Tags& tags) {
    pimpl_->log(LogLevel::DEBUG, message, component, event_type, data, tags);
}

void Monitor::info(const std::string& message, const std::string& component,
                   const std::string& event_type, const Properties& data, const Tags& tags) {
    pimpl_->log(LogLevel::INFO, message, component, event_type, data, tags);
}

void Monitor::warning(const std::string& message, const std::string& component,
                      const std::string& event_type, const Properties& data, const Tags& tags) {
    pimpl_->log(LogLevel::WARNING, message, component, event_type, data, tags);
}

void Monitor::error(const std::string& message, const std::string& component,
                    const std::string& event_type, const Properties& data, const Tags& tags) {
    pimpl_->log(LogLevel::ERROR, message, component, event_type, data, tags);
}

void Monitor::critical(const std::string& message, const std::string& component,
                       const std::string& event_type, const Properties& data, const Tags& tags) {
    pimpl_->log(LogLevel::CRITICAL, message, component, event_type, data, tags);
}

// Spans and context propagation

std::shared_ptr<Span> Monitor::start_span(const std::string& name, const std::string& component,
                                          const std::optional<SpanContext>& parent,
                                          const Properties& attributes) {
    return pimpl_->start_span(name, component, parent, attributes);
}

bool Monitor::end_span(const std::shared_ptr<Span>& span, SpanStatus status,
                       const Properties& data, const std::string& error_message) {
    return pimpl_->end_span(span, status, data, error_message);
}

std::shared_ptr<Span> Monitor::current_span() const {
    return pimpl_->tracer_.current_span();
}

void Monitor::inject_context(TracePropagation::Headers& headers) const {
    auto context = pimpl_->tracer_.current_context();
    if (context) {
        TracePropagation::inject(*context, headers);
    }
}

std::optional<SpanContext> Monitor::extract_context(const TracePropagation::Headers& headers) const {
    return TracePropagation::extract(headers);
}

// Metrics

void Monitor::record_metric(const std::string& name, double value,
                            const std::optional<std::string>& unit, const MetricTags& tags) {
    pimpl_->record_metric(name, value, unit, tags);
}

void Monitor::register_metric(const MetricDefinition& definition) {
    pimpl_->metrics_.register_metric(definition);
}

std::vector<MetricSnapshot> Monitor::get_metrics() const {
    return pimpl_->metrics_.all();
}

std::optional<MetricSnapshot> Monitor::get_metric(const std::string& name) const {
    return pimpl_->metrics_.get(name);
}

// Convenience recorders built on log and record_metric

void Monitor::record_api_call(const std::string& endpoint, const std::string& method,
                              int status_code, double duration_ms,
                              const std::string& component, const std::string& error_message) {
    const bool success = status_code >= 200 && status_code < 300;
    LogLevel level = LogLevel::INFO;
    if (status_code >= 500) {
        level = LogLevel::ERROR;
    } else if (status_code >= 400) {
        level = LogLevel::WARNING;
    }

    Properties data{
        {"endpoint", endpoint},
        {"method", method},
        {"status_code", static_cast<int64_t>(status_code)},
        {"duration_ms", duration_ms},
        {"success", success}
    };
    if (!error_message.empty()) {
        data["error"] = error_message;
    }

    pimpl_->log(level,
                "API call " + method + " " + endpoint + (success ? " succeeded" : " failed") +
                    " with status " + std::to_string(status_code),
                component, EventTypes::REQUEST, data, {});

    pimpl_->record_metric("api_call_duration_ms", duration_ms, std::string("ms"),
                          {{"endpoint", endpoint},
                           {"method", method},
                           {"status_code", std::to_string(status_code)},
                           {"success", success ? "true" : "false"},
                           {"component", component}});
}

void Monitor::record_performance(const std::string& operation, double duration_ms,
                                 const std::string& component, bool success, const Properties& details) {
    Properties data = details;
    data["operation"] = operation;
    data["duration_ms"] = duration_ms;
    data["success"] = success;

    pimpl_->log(LogLevel::INFO, "Performance: " + operation + " took " + std::to_string(duration_ms) + "ms",
                component, EventTypes::METRIC, data, {});

    pimpl_->record_metric("operation_duration_ms", duration_ms, std::string("ms"),
                          {{"operation", operation},
                           {"success", success ? "true" : "false"},
                           {"component", component}});
}

void Monitor::record_model_validation(const std::string& model_name, bool success,
                                      const Properties& data, const std::string& error,
                                      const std::string& component) {
    Properties log_data = data;
    log_data["model_name"] = model_name;
    log_data["success"] = success;
    if (!error.empty()) {
        log_data["error"] = error;
    }

    pimpl_->log(success ? LogLevel::INFO : LogLevel::ERROR,
                std::string("Model validation ") + (success ? "succeeded" : "failed") + ": " + model_name,
                component, EventTypes::VALIDATION, log_data, {});
}

// Health

void Monitor::record_health_status(const HealthReport& report) {
    pimpl_->record_health_status(report);
}

std::optional<HealthReport> Monitor::get_health_status(const std::string& service_id) const {
    return pimpl_->get_health_status(service_id);
}

std::vector<HealthReport> Monitor::get_health_statuses() const {
    return pimpl_->get_health_statuses();
}

TelemetryHealth Monitor::telemetry_health() const {
    return pimpl_->telemetry_health();
}

// Alerts. Every mutation is logged as an alert event.

AlertConfig Monitor::create_alert(const AlertConfig& config) {
    AlertConfig created = pimpl_->alerts_.create(config);
    pimpl_->emit_alert_event("Alert created: " + created.name, created.component,
                             {{"alert_id", created.alert_id},
                              {"severity", Utils::log_level_to_string(created.severity)},
                              {"condition", created.condition}});
    return created;
}

std::optional<AlertConfig> Monitor::update_alert(const std::string& alert_id, const AlertUpdate& update) {
    auto updated = pimpl_->alerts_.update(alert_id, update);
    if (updated) {
        pimpl_->emit_alert_event("Alert updated: " + updated->name, updated->component,
                                 {{"alert_id", alert_id}, {"enabled", updated->enabled}});
    }
    return updated;
}

bool Monitor::delete_alert(const std::string& alert_id) {
    auto existing = pimpl_->alerts_.get(alert_id);
    if (!existing || !pimpl_->alerts_.remove(alert_id)) {
        return false;
    }
    pimpl_->emit_alert_event("Alert deleted: " + existing->name, existing->component,
                             {{"alert_id", alert_id}});
    return true;
}

std::optional<AlertConfig> Monitor::get_alert(const std::string& alert_id) const {
    return pimpl_->alerts_.get(alert_id);
}

std::vector<AlertConfig> Monitor::get_alerts(const std::optional<std::string>& component) const {
    return pimpl_->alerts_.list(component);
}

std::optional<AlertInstance> Monitor::trigger_alert(const std::string& alert_id, double value,
                                                    const std::string& message, const Properties& metadata) {
    auto instance = pimpl_->alerts_.trigger(alert_id, value, message, pimpl_->now(),
                                            pimpl_->redactor_.redacted(metadata));
    if (instance) {
        Properties data = instance->metadata;
        data["alert_id"] = alert_id;
        data["instance_id"] = instance->instance_id;
        data["value"] = value;
        data["severity"] = Utils::log_level_to_string(instance->severity);
        pimpl_->emit_alert_event("Alert triggered: " + message, instance->component, data);
    }
    return instance;
}

std::vector<AlertInstance> Monitor::get_alert_instances(const std::optional<std::string>& alert_id,
                                                        const std::optional<AlertStatus>& status) const {
    return pimpl_->alerts_.instances(alert_id, status);
}

std::optional<AlertInstance> Monitor::acknowledge_alert(const std::string& instance_id,
                                                        const std::string& acknowledged_by) {
    auto instance = pimpl_->alerts_.acknowledge(instance_id, acknowledged_by, pimpl_->now());
    if (instance) {
        pimpl_->emit_alert_event("Alert acknowledged by " + acknowledged_by, instance->component,
                                 {{"alert_id", instance->alert_id}, {"instance_id", instance_id}});
    }
    return instance;
}

std::optional<AlertInstance> Monitor::resolve_alert(const std::string& instance_id,
                                                    const std::optional<std::string>& resolution_message) {
    auto instance = pimpl_->alerts_.resolve(instance_id, resolution_message, pimpl_->now());
    if (instance) {
        Properties data{{"alert_id", instance->alert_id}, {"instance_id", instance_id}};
        if (resolution_message) {
            data["resolution_message"] = *resolution_message;
        }
        pimpl_->emit_alert_event("Alert resolved", instance->component, data);
    }
    return instance;
}

// Control

void Monitor::update_log_config(const LogConfig& log_config) {
    pimpl_->update_log_config(log_config);
}

LogConfig Monitor::get_log_config() const {
    return pimpl_->get_log_config();
}

bool Monitor::flush(std::chrono::milliseconds timeout) {
    return pimpl_->flush(timeout);
}

void Monitor::shutdown() {
    pimpl_->shutdown();
}

bool Monitor::is_running() const {
    return pimpl_->batch_.is_running();
}

MonitorStats Monitor::stats() const {
    return pimpl_->stats();
}

const Config& Monitor::config() const {
    return pimpl_->config_;
}

LocalSink& Monitor::local_sink() {
    return *pimpl_->local_;
}

// ScopedSpan

ScopedSpan::ScopedSpan(Monitor& monitor, const std::string& name, const std::string& component,
                       const Properties& attributes)
    : monitor_(monitor),
      span_(monitor.start_span(name, component, std::nullopt, attributes)),
      uncaught_on_entry_(std::uncaught_exceptions()) {}

ScopedSpan::~ScopedSpan() {
    if (!span_) {
        return;
    }
    // Unwinding past the scope counts as failure unless mark_error already said why
    if (!failed_ && std::uncaught_exceptions() > uncaught_on_entry_) {
        failed_ = true;
        error_message_ = "exception in '" + span_->name() + "'";
    }
    end();
}

void ScopedSpan::set_attribute(const std::string& key, const PropertyValue& value) {
    if (span_) {
        span_->set_attribute(key, value);
    }
}

void ScopedSpan::add_data(const std::string& key, const PropertyValue& value) {
    end_data_[key] = value;
}

void ScopedSpan::mark_error(const std::string& message, const std::string& error_type) {
    failed_ = true;
    error_message_ = message;
    if (!error_type.empty()) {
        end_data_["error_type"] = error_type;
    }
}

void ScopedSpan::end() {
    if (!span_) {
        return;
    }
    monitor_.end_span(span_, failed_ ? SpanStatus::ERROR : SpanStatus::OK, end_data_, error_message_);
    span_.reset();
}

// PerformanceTracker

// span_ is built before timer_ starts, so the reported duration covers only the
// caller's scope and not the span start event
PerformanceTracker::PerformanceTracker(Monitor& monitor, const std::string& operation,
                                       const std::string& component, const Properties& details)
    : monitor_(monitor),
      operation_(operation),
      component_(component),
      details_(details),
      uncaught_on_entry_(std::uncaught_exceptions()),
      span_(monitor, operation, component, details),
      timer_([this](Utils::ScopedTimer::Duration elapsed) { report(elapsed); }) {}

void PerformanceTracker::add_data(const std::string& key, const PropertyValue& value) {
    details_[key] = value;
    span_.add_data(key, value);
}

void PerformanceTracker::mark_error(const std::string& message, const std::string& error_type) {
    failed_ = true;
    details_["error"] = message;
    if (!error_type.empty()) {
        details_["error_type"] = error_type;
    }
    span_.mark_error(message, error_type);
}

void PerformanceTracker::report(Utils::ScopedTimer::Duration elapsed) {
    if (!failed_ && std::uncaught_exceptions() > uncaught_on_entry_) {
        failed_ = true;
        details_["error"] = "exception in '" + operation_ + "'";
    }
    monitor_.record_performance(operation_, elapsed.count(), component_, !failed_, details_);
}

// Lifecycle

MonitorHandle init(const Config& config, std::shared_ptr<TelemetrySink> sink) {
    return std::make_shared<Monitor>(config, std::move(sink));
}

void shutdown(const MonitorHandle& handle) {
    if (handle) {
        handle->shutdown();
    }
}

} // namespace telemetry
