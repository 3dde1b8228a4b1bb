// include/telemetry/trace.hpp
// Purpose: Distributed trace context management
// Span lifecycle, per-thread active span stacks and cross-process propagation headers

#pragma once

#include "types.hpp"
#include "clock.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace telemetry {

enum class SpanStatus : uint8_t {
    OPEN = 0,
    OK = 1,
    ERROR = 2
};

std::string span_status_to_string(SpanStatus status);

// The part of a span that crosses process boundaries
struct SpanContext {
    TraceId trace_id;
    SpanId span_id;

    bool is_valid() const;
};

// A timed unit of work. Mutable until ended; end_time is set at most once.
class Span {
public:
    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    const SpanId& span_id() const { return span_id_; }
    const TraceId& trace_id() const { return trace_id_; }
    const std::optional<SpanId>& parent_span_id() const { return parent_span_id_; }
    const std::string& name() const { return name_; }
    const std::string& component() const { return component_; }
    Timestamp start_time() const { return start_time_; }
    SpanContext context() const { return SpanContext{trace_id_, span_id_}; }

    std::optional<Timestamp> end_time() const;
    SpanStatus status() const;
    Properties attributes() const;
    std::optional<std::string> error_message() const;
    bool is_finished() const;
    double duration_ms() const;

    void set_attribute(const std::string& key, const PropertyValue& value);

private:
    friend class TraceContextManager;

    Span(SpanId span_id, TraceId trace_id, std::optional<SpanId> parent_span_id,
         std::string name, std::string component, Timestamp start_time,
         Clock::TimePoint start_steady, Properties attributes);

    const SpanId span_id_;
    const TraceId trace_id_;
    const std::optional<SpanId> parent_span_id_;
    const std::string name_;
    const std::string component_;
    const Timestamp start_time_;
    const Clock::TimePoint start_steady_;
    std::weak_ptr<Span> local_parent_;

    mutable std::mutex mutex_;
    std::optional<Timestamp> end_time_;
    double duration_ms_ = 0.0;
    SpanStatus status_ = SpanStatus::OPEN;
    Properties attributes_;
    std::optional<std::string> error_message_;
};

// Owns span creation and the active-span stack of every thread that uses it
class TraceContextManager {
public:
    using EmitCallback = std::function<void(Event)>;

    explicit TraceContextManager(std::shared_ptr<Clock> clock = SystemClock::instance());
    ~TraceContextManager();

    TraceContextManager(const TraceContextManager&) = delete;
    TraceContextManager& operator=(const TraceContextManager&) = delete;

    // Receives the span start and terminal events
    void set_emit_callback(EmitCallback callback);

    // Parent resolution: explicit parent, else the calling thread's active span, else a new root
    std::shared_ptr<Span> start_span(const std::string& name,
                                     const std::string& component,
                                     const std::optional<SpanContext>& parent = std::nullopt,
                                     const Properties& attributes = {});

    // Returns false, and emits nothing, when the span was already ended
    bool end_span(const std::shared_ptr<Span>& span,
                  SpanStatus status = SpanStatus::OK,
                  const Properties& data = {},
                  const std::string& error_message = "");

    // Innermost unfinished span started on the calling thread
    std::shared_ptr<Span> current_span() const;
    std::optional<SpanContext> current_context() const;
    size_t active_depth() const;

    struct Snapshot {
        uint64_t spans_started = 0;
        uint64_t spans_ended = 0;
        uint64_t duplicate_ends = 0;
        uint64_t anomalies = 0;
    };

    Snapshot snapshot() const {
        Snapshot s;
        s.spans_started = spans_started_.load();
        s.spans_ended = spans_ended_.load();
        s.duplicate_ends = duplicate_ends_.load();
        s.anomalies = anomalies_.load();
        return s;
    }

private:
    const uint64_t id_;
    std::shared_ptr<Clock> clock_;
    mutable std::mutex callback_mutex_;
    EmitCallback emit_;

    std::atomic<uint64_t> spans_started_{0};
    std::atomic<uint64_t> spans_ended_{0};
    std::atomic<uint64_t> duplicate_ends_{0};
    std::atomic<uint64_t> anomalies_{0};

    void emit(Event event);
    void pop_from_stack(const std::shared_ptr<Span>& span);
};

// Trace propagation over request metadata
namespace TracePropagation {

constexpr const char* TRACE_ID_HEADER = "x-trace-id";
constexpr const char* PARENT_SPAN_ID_HEADER = "x-parent-span-id";

using Headers = std::map<std::string, std::string>;

void inject(const SpanContext& context, Headers& headers);

// Header names match case-insensitively. Missing or malformed ids yield nullopt,
// which means the receiver starts a new root trace.
std::optional<SpanContext> extract(const Headers& headers);

} // namespace TracePropagation

} // namespace telemetry
