// src/trace.cpp
// Span lifecycle, per-thread active span stacks and propagation headers

#include "telemetry/trace.hpp"
#include "telemetry/utils.hpp"
#include "telemetry/logging.hpp"
#include <algorithm>
#include <unordered_map>
#include <vector>

namespace telemetry {

namespace {

using SpanStack = std::vector<std::weak_ptr<Span>>;

// One stack per manager per thread. Empty stacks are erased so dead managers leave nothing behind.
std::unordered_map<uint64_t, SpanStack>& thread_stacks() {
    static thread_local std::unordered_map<uint64_t, SpanStack> stacks;
    return stacks;
}

SpanStack* find_stack(uint64_t manager_id) {
    auto& stacks = thread_stacks();
    auto it = stacks.find(manager_id);
    return it != stacks.end() ? &it->second : nullptr;
}

// Drop finished or expired entries from the top of the stack
void prune(SpanStack& stack) {
    while (!stack.empty()) {
        auto top = stack.back().lock();
        if (top && !top->is_finished()) {
            break;
        }
        stack.pop_back();
    }
}

std::atomic<uint64_t> next_manager_id{1};

} // namespace

std::string span_status_to_string(SpanStatus status) {
    switch (status) {
        case SpanStatus::OPEN: return "unset";
        case SpanStatus::OK: return "ok";
        case SpanStatus::ERROR: return "error";
        default: return "unset";
    }
}

bool SpanContext::is_valid() const {
    return trace_id.size() == 32 && Utils::is_hex_string(trace_id) &&
           span_id.size() == 16 && Utils::is_hex_string(span_id) &&
           trace_id != std::string(32, '0') && span_id != std::string(16, '0');
}

// Span implementation
Span::Span(SpanId span_id, TraceId trace_id, std::optional<SpanId> parent_span_id,
           std::string name, std::string component, Timestamp start_time,
           Clock::TimePoint start_steady, Properties attributes)
    : span_id_(std::move(span_id)), trace_id_(std::move(trace_id)),
      parent_span_id_(std::move(parent_span_id)), name_(std::move(name)),
      component_(std::move(component)), start_time_(start_time),
      start_steady_(start_steady), attributes_(std::move(attributes)) {}

std::optional<Timestamp> Span::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

SpanStatus Span::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

Properties Span::attributes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attributes_;
}

std::optional<std::string> Span::error_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

bool Span::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_.has_value();
}

double Span::duration_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duration_ms_;
}

void Span::set_attribute(const std::string& key, const PropertyValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!end_time_) {
        attributes_[key] = value;
    }
}

// TraceContextManager implementation
TraceContextManager::TraceContextManager(std::shared_ptr<Clock> clock)
    : id_(next_manager_id++), clock_(clock ? std::move(clock) : SystemClock::instance()) {}

TraceContextManager::~TraceContextManager() {
    thread_stacks().erase(id_);
}

void TraceContextManager::set_emit_callback(EmitCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    emit_ = std::move(callback);
}

void TraceContextManager::emit(Event event) {
    EmitCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = emit_;
    }
    if (callback) {
        callback(std::move(event));
    }
}

std::shared_ptr<Span> TraceContextManager::start_span(const std::string& name,
                                                      const std::string& component,
                                                      const std::optional<SpanContext>& parent,
                                                      const Properties& attributes) {
    auto& stack = thread_stacks()[id_];
    prune(stack);

    TraceId trace_id;
    std::optional<SpanId> parent_span_id;
    std::shared_ptr<Span> local_parent;

    if (parent && parent->is_valid()) {
        trace_id = parent->trace_id;
        parent_span_id = parent->span_id;
    } else if (!stack.empty()) {
        local_parent = stack.back().lock();
        trace_id = local_parent->trace_id();
        parent_span_id = local_parent->span_id();
    } else {
        if (parent) {
            Logging::logger()->debug("Ignoring invalid parent context for span '{}'", name);
        }
        trace_id = Utils::generate_trace_id();
    }

    std::shared_ptr<Span> span(new Span(Utils::generate_span_id(), trace_id, parent_span_id,
                                        name, component, clock_->system_now_ms(),
                                        clock_->steady_now(), attributes));
    span->local_parent_ = local_parent;
    stack.push_back(span);
    spans_started_++;

    Event start;
    start.event_id = Utils::generate_event_id();
    start.timestamp = span->start_time();
    start.level = LogLevel::DEBUG;
    start.component = component;
    start.event_type = EventTypes::SPAN;
    start.message = "Start span: " + name;
    start.data = attributes;
    start.data["span_name"] = name;
    start.trace_id = span->trace_id();
    start.span_id = span->span_id();
    start.parent_span_id = span->parent_span_id();
    emit(std::move(start));

    return span;
}

bool TraceContextManager::end_span(const std::shared_ptr<Span>& span,
                                   SpanStatus status,
                                   const Properties& data,
                                   const std::string& error_message) {
    if (!span) {
        return false;
    }

    if (status == SpanStatus::OPEN) {
        status = SpanStatus::OK;
    }

    Event terminal;
    {
        std::lock_guard<std::mutex> lock(span->mutex_);
        if (span->end_time_) {
            duplicate_ends_++;
            return false;
        }

        span->end_time_ = clock_->system_now_ms();
        span->duration_ms_ = std::chrono::duration<double, std::milli>(
            clock_->steady_now() - span->start_steady_).count();
        span->status_ = status;
        span->attributes_.merge(data);
        if (!error_message.empty()) {
            span->error_message_ = error_message;
        }

        terminal.event_id = Utils::generate_event_id();
        terminal.timestamp = *span->end_time_;
        terminal.level = status == SpanStatus::ERROR ? LogLevel::ERROR : LogLevel::INFO;
        terminal.component = span->component_;
        terminal.event_type = EventTypes::SPAN;
        terminal.message = "End span: " + span->name_;
        terminal.data = span->attributes_;
        terminal.data["span_name"] = span->name_;
        terminal.data["duration_ms"] = span->duration_ms_;
        terminal.data["status"] = span_status_to_string(status);
        terminal.data["start_time"] = Utils::timestamp_to_iso8601(span->start_time_);
        if (span->error_message_) {
            terminal.data["error_message"] = *span->error_message_;
        }
        terminal.trace_id = span->trace_id_;
        terminal.span_id = span->span_id_;
        terminal.parent_span_id = span->parent_span_id_;
    }

    if (auto parent = span->local_parent_.lock()) {
        if (parent->is_finished()) {
            anomalies_++;
            Logging::logger()->warn("Span '{}' ({}) ended after its parent '{}' was closed",
                                    span->name(), span->span_id(), parent->name());
        }
    }

    pop_from_stack(span);
    spans_ended_++;
    emit(std::move(terminal));
    return true;
}

void TraceContextManager::pop_from_stack(const std::shared_ptr<Span>& span) {
    SpanStack* stack = find_stack(id_);
    if (!stack) {
        return;
    }

    auto it = std::find_if(stack->begin(), stack->end(), [&span](const std::weak_ptr<Span>& entry) {
        return entry.lock() == span;
    });

    if (it != stack->end()) {
        if (std::next(it) != stack->end()) {
            // Children still open on this thread
            anomalies_++;
            Logging::logger()->warn("Span '{}' ({}) ended while {} nested span(s) remain open",
                                    span->name(), span->span_id(),
                                    std::distance(std::next(it), stack->end()));
        }
        stack->erase(it);
    }

    prune(*stack);
    if (stack->empty()) {
        thread_stacks().erase(id_);
    }
}

std::shared_ptr<Span> TraceContextManager::current_span() const {
    SpanStack* stack = find_stack(id_);
    if (!stack) {
        return nullptr;
    }
    prune(*stack);
    return stack->empty() ? nullptr : stack->back().lock();
}

std::optional<SpanContext> TraceContextManager::current_context() const {
    if (auto span = current_span()) {
        return span->context();
    }
    return std::nullopt;
}

size_t TraceContextManager::active_depth() const {
    SpanStack* stack = find_stack(id_);
    if (!stack) {
        return 0;
    }
    prune(*stack);
    return static_cast<size_t>(std::count_if(stack->begin(), stack->end(), [](const std::weak_ptr<Span>& entry) {
        auto span = entry.lock();
        return span && !span->is_finished();
    }));
}

namespace TracePropagation {

void inject(const SpanContext& context, Headers& headers) {
    if (!context.is_valid()) {
        return;
    }
    headers[TRACE_ID_HEADER] = context.trace_id;
    headers[PARENT_SPAN_ID_HEADER] = context.span_id;
}

std::optional<SpanContext> extract(const Headers& headers) {
    std::optional<std::string> trace_id;
    std::optional<std::string> span_id;

    for (const auto& [name, value] : headers) {
        std::string lower = Utils::to_lower(name);
        if (lower == TRACE_ID_HEADER) {
            trace_id = Utils::to_lower(Utils::trim(value));
        } else if (lower == PARENT_SPAN_ID_HEADER) {
            span_id = Utils::to_lower(Utils::trim(value));
        }
    }

    if (!trace_id || !span_id) {
        return std::nullopt;
    }

    SpanContext context{*trace_id, *span_id};
    if (!context.is_valid()) {
        return std::nullopt;
    }
    return context;
}

} // namespace TracePropagation

} // namespace telemetry
