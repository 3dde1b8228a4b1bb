// tests/test_trace_context.cpp
// Tests for span lifecycle, per-thread span stacks and propagation headers

#include <gtest/gtest.h>
#include "telemetry/trace.hpp"
#include "telemetry/utils.hpp"
#include "test_helpers.hpp"
#include <thread>

using namespace telemetry;
using testing_support::ManualClock;

class TraceContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        tracer_ = std::make_unique<TraceContextManager>(clock_);
        tracer_->set_emit_callback([this](Event event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        });
    }

    std::vector<Event> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<Event> end_events() {
        std::vector<Event> result;
        for (const auto& event : events()) {
            if (Utils::starts_with(event.message, "End span: ")) {
                result.push_back(event);
            }
        }
        return result;
    }

    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<TraceContextManager> tracer_;
    std::mutex mutex_;
    std::vector<Event> events_;
};

TEST_F(TraceContextTest, TestRootSpan) {
    auto span = tracer_->start_span("load", Components::DATABASE, std::nullopt, {{"table", std::string("orders")}});

    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->trace_id().size(), 32u);
    EXPECT_EQ(span->span_id().size(), 16u);
    EXPECT_FALSE(span->parent_span_id().has_value());
    EXPECT_EQ(span->status(), SpanStatus::OPEN);
    EXPECT_FALSE(span->is_finished());
    EXPECT_EQ(tracer_->current_span(), span);

    auto start = events().at(0);
    EXPECT_EQ(start.level, LogLevel::DEBUG);
    EXPECT_EQ(start.event_type, EventTypes::SPAN);
    EXPECT_EQ(start.span_id, span->span_id());
    EXPECT_EQ(std::get<std::string>(start.data.at("table")), "orders");
}

TEST_F(TraceContextTest, TestParentChildLinkage) {
    auto a = tracer_->start_span("A", Components::AGENT_CORE);
    auto b = tracer_->start_span("B", Components::AGENT_CORE, a->context());

    EXPECT_TRUE(tracer_->end_span(b));
    EXPECT_TRUE(tracer_->end_span(a));

    auto ends = end_events();
    ASSERT_EQ(ends.size(), 2u);
    const Event& end_b = ends[0];
    const Event& end_a = ends[1];

    EXPECT_EQ(end_b.span_id, b->span_id());
    EXPECT_EQ(end_a.span_id, a->span_id());
    EXPECT_EQ(end_b.parent_span_id, a->span_id());
    EXPECT_EQ(end_b.trace_id, end_a.trace_id);
    EXPECT_FALSE(end_a.parent_span_id.has_value());
    EXPECT_EQ(tracer_->snapshot().anomalies, 0u);
}

TEST_F(TraceContextTest, TestImplicitParentFromStack) {
    auto outer = tracer_->start_span("outer", Components::SYSTEM);
    auto inner = tracer_->start_span("inner", Components::SYSTEM);

    EXPECT_EQ(inner->parent_span_id(), outer->span_id());
    EXPECT_EQ(inner->trace_id(), outer->trace_id());
    EXPECT_EQ(tracer_->active_depth(), 2u);

    tracer_->end_span(inner);
    EXPECT_EQ(tracer_->current_span(), outer);
    tracer_->end_span(outer);
    EXPECT_EQ(tracer_->current_span(), nullptr);
    EXPECT_EQ(tracer_->active_depth(), 0u);
}

TEST_F(TraceContextTest, TestEndSpanIsIdempotent) {
    auto span = tracer_->start_span("once", Components::SYSTEM);
    clock_->advance(std::chrono::milliseconds(40));

    EXPECT_TRUE(tracer_->end_span(span, SpanStatus::OK, {{"rows", int64_t(3)}}));
    auto end_time = span->end_time();
    ASSERT_TRUE(end_time.has_value());

    clock_->advance(std::chrono::milliseconds(40));
    EXPECT_FALSE(tracer_->end_span(span, SpanStatus::ERROR, {}, "late"));

    EXPECT_EQ(span->end_time(), end_time);
    EXPECT_EQ(span->status(), SpanStatus::OK);
    EXPECT_FALSE(span->error_message().has_value());
    EXPECT_DOUBLE_EQ(span->duration_ms(), 40.0);
    EXPECT_EQ(end_events().size(), 1u);
    EXPECT_EQ(tracer_->snapshot().duplicate_ends, 1u);
}

TEST_F(TraceContextTest, TestTerminalEventData) {
    auto span = tracer_->start_span("query", Components::DATABASE);
    clock_->advance(std::chrono::milliseconds(12));
    tracer_->end_span(span, SpanStatus::ERROR, {{"sql_state", std::string("40001")}}, "deadlock");

    auto ends = end_events();
    ASSERT_EQ(ends.size(), 1u);
    const Event& end = ends[0];
    EXPECT_EQ(end.level, LogLevel::ERROR);
    EXPECT_EQ(std::get<std::string>(end.data.at("status")), "error");
    EXPECT_EQ(std::get<std::string>(end.data.at("error_message")), "deadlock");
    EXPECT_EQ(std::get<std::string>(end.data.at("sql_state")), "40001");
    EXPECT_DOUBLE_EQ(std::get<double>(end.data.at("duration_ms")), 12.0);
    EXPECT_EQ(span->error_message(), std::optional<std::string>("deadlock"));
}

TEST_F(TraceContextTest, TestAttributesFrozenAfterEnd) {
    auto span = tracer_->start_span("attrs", Components::SYSTEM);
    span->set_attribute("before", true);
    tracer_->end_span(span);
    span->set_attribute("after", true);

    auto attributes = span->attributes();
    EXPECT_TRUE(attributes.contains("before"));
    EXPECT_FALSE(attributes.contains("after"));
}

TEST_F(TraceContextTest, TestParentEndedFirstIsAnomaly) {
    auto parent = tracer_->start_span("parent", Components::SYSTEM);
    auto child = tracer_->start_span("child", Components::SYSTEM);

    tracer_->end_span(parent);
    EXPECT_EQ(tracer_->snapshot().anomalies, 1u);

    // Child still ends normally and keeps its linkage
    EXPECT_TRUE(tracer_->end_span(child));
    EXPECT_EQ(child->parent_span_id(), parent->span_id());
    EXPECT_EQ(tracer_->snapshot().anomalies, 2u);
}

TEST_F(TraceContextTest, TestThreadIsolation) {
    auto main_span = tracer_->start_span("main", Components::SYSTEM);

    std::shared_ptr<Span> worker_current;
    std::shared_ptr<Span> worker_span;
    std::thread worker([&]() {
        worker_current = tracer_->current_span();
        worker_span = tracer_->start_span("worker", Components::SYSTEM);
        tracer_->end_span(worker_span);
    });
    worker.join();

    EXPECT_EQ(worker_current, nullptr);
    ASSERT_NE(worker_span, nullptr);
    EXPECT_FALSE(worker_span->parent_span_id().has_value());
    EXPECT_NE(worker_span->trace_id(), main_span->trace_id());
    EXPECT_EQ(tracer_->current_span(), main_span);
    tracer_->end_span(main_span);
}

TEST_F(TraceContextTest, TestManagersDoNotShareStacks) {
    TraceContextManager other(clock_);
    auto span = tracer_->start_span("mine", Components::SYSTEM);

    EXPECT_EQ(other.current_span(), nullptr);
    auto unrelated = other.start_span("theirs", Components::SYSTEM);
    EXPECT_FALSE(unrelated->parent_span_id().has_value());

    other.end_span(unrelated);
    tracer_->end_span(span);
}

TEST_F(TraceContextTest, TestPropagationRoundTrip) {
    auto span = tracer_->start_span("client-call", Components::API_GATEWAY);

    TracePropagation::Headers headers;
    TracePropagation::inject(span->context(), headers);
    EXPECT_EQ(headers[TracePropagation::TRACE_ID_HEADER], span->trace_id());
    EXPECT_EQ(headers[TracePropagation::PARENT_SPAN_ID_HEADER], span->span_id());

    auto extracted = TracePropagation::extract(headers);
    ASSERT_TRUE(extracted.has_value());

    auto remote_child = tracer_->start_span("server-handler", Components::API_GATEWAY, extracted);
    EXPECT_EQ(remote_child->trace_id(), span->trace_id());
    EXPECT_EQ(remote_child->parent_span_id(), span->span_id());

    tracer_->end_span(remote_child);
    tracer_->end_span(span);
}

TEST_F(TraceContextTest, TestExtractIsCaseInsensitiveAndStrict) {
    TracePropagation::Headers headers{
        {"X-Trace-Id", " 0AF7651916CD43DD8448EB211C80319C "},
        {"X-PARENT-SPAN-ID", "B7AD6B7169203331"}
    };
    auto context = TracePropagation::extract(headers);
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(context->trace_id, "0af7651916cd43dd8448eb211c80319c");
    EXPECT_EQ(context->span_id, "b7ad6b7169203331");

    TracePropagation::Headers empty;
    EXPECT_FALSE(TracePropagation::extract(empty).has_value());

    TracePropagation::Headers short_trace{{"x-trace-id", "abc"}, {"x-parent-span-id", "b7ad6b7169203331"}};
    EXPECT_FALSE(TracePropagation::extract(short_trace).has_value());

    TracePropagation::Headers zero_trace{{"x-trace-id", std::string(32, '0')},
                                         {"x-parent-span-id", "b7ad6b7169203331"}};
    EXPECT_FALSE(TracePropagation::extract(zero_trace).has_value());
}

TEST_F(TraceContextTest, TestMalformedParentStartsNewRoot) {
    SpanContext bogus{"not-hex", "also-not-hex"};
    EXPECT_FALSE(bogus.is_valid());

    auto span = tracer_->start_span("fresh", Components::SYSTEM, bogus);
    EXPECT_FALSE(span->parent_span_id().has_value());
    EXPECT_NE(span->trace_id(), bogus.trace_id);
    tracer_->end_span(span);
}
