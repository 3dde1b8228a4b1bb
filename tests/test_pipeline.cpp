// tests/test_pipeline.cpp
// Tests for retries, circuit breaking, the retry buffer, fallback routing and self-reporting

#include <gtest/gtest.h>
#include "telemetry/pipeline.hpp"
#include "test_helpers.hpp"

using namespace telemetry;
using testing_support::ManualClock;
using testing_support::ScriptedSink;
using testing_support::make_batch;
using testing_support::make_event;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<ScriptedSink>();
        config_.set_max_retries(0)
               .set_retry_backoff(std::chrono::milliseconds(1), 2.0, std::chrono::milliseconds(4))
               .set_failure_threshold(5)
               .set_recovery_timeout(std::chrono::milliseconds(30000))
               .set_retry_buffer_size(16)
               .set_fallback_after(std::chrono::milliseconds(60000))
               .set_fallback_capacity(100);
    }

    std::unique_ptr<DeliveryPipeline> make_pipeline(std::shared_ptr<TelemetrySink> remote) {
        auto pipeline = std::make_unique<DeliveryPipeline>(config_, std::move(remote), nullptr, clock_);
        pipeline->set_enqueue_callback([this](TelemetryItem item) {
            reports_.push_back(std::move(item));
            return true;
        });
        return pipeline;
    }

    std::unique_ptr<DeliveryPipeline> make_pipeline() {
        return make_pipeline(sink_);
    }

    Config config_{"pipeline-test"};
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<ScriptedSink> sink_;
    std::vector<TelemetryItem> reports_;
};

TEST_F(PipelineTest, TestSuccessfulDelivery) {
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline->deliver(make_batch(3)), DeliveryOutcome::SUCCESS);
    EXPECT_EQ(sink_->calls(), 1u);
    ASSERT_EQ(sink_->delivered().size(), 1u);
    EXPECT_EQ(sink_->delivered()[0].size(), 3u);

    auto stats = pipeline->get_stats();
    EXPECT_EQ(stats.successes, 1u);
    EXPECT_DOUBLE_EQ(stats.get_success_rate(), 1.0);
    EXPECT_TRUE(reports_.empty());
}

TEST_F(PipelineTest, TestCircuitOpensAndShortCircuits) {
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(pipeline->deliver(make_batch(1)), DeliveryOutcome::FAILURE);
    }
    EXPECT_EQ(sink_->calls(), 5u);
    EXPECT_EQ(pipeline->circuit_breaker().state(), CircuitBreaker::State::OPEN);

    EXPECT_EQ(pipeline->deliver(make_batch(1)), DeliveryOutcome::FAILURE);
    EXPECT_EQ(sink_->calls(), 5u);
    EXPECT_EQ(pipeline->retry_buffer_size(), 1u);

    auto stats = pipeline->get_stats();
    EXPECT_EQ(stats.short_circuited, 1u);
    EXPECT_EQ(stats.dropped_batches, 5u);
    EXPECT_EQ(stats.self_reports, 5u);
}

TEST_F(PipelineTest, TestRetryBufferDrainsAfterRecovery) {
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    for (int i = 0; i < 5; ++i) {
        pipeline->deliver(make_batch(1));
    }
    pipeline->deliver(make_batch(2));
    pipeline->deliver(make_batch(3));
    ASSERT_EQ(pipeline->retry_buffer_size(), 2u);

    // Still open: nothing leaves the buffer
    EXPECT_EQ(pipeline->drain_retry_buffer(), 0u);
    EXPECT_EQ(sink_->calls(), 5u);

    sink_->set_default(nullptr);
    clock_->advance(std::chrono::milliseconds(30000));

    EXPECT_EQ(pipeline->drain_retry_buffer(), 2u);
    EXPECT_EQ(pipeline->retry_buffer_size(), 0u);
    EXPECT_EQ(pipeline->circuit_breaker().state(), CircuitBreaker::State::CLOSED);

    // Failed sends never reach the delivered record
    auto delivered = sink_->delivered();
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0].size(), 2u);
    EXPECT_EQ(delivered[1].size(), 3u);
}

TEST_F(PipelineTest, TestFailedTrialKeepsBatchBuffered) {
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    for (int i = 0; i < 5; ++i) {
        pipeline->deliver(make_batch(1));
    }
    pipeline->deliver(make_batch(1));

    clock_->advance(std::chrono::milliseconds(30000));
    EXPECT_EQ(pipeline->drain_retry_buffer(), 0u);
    EXPECT_EQ(sink_->calls(), 6u);
    EXPECT_EQ(pipeline->retry_buffer_size(), 1u);
    EXPECT_EQ(pipeline->circuit_breaker().state(), CircuitBreaker::State::OPEN);
}

TEST_F(PipelineTest, TestTransientErrorsAreRetried) {
    config_.set_max_retries(2);
    sink_->push(ScriptedSink::fail_transient());
    sink_->push(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline->deliver(make_batch(2)), DeliveryOutcome::SUCCESS);
    EXPECT_EQ(sink_->calls(), 3u);

    auto stats = pipeline->get_stats();
    EXPECT_EQ(stats.retries, 2u);
    EXPECT_EQ(stats.failures, 2u);
    EXPECT_EQ(stats.successes, 1u);
    EXPECT_EQ(stats.dropped_batches, 0u);
}

TEST_F(PipelineTest, TestRetriesExhaustedDropsAndReports) {
    config_.set_max_retries(2);
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline->deliver(make_batch(4)), DeliveryOutcome::FAILURE);
    EXPECT_EQ(sink_->calls(), 3u);
    EXPECT_EQ(pipeline->get_stats().dropped_batches, 1u);

    ASSERT_EQ(reports_.size(), 1u);
    const auto& report = std::get<Event>(reports_[0]);
    EXPECT_EQ(report.level, LogLevel::ERROR);
    EXPECT_EQ(report.component, Components::TELEMETRY);
    EXPECT_EQ(report.event_type, EventTypes::DELIVERY_FAILURE);
    EXPECT_EQ(std::get<int64_t>(report.data.at("item_count")), 4);
    EXPECT_EQ(std::get<int64_t>(report.data.at("attempts")), 3);
    EXPECT_EQ(std::get<std::string>(report.data.at("sink")), "scripted");
    EXPECT_EQ(std::get<std::string>(report.data.at("service_name")), "pipeline-test");
    EXPECT_EQ(std::get<int64_t>(report.data.at("error_code")), static_cast<int64_t>(ErrorCode::RETRY_EXHAUSTED));
    EXPECT_EQ(std::get<std::string>(report.data.at("error")), "Retry attempts exhausted");
}

TEST_F(PipelineTest, TestPermanentErrorIsNotRetried) {
    config_.set_max_retries(3);
    sink_->set_default(ScriptedSink::fail_permanent());
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline->deliver(make_batch(1)), DeliveryOutcome::FAILURE);
    EXPECT_EQ(sink_->calls(), 1u);
    EXPECT_EQ(pipeline->get_stats().retries, 0u);
    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(std::get<Event>(reports_[0]).data.at("error_code")),
              static_cast<int64_t>(ErrorCode::AUTHENTICATION_FAILED));
}

TEST_F(PipelineTest, TestSelfReportBatchIsNotReportedAgain) {
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    Event report = make_event("earlier failure", LogLevel::ERROR);
    report.component = Components::TELEMETRY;
    report.event_type = EventTypes::DELIVERY_FAILURE;
    Batch batch;
    batch.add_item(report);

    EXPECT_EQ(pipeline->deliver(std::move(batch)), DeliveryOutcome::FAILURE);
    EXPECT_TRUE(reports_.empty());
    EXPECT_EQ(pipeline->get_stats().dropped_batches, 1u);
}

TEST_F(PipelineTest, TestRetryBufferDropsOldest) {
    config_.set_failure_threshold(1).set_retry_buffer_size(2);
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    pipeline->deliver(make_batch(1));
    ASSERT_EQ(pipeline->circuit_breaker().state(), CircuitBreaker::State::OPEN);

    pipeline->deliver(make_batch(1));
    pipeline->deliver(make_batch(2));
    pipeline->deliver(make_batch(3));

    EXPECT_EQ(pipeline->retry_buffer_size(), 2u);
    EXPECT_EQ(pipeline->get_stats().retry_buffer_drops, 1u);

    sink_->set_default(nullptr);
    clock_->advance(std::chrono::milliseconds(30000));
    pipeline->drain_retry_buffer();

    auto delivered = sink_->delivered();
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0].size(), 2u);
    EXPECT_EQ(delivered[1].size(), 3u);
}

TEST_F(PipelineTest, TestLongOutageRoutesToLocalSink) {
    config_.set_failure_threshold(1).set_fallback_after(std::chrono::milliseconds(1000));
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    pipeline->deliver(make_batch(1));
    EXPECT_EQ(pipeline->local_sink().size(), 0u);

    clock_->advance(std::chrono::milliseconds(1500));
    EXPECT_EQ(pipeline->deliver(make_batch(3)), DeliveryOutcome::FAILURE);

    EXPECT_EQ(pipeline->retry_buffer_size(), 0u);
    EXPECT_EQ(pipeline->local_sink().size(), 3u);
    EXPECT_EQ(pipeline->get_stats().fallback_batches, 1u);
}

TEST_F(PipelineTest, TestLongOutageMovesBufferedBatchesLocally) {
    config_.set_failure_threshold(1).set_fallback_after(std::chrono::milliseconds(1000));
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();

    pipeline->deliver(make_batch(1));
    pipeline->deliver(make_batch(2));
    pipeline->deliver(make_batch(2));
    ASSERT_EQ(pipeline->retry_buffer_size(), 2u);

    clock_->advance(std::chrono::milliseconds(1500));
    EXPECT_EQ(pipeline->drain_retry_buffer(), 2u);
    EXPECT_EQ(pipeline->retry_buffer_size(), 0u);
    EXPECT_EQ(pipeline->local_sink().size(), 4u);
}

TEST_F(PipelineTest, TestPartialOutcome) {
    sink_->push(ScriptedSink::partial(1));
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline->deliver(make_batch(3)), DeliveryOutcome::PARTIAL);
    EXPECT_EQ(pipeline->circuit_breaker().state(), CircuitBreaker::State::CLOSED);
    EXPECT_EQ(pipeline->get_stats().partials, 1u);
    EXPECT_TRUE(reports_.empty());
}

TEST_F(PipelineTest, TestSinkFailureOutcomeCountsAsTransient) {
    config_.set_max_retries(1);
    sink_->push([](const Batch&) { return SendResult{DeliveryOutcome::FAILURE, 0, 0, "backend busy"}; });
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline->deliver(make_batch(1)), DeliveryOutcome::SUCCESS);
    EXPECT_EQ(sink_->calls(), 2u);
}

TEST_F(PipelineTest, TestNoRemoteUsesLocalSink) {
    auto pipeline = make_pipeline(nullptr);
    EXPECT_FALSE(pipeline->has_remote_sink());

    EXPECT_EQ(pipeline->deliver(make_batch(2)), DeliveryOutcome::SUCCESS);
    EXPECT_EQ(pipeline->local_sink().events().size(), 2u);
    EXPECT_EQ(pipeline->drain_retry_buffer(), 0u);
}

TEST_F(PipelineTest, TestCancelStopsBackoff) {
    config_.set_max_retries(5).set_retry_backoff(std::chrono::milliseconds(60000), 2.0,
                                                  std::chrono::milliseconds(60000));
    sink_->set_default(ScriptedSink::fail_transient());
    auto pipeline = make_pipeline();
    pipeline->cancel();

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(pipeline->deliver(make_batch(1)), DeliveryOutcome::FAILURE);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(sink_->calls(), 1u);
    EXPECT_TRUE(pipeline->is_cancelled());

    ASSERT_EQ(reports_.size(), 1u);
    const auto& report = std::get<Event>(reports_[0]);
    EXPECT_EQ(std::get<int64_t>(report.data.at("error_code")), static_cast<int64_t>(ErrorCode::OPERATION_CANCELLED));
    EXPECT_EQ(std::get<std::string>(report.data.at("reason")).rfind("delivery cancelled during backoff", 0), 0u);
}

TEST_F(PipelineTest, TestCloseClosesRemote) {
    auto pipeline = make_pipeline();
    pipeline->close();
    EXPECT_TRUE(sink_->closed());
}

TEST_F(PipelineTest, TestShutdownWakesBackoffAndKeepsReport) {
    config_.set_max_retries(3)
           .set_retry_backoff(std::chrono::milliseconds(2000), 2.0, std::chrono::milliseconds(2000))
           .set_drain_timeout(std::chrono::milliseconds(5000));
    sink_->set_default(ScriptedSink::fail_transient());

    DeliveryPipeline pipeline(config_, sink_, nullptr, clock_);
    BatchManager manager(config_.batch(), [&pipeline](Batch batch) { pipeline.deliver(std::move(batch)); });
    pipeline.set_enqueue_callback([&manager](TelemetryItem item) { return manager.enqueue(std::move(item)); });
    manager.set_cancel_callback([&pipeline]() { pipeline.cancel(); });
    manager.start();

    manager.enqueue(make_event("doomed"));
    manager.trigger_flush();
    ASSERT_TRUE(testing_support::wait_until([this]() { return sink_->calls() >= 1; }));

    auto started = std::chrono::steady_clock::now();
    manager.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    EXPECT_TRUE(pipeline.is_cancelled());

    // The failed batch and then its delivery failure report each got one send
    EXPECT_EQ(sink_->calls(), 2u);
    auto stats = pipeline.get_stats();
    EXPECT_EQ(stats.self_reports, 1u);
    EXPECT_EQ(stats.dropped_batches, 2u);
    EXPECT_EQ(manager.get_stats().dropped, 0u);
}
