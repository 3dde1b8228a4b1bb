// src/pipeline.cpp
// Implementation of the delivery pipeline

#include "telemetry/pipeline.hpp"
#include "telemetry/errors.hpp"
#include "telemetry/logging.hpp"
#include "telemetry/utils.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

namespace telemetry {

void PipelineStats::reset() {
    attempts = 0;
    successes = 0;
    partials = 0;
    failures = 0;
    retries = 0;
    short_circuited = 0;
    dropped_batches = 0;
    fallback_batches = 0;
    retry_buffer_drops = 0;
    self_reports = 0;
}

// DeliveryPipeline implementation
//
// Remote delivery runs under the circuit breaker. A batch the circuit will not
// take waits in retry_buffer_ (bounded, oldest dropped) until a worker wake-up
// drains it, or goes to the local sink once the outage passes fallback_after.
class DeliveryPipeline::Impl {
public:
    Impl(const Config& config, std::shared_ptr<TelemetrySink> remote,
         std::shared_ptr<LocalSink> local, std::shared_ptr<Clock> clock)
        : delivery_(config.delivery()), fallback_(config.fallback()),
          service_name_(config.service_name()),
          remote_(std::move(remote)),
          local_(local ? std::move(local)
                       : std::make_shared<LocalSink>(config.fallback().capacity,
                                                     config.fallback().echo_to_console)),
          clock_(clock ? std::move(clock) : SystemClock::instance()),
          breaker_(delivery_.failure_threshold, delivery_.recovery_timeout, clock_) {}

    void set_enqueue_callback(EnqueueCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        enqueue_ = std::move(callback);
    }

    DeliveryOutcome deliver(Batch batch) {
        if (batch.empty()) {
            return DeliveryOutcome::SUCCESS;
        }

        // No backend configured: the local sink is the destination, not a fallback
        if (!remote_) {
            return route_local(batch);
        }

        switch (attempt(batch, false)) {
            case Disposition::DELIVERED:
                return DeliveryOutcome::SUCCESS;
            case Disposition::PARTIAL:
                return DeliveryOutcome::PARTIAL;
            case Disposition::SHORT_CIRCUITED:
                stats_.short_circuited++;
                if (outage_exceeds_fallback()) {
                    route_local(batch);
                } else {
                    push_retry_buffer(std::move(batch), false);
                }
                return DeliveryOutcome::FAILURE;
            case Disposition::REQUEUED:
                push_retry_buffer(std::move(batch), false);
                return DeliveryOutcome::FAILURE;
            case Disposition::GAVE_UP:
            default:
                return DeliveryOutcome::FAILURE;
        }
    }

    size_t drain_retry_buffer() {
        if (!remote_) {
            return 0;
        }

        std::unique_lock<std::mutex> drain_lock(drain_mutex_, std::try_to_lock);
        if (!drain_lock.owns_lock()) {
            return 0;  // another worker is draining
        }

        size_t drained = 0;
        for (;;) {
            std::optional<Batch> batch;
            {
                std::lock_guard<std::mutex> lock(buffer_mutex_);
                if (retry_buffer_.empty()) {
                    break;
                }
                batch.emplace(std::move(retry_buffer_.front()));
                retry_buffer_.pop_front();
            }

            // Buffered batches go back to the front so order survives an outage
            Disposition result = attempt(*batch, true);
            if (result == Disposition::SHORT_CIRCUITED) {
                if (outage_exceeds_fallback()) {
                    route_local(*batch);
                    drained += 1 + move_buffer_to_local();
                } else {
                    push_retry_buffer(std::move(*batch), true);
                }
                break;
            }
            if (result == Disposition::REQUEUED) {
                push_retry_buffer(std::move(*batch), true);
                break;
            }
            drained++;
        }

        if (drained > 0) {
            Logging::logger()->debug("Retry buffer released {} batch(es)", drained);
        }
        return drained;
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(cancel_mutex_);
            cancelled_ = true;
        }
        cancel_cv_.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        return cancelled_;
    }

    bool has_remote_sink() const { return remote_ != nullptr; }

    size_t retry_buffer_size() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return retry_buffer_.size();
    }

    CircuitBreaker& circuit_breaker() { return breaker_; }
    LocalSink& local_sink() { return *local_; }

    // Cancels first so no backoff sleep outlives the sinks
    void close() {
        cancel();
        if (remote_) {
            try {
                remote_->close();
            } catch (const std::exception& e) {
                Logging::logger()->warn("Closing sink {} failed: {}", remote_->name(), e.what());
            }
        }
        local_->close();
    }

    PipelineStats::Snapshot get_stats() const { return stats_.snapshot(); }
    void reset_stats() { stats_.reset(); }

private:
    enum class Disposition {
        DELIVERED,
        PARTIAL,
        SHORT_CIRCUITED,  // circuit refused the first attempt, batch untouched
        REQUEUED,         // circuit opened during retries, batch untouched
        GAVE_UP           // batch consumed by the local sink or dropped
    };

    // Sends with retries. The batch is only consumed on DELIVERED, PARTIAL and GAVE_UP.
    // A buffered batch goes back to the buffer when its failure leaves the circuit open.
    Disposition attempt(Batch& batch, bool buffered) {
        if (!breaker_.allow_request()) {
            return Disposition::SHORT_CIRCUITED;
        }

        Utils::ExponentialBackoff backoff(delivery_.retry_base_delay,
                                          delivery_.backoff_multiplier,
                                          delivery_.max_retry_delay);
        std::string last_error;
        int attempts_made = 0;
        ErrorCode give_up_code = ErrorCode::RETRY_EXHAUSTED;

        for (int attempt = 0; ; ++attempt) {
            if (attempt > 0 && !breaker_.allow_request()) {
                return Disposition::REQUEUED;
            }

            stats_.attempts++;
            attempts_made++;
            try {
                SendResult result = remote_->send(batch);
                if (result.outcome == DeliveryOutcome::FAILURE) {
                    throw Errors::send_failed(result.detail.empty() ? "sink reported failure" : result.detail);
                }

                breaker_.record_success();
                if (result.outcome == DeliveryOutcome::PARTIAL) {
                    stats_.partials++;
                    Logging::logger()->warn("Batch {} partially accepted by {}: {} accepted, {} rejected{}{}",
                                            batch.id(), remote_->name(), result.accepted, result.rejected,
                                            result.detail.empty() ? "" : ": ", result.detail);
                    return Disposition::PARTIAL;
                }
                stats_.successes++;
                Logging::logger()->debug("Batch {} ({} items) {} via {}", batch.id(), batch.size(),
                                         Utils::delivery_outcome_to_string(result.outcome), remote_->name());
                return Disposition::DELIVERED;
            } catch (const Error& e) {
                breaker_.record_failure();
                stats_.failures++;
                last_error = e.what();

                if (!is_retryable(e)) {
                    Logging::logger()->error("Permanent delivery error for batch {} ({}): {}",
                                             batch.id(), e.category(), e.what());
                    give_up(batch, last_error, attempts_made, e.code());
                    return Disposition::GAVE_UP;
                }
                Logging::logger()->debug("Transient delivery error for batch {}: {}", batch.id(), e.what());
            } catch (const std::exception& e) {
                breaker_.record_failure();
                stats_.failures++;
                last_error = e.what();
                Logging::logger()->debug("Delivery of batch {} raised: {}", batch.id(), e.what());
            }

            bool circuit_open = breaker_.state() == CircuitBreaker::State::OPEN;
            if (buffered && circuit_open) {
                return Disposition::REQUEUED;
            }
            if (attempt >= delivery_.max_retries) {
                break;
            }
            if (circuit_open) {
                Logging::logger()->warn("Circuit opened while retrying batch {}, buffering it", batch.id());
                return Disposition::REQUEUED;
            }
            if (!sleep_backoff(backoff.next_delay())) {
                last_error = "delivery cancelled during backoff: " + last_error;
                give_up_code = ErrorCode::OPERATION_CANCELLED;
                break;
            }
            stats_.retries++;
        }

        give_up(batch, last_error, attempts_made, give_up_code);
        return Disposition::GAVE_UP;
    }

    // Returns false when cancelled
    bool sleep_backoff(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(cancel_mutex_);
        return !cancel_cv_.wait_for(lock, delay, [this]() { return cancelled_; });
    }

    bool outage_exceeds_fallback() const {
        return breaker_.state() != CircuitBreaker::State::CLOSED &&
               breaker_.outage_duration() >= fallback_.fallback_after;
    }

    DeliveryOutcome route_local(const Batch& batch) {
        stats_.fallback_batches++;
        SendResult result = local_->send(batch);
        return remote_ ? DeliveryOutcome::FAILURE : result.outcome;
    }

    size_t move_buffer_to_local() {
        std::deque<Batch> pending;
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            pending.swap(retry_buffer_);
        }
        for (const auto& batch : pending) {
            route_local(batch);
        }
        return pending.size();
    }

    void push_retry_buffer(Batch batch, bool at_front) {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        size_t capacity = delivery_.retry_buffer_size;
        if (capacity == 0) {
            stats_.retry_buffer_drops++;
            stats_.dropped_batches++;
            return;
        }

        if (at_front) {
            retry_buffer_.push_front(std::move(batch));
        } else {
            retry_buffer_.push_back(std::move(batch));
        }
        while (retry_buffer_.size() > capacity) {
            Logging::logger()->warn("Retry buffer full, dropping oldest batch {} ({} items)",
                                    retry_buffer_.front().id(), retry_buffer_.front().size());
            retry_buffer_.pop_front();
            stats_.retry_buffer_drops++;
            stats_.dropped_batches++;
        }
    }

    // code says why delivery stopped: the permanent error, RETRY_EXHAUSTED or OPERATION_CANCELLED
    void give_up(const Batch& batch, const std::string& reason, int attempts_made, ErrorCode code) {
        if (outage_exceeds_fallback()) {
            route_local(batch);
            return;
        }

        stats_.dropped_batches++;

        if (batch.only_self_reports()) {
            Logging::logger()->error("Dropped batch {} of {} delivery failure report(s): {}",
                                     batch.id(), batch.size(), reason);
            return;
        }

        std::error_code error = make_error_code(code);
        Logging::logger()->error("Dropped batch {} ({} items) after {} attempt(s), {}: {}",
                                 batch.id(), batch.size(), attempts_made, error.message(), reason);

        Event report;
        report.event_id = Utils::generate_event_id();
        report.timestamp = clock_->system_now_ms();
        report.level = LogLevel::ERROR;
        report.component = Components::TELEMETRY;
        report.event_type = EventTypes::DELIVERY_FAILURE;
        report.message = "Failed to deliver telemetry batch of " + std::to_string(batch.size()) + " item(s)";
        report.data["batch_id"] = std::to_string(batch.id());
        report.data["item_count"] = static_cast<int64_t>(batch.size());
        report.data["attempts"] = static_cast<int64_t>(attempts_made);
        report.data["reason"] = reason;
        report.data["error_code"] = static_cast<int64_t>(error.value());
        report.data["error"] = error.message();
        report.data["sink"] = remote_ ? remote_->name() : local_->name();
        report.data["service_name"] = service_name_;

        EnqueueCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = enqueue_;
        }
        if (callback && callback(std::move(report))) {
            stats_.self_reports++;
        }
    }

    DeliveryConfig delivery_;
    FallbackConfig fallback_;
    std::string service_name_;
    std::shared_ptr<TelemetrySink> remote_;
    std::shared_ptr<LocalSink> local_;
    std::shared_ptr<Clock> clock_;
    CircuitBreaker breaker_;

    std::mutex callback_mutex_;
    EnqueueCallback enqueue_;

    mutable std::mutex buffer_mutex_;
    std::deque<Batch> retry_buffer_;
    std::mutex drain_mutex_;  // one drainer at a time; others skip

    mutable std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
    bool cancelled_ = false;

    PipelineStats stats_;
};

DeliveryPipeline::DeliveryPipeline(const Config& config,
                                   std::shared_ptr<TelemetrySink> remote,
                                   std::shared_ptr<LocalSink> local,
                                   std::shared_ptr<Clock> clock)
    : pimpl_(std::make_unique<Impl>(config, std::move(remote), std::move(local), std::move(clock))) {}

DeliveryPipeline::~DeliveryPipeline() = default;

DeliveryPipeline::DeliveryPipeline(DeliveryPipeline&&) noexcept = default;
DeliveryPipeline& DeliveryPipeline::operator=(DeliveryPipeline&&) noexcept = default;

void DeliveryPipeline::set_enqueue_callback(EnqueueCallback callback) {
    pimpl_->set_enqueue_callback(std::move(callback));
}

DeliveryOutcome DeliveryPipeline::deliver(Batch batch) {
    try {
        return pimpl_->deliver(std::move(batch));
    } catch (const std::exception& e) {
        Logging::logger()->error("Unexpected delivery failure: {}", e.what());
        return DeliveryOutcome::FAILURE;
    }
}

size_t DeliveryPipeline::drain_retry_buffer() {
    try {
        return pimpl_->drain_retry_buffer();
    } catch (const std::exception& e) {
        Logging::logger()->error("Retry buffer drain failed: {}", e.what());
        return 0;
    }
}

void DeliveryPipeline::cancel() {
    pimpl_->cancel();
}

bool DeliveryPipeline::is_cancelled() const {
    return pimpl_->is_cancelled();
}

bool DeliveryPipeline::has_remote_sink() const {
    return pimpl_->has_remote_sink();
}

size_t DeliveryPipeline::retry_buffer_size() const {
    return pimpl_->retry_buffer_size();
}

CircuitBreaker& DeliveryPipeline::circuit_breaker() {
    return pimpl_->circuit_breaker();
}

const CircuitBreaker& DeliveryPipeline::circuit_breaker() const {
    return pimpl_->circuit_breaker();
}

LocalSink& DeliveryPipeline::local_sink() {
    return pimpl_->local_sink();
}

void DeliveryPipeline::close() {
    pimpl_->close();
}

PipelineStats::Snapshot DeliveryPipeline::get_stats() const {
    return pimpl_->get_stats();
}

void DeliveryPipeline::reset_stats() {
    pimpl_->reset_stats();
}

} // namespace telemetry
