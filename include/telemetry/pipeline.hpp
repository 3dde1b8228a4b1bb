// include/telemetry/pipeline.hpp
// Purpose: Reliable delivery of batches through the circuit breaker
// Retries transient failures with backoff, buffers while the circuit is open and self-reports drops

#pragma once

#include "batch.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "local_sink.hpp"
#include "sink.hpp"
#include <atomic>
#include <functional>
#include <memory>

namespace telemetry {

// Pipeline statistics
struct PipelineStats {
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> successes{0};
    std::atomic<uint64_t> partials{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> short_circuited{0};
    std::atomic<uint64_t> dropped_batches{0};
    std::atomic<uint64_t> fallback_batches{0};
    std::atomic<uint64_t> retry_buffer_drops{0};
    std::atomic<uint64_t> self_reports{0};

    void reset();

    struct Snapshot {
        uint64_t attempts = 0;
        uint64_t successes = 0;
        uint64_t partials = 0;
        uint64_t failures = 0;
        uint64_t retries = 0;
        uint64_t short_circuited = 0;
        uint64_t dropped_batches = 0;
        uint64_t fallback_batches = 0;
        uint64_t retry_buffer_drops = 0;
        uint64_t self_reports = 0;

        double get_success_rate() const {
            uint64_t total = successes + partials + failures;
            return total > 0 ? static_cast<double>(successes + partials) / total : 1.0;
        }
    };

    Snapshot snapshot() const {
        Snapshot s;
        s.attempts = attempts.load();
        s.successes = successes.load();
        s.partials = partials.load();
        s.failures = failures.load();
        s.retries = retries.load();
        s.short_circuited = short_circuited.load();
        s.dropped_batches = dropped_batches.load();
        s.fallback_batches = fallback_batches.load();
        s.retry_buffer_drops = retry_buffer_drops.load();
        s.self_reports = self_reports.load();
        return s;
    }
};

class DeliveryPipeline {
public:
    // Receives self-reported delivery failures; normally BatchManager::enqueue
    using EnqueueCallback = std::function<bool(TelemetryItem)>;

    // remote may be null, in which case every batch goes to the local sink
    DeliveryPipeline(const Config& config,
                     std::shared_ptr<TelemetrySink> remote,
                     std::shared_ptr<LocalSink> local,
                     std::shared_ptr<Clock> clock = SystemClock::instance());
    ~DeliveryPipeline();

    // Non-copyable, movable
    DeliveryPipeline(const DeliveryPipeline&) = delete;
    DeliveryPipeline& operator=(const DeliveryPipeline&) = delete;
    DeliveryPipeline(DeliveryPipeline&&) noexcept;
    DeliveryPipeline& operator=(DeliveryPipeline&&) noexcept;

    void set_enqueue_callback(EnqueueCallback callback);

    // Never throws
    DeliveryOutcome deliver(Batch batch);

    // Redelivers buffered batches while the circuit allows. Returns how many left the buffer.
    size_t drain_retry_buffer();

    // Wakes any backoff sleep; later failures give up instead of retrying
    void cancel();
    bool is_cancelled() const;

    bool has_remote_sink() const;
    size_t retry_buffer_size() const;

    CircuitBreaker& circuit_breaker();
    const CircuitBreaker& circuit_breaker() const;
    LocalSink& local_sink();

    // Closes the sinks
    void close();

    PipelineStats::Snapshot get_stats() const;
    void reset_stats();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace telemetry
