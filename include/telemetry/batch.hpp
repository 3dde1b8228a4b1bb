// include/telemetry/batch.hpp
// Purpose: Batching and flush engine for telemetry items
// Accumulates items, swaps full or aged batches out and hands them to delivery workers

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace telemetry {

// Ordered group of items delivered together. Ownership moves with the batch.
class Batch {
public:
    explicit Batch(BatchId batch_id = Utils::generate_batch_id(),
                   Timestamp created_at = Utils::now_milliseconds());
    ~Batch() = default;

    // Non-copyable, movable
    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;
    Batch(Batch&&) noexcept = default;
    Batch& operator=(Batch&&) noexcept = default;

    void add_item(TelemetryItem item);
    void drop_oldest();

    BatchId id() const { return batch_id_; }
    Timestamp created_at() const { return created_at_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<TelemetryItem>& items() const { return items_; }

    // True when every item is a delivery-failure event raised by the library itself
    bool only_self_reports() const;

private:
    BatchId batch_id_;
    Timestamp created_at_;
    std::vector<TelemetryItem> items_;
};

// Self-reported delivery failures carry this component and event type
bool is_self_report(const TelemetryItem& item);

enum class FlushTrigger : uint8_t {
    SIZE = 0,
    INTERVAL = 1,
    MANUAL = 2,
    SHUTDOWN = 3
};

// Batch statistics
struct BatchStats {
    std::atomic<uint64_t> enqueued{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> batches_flushed{0};
    std::atomic<uint64_t> items_flushed{0};
    std::atomic<uint64_t> size_flushes{0};
    std::atomic<uint64_t> interval_flushes{0};
    std::atomic<uint64_t> manual_flushes{0};
    std::atomic<uint64_t> batches_delivered{0};

    void reset();

    // Create a copyable snapshot of the stats
    struct Snapshot {
        uint64_t enqueued = 0;
        uint64_t dropped = 0;
        uint64_t batches_flushed = 0;
        uint64_t items_flushed = 0;
        uint64_t size_flushes = 0;
        uint64_t interval_flushes = 0;
        uint64_t manual_flushes = 0;
        uint64_t batches_delivered = 0;
    };

    Snapshot snapshot() const {
        Snapshot s;
        s.enqueued = enqueued.load();
        s.dropped = dropped.load();
        s.batches_flushed = batches_flushed.load();
        s.items_flushed = items_flushed.load();
        s.size_flushes = size_flushes.load();
        s.interval_flushes = interval_flushes.load();
        s.manual_flushes = manual_flushes.load();
        s.batches_delivered = batches_delivered.load();
        return s;
    }
};

// Collects items from many producers and feeds ready batches to delivery workers
class BatchManager {
public:
    // Runs on a worker thread, once per ready batch
    using DeliverCallback = std::function<void(Batch)>;
    // Runs on a worker thread on every wake-up, before any ready batch is taken
    using WakeCallback = std::function<void()>;
    // Runs once at the start of shutdown, before the final drain
    using CancelCallback = std::function<void()>;

    BatchManager(const BatchConfig& config, DeliverCallback deliver);
    ~BatchManager();

    // Non-copyable, movable
    BatchManager(const BatchManager&) = delete;
    BatchManager& operator=(const BatchManager&) = delete;
    BatchManager(BatchManager&&) noexcept;
    BatchManager& operator=(BatchManager&&) noexcept;

    void set_wake_callback(WakeCallback callback);
    void set_cancel_callback(CancelCallback callback);

    // Lifecycle
    void start();
    void shutdown();
    bool is_running() const;

    // Never blocks on I/O and never throws. Returns false after shutdown.
    // A full queue drops its oldest pending item to make room.
    bool enqueue(TelemetryItem item) noexcept;

    // Swaps the current batch out without waiting for delivery
    void trigger_flush();

    // Swaps and waits until every ready batch has been delivered. Returns whether it drained.
    bool flush(std::chrono::milliseconds timeout);

    // Items in the current batch plus those in batches awaiting delivery
    size_t pending_count() const;
    size_t ready_batch_count() const;
    size_t in_flight_count() const;

    const BatchConfig& get_config() const;

    BatchStats::Snapshot get_stats() const;
    void reset_stats();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

std::string flush_trigger_to_string(FlushTrigger trigger);

} // namespace telemetry
