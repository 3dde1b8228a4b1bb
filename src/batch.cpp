// src/batch.cpp
// Implementation of the batching and flush engine

#include "telemetry/batch.hpp"
#include "telemetry/logging.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace telemetry {

// Batch implementation
Batch::Batch(BatchId batch_id, Timestamp created_at)
    : batch_id_(batch_id), created_at_(created_at) {}

void Batch::add_item(TelemetryItem item) {
    items_.push_back(std::move(item));
}

// O(n) but only hit when the queue is full
void Batch::drop_oldest() {
    if (!items_.empty()) {
        items_.erase(items_.begin());
    }
}

// An empty batch has nothing to report on, so it is not "only self-reports"
bool Batch::only_self_reports() const {
    if (items_.empty()) {
        return false;
    }
    return std::all_of(items_.begin(), items_.end(), is_self_report);
}

bool is_self_report(const TelemetryItem& item) {
    const auto* event = std::get_if<Event>(&item);
    return event != nullptr &&
           event->component == Components::TELEMETRY &&
           event->event_type == EventTypes::DELIVERY_FAILURE;
}

// BatchStats implementation
void BatchStats::reset() {
    enqueued = 0;
    dropped = 0;
    batches_flushed = 0;
    items_flushed = 0;
    size_flushes = 0;
    interval_flushes = 0;
    manual_flushes = 0;
    batches_delivered = 0;
}

std::string flush_trigger_to_string(FlushTrigger trigger) {
    switch (trigger) {
        case FlushTrigger::SIZE: return "size";
        case FlushTrigger::INTERVAL: return "interval";
        case FlushTrigger::MANUAL: return "manual";
        case FlushTrigger::SHUTDOWN: return "shutdown";
        default: return "unknown";
    }
}

// BatchManager implementation
//
// Items land in current_ under mutex_. A swap moves current_ to the back of
// ready_, workers pop from the front. pending_items_ counts everything in
// current_ and ready_ but not batches a worker has taken, so the queue bound
// never covers in-flight work.
class BatchManager::Impl {
public:
    Impl(const BatchConfig& config, DeliverCallback deliver)
        : config_(config), deliver_(std::move(deliver)) {
        // Clamped, not validated: a bare BatchConfig never went through Config::validate
        config_.batch_size = std::max<size_t>(config_.batch_size, 1);
        config_.max_queue_size = std::max(config_.max_queue_size, config_.batch_size);
        config_.max_in_flight = std::min<size_t>(std::max<size_t>(config_.max_in_flight, 1), 4);
        config_.flush_interval = std::max(config_.flush_interval, std::chrono::milliseconds(1));
        // Workers wake at least once a second to drive the retry buffer
        wake_period_ = std::min(config_.flush_interval, std::chrono::milliseconds(1000));
        last_swap_ = std::chrono::steady_clock::now();
    }

    ~Impl() {
        shutdown();
    }

    void set_wake_callback(WakeCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_callback_ = std::move(callback);
    }

    void set_cancel_callback(CancelCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_callback_ = std::move(callback);
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || closed_) return;

        running_ = true;
        last_swap_ = std::chrono::steady_clock::now();

        // One timer plus max_in_flight workers; the worker count is the
        // concurrency limit on deliveries
        timer_thread_ = std::thread([this]() {
            flush_timer_thread();
        });

        for (size_t i = 0; i < config_.max_in_flight; ++i) {
            workers_.emplace_back([this]() {
                worker_thread();
            });
        }
    }

    // Shutdown sequence:
    //   1. Close the queue to producers
    //   2. Cancel backoff sleeps so pending retries give up at once
    //   3. Flush and wait up to drain_timeout for in-flight sends
    //   4. Stop the timer and workers, count anything left as dropped
    void shutdown() {
        bool was_running;
        CancelCallback cancel;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            was_running = running_;
            draining_ = was_running;
            cancel = cancel_callback_;
        }

        // Never started: nothing can be in flight, skip straight to cleanup
        if (was_running) {
            if (cancel) {
                cancel();
            }
            if (!drain(config_.drain_timeout)) {
                Logging::logger()->warn("Drain timeout of {}ms elapsed with deliveries outstanding",
                                        config_.drain_timeout.count());
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            draining_ = false;
            stopping_ = true;
            running_ = false;
        }
        timer_cv_.notify_all();
        work_cv_.notify_all();

        if (timer_thread_.joinable()) {
            timer_thread_.join();
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        // Workers are gone; whatever is still queued will never be sent
        std::lock_guard<std::mutex> lock(mutex_);
        size_t abandoned = pending_items_;
        if (abandoned > 0) {
            stats_.dropped += abandoned;
            Logging::logger()->warn("Shutdown abandoned {} undelivered item(s)", abandoned);
        }
        ready_.clear();
        current_ = Batch();
        pending_items_ = 0;
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    bool enqueue(TelemetryItem item) noexcept {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            // Delivery failure reports raised while draining still get delivered
            if (closed_ && !(draining_ && is_self_report(item))) {
                return false;
            }

            // Full queue: newest wins
            if (pending_items_ >= config_.max_queue_size) {
                drop_oldest_locked();
            }

            current_.add_item(std::move(item));
            pending_items_++;
            stats_.enqueued++;

            if (current_.size() >= config_.batch_size) {
                swap_locked(FlushTrigger::SIZE);
                work_cv_.notify_one();
            }
            return true;
        } catch (const std::exception& e) {
            stats_.dropped++;
            Logging::logger()->error("Failed to enqueue telemetry item: {}", e.what());
            return false;
        }
    }

    // Non-blocking; the workers pick the batch up
    void trigger_flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_.empty()) {
            swap_locked(FlushTrigger::MANUAL);
        }
        work_cv_.notify_all();
    }

    bool flush(std::chrono::milliseconds timeout) {
        return flush_and_wait(FlushTrigger::MANUAL, timeout);
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_items_;
    }

    size_t ready_batch_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ready_.size();
    }

    size_t in_flight_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    const BatchConfig& get_config() const { return config_; }

    BatchStats::Snapshot get_stats() const { return stats_.snapshot(); }

    void reset_stats() { stats_.reset(); }

private:
    // Without workers nothing drains, so report the current state instead of waiting
    bool flush_and_wait(FlushTrigger trigger, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!current_.empty()) {
            swap_locked(trigger);
        }
        work_cv_.notify_all();

        if (!running_) {
            return ready_.empty() && in_flight_ == 0;
        }

        return done_cv_.wait_for(lock, timeout, [this]() {
            return ready_.empty() && in_flight_ == 0;
        });
    }

    // Repeats the final flush until the queue is idle, since failed deliveries
    // may enqueue reports while it drains. Returns false on timeout.
    bool drain(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (!current_.empty()) {
                swap_locked(FlushTrigger::SHUTDOWN);
            }
            work_cv_.notify_all();

            bool idle = done_cv_.wait_until(lock, deadline, [this]() {
                return ready_.empty() && in_flight_ == 0;
            });
            if (!idle) {
                return false;
            }
            if (current_.empty()) {
                return true;
            }
        }
    }

    // Moves the current batch to the ready queue. Caller holds mutex_.
    void swap_locked(FlushTrigger trigger) {
        size_t items = current_.size();
        ready_.push_back(std::move(current_));
        current_ = Batch();
        last_swap_ = std::chrono::steady_clock::now();

        stats_.batches_flushed++;
        stats_.items_flushed += items;
        switch (trigger) {
            case FlushTrigger::SIZE: stats_.size_flushes++; break;
            case FlushTrigger::INTERVAL: stats_.interval_flushes++; break;
            case FlushTrigger::MANUAL:
            case FlushTrigger::SHUTDOWN: stats_.manual_flushes++; break;
        }
    }

    // The oldest pending item is at the front of the first ready batch, else the current one
    void drop_oldest_locked() {
        if (!ready_.empty()) {
            ready_.front().drop_oldest();
            if (ready_.front().empty()) {
                ready_.pop_front();
            }
        } else {
            current_.drop_oldest();
        }
        pending_items_--;
        stats_.dropped++;
    }

    // Interval flushes. last_swap_ is reset by every swap, so a size flush
    // pushes the next interval flush back.
    void flush_timer_thread() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            auto deadline = last_swap_ + config_.flush_interval;
            if (timer_cv_.wait_until(lock, deadline, [this]() { return stopping_; })) {
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_swap_ < config_.flush_interval) {
                continue;  // a swap happened while waiting
            }

            if (!current_.empty()) {
                swap_locked(FlushTrigger::INTERVAL);
            } else {
                last_swap_ = now;  // idle tick
            }
            work_cv_.notify_all();
        }
    }

    // Each worker takes one batch at a time. A wake-up with no batch still
    // runs the wake callback so buffered retries make progress while idle.
    void worker_thread() {
        for (;;) {
            std::optional<Batch> batch;
            WakeCallback wake;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait_for(lock, wake_period_, [this]() {
                    return stopping_ || !ready_.empty();
                });
                if (stopping_) {
                    break;
                }

                wake = wake_callback_;
                if (!ready_.empty()) {
                    batch.emplace(std::move(ready_.front()));
                    ready_.pop_front();
                    pending_items_ -= batch->size();
                    in_flight_++;
                }
            }

            if (wake) {
                wake();
            }

            // Delivery runs outside mutex_ so producers never wait on the network
            if (batch) {
                try {
                    deliver_(std::move(*batch));
                } catch (const std::exception& e) {
                    Logging::logger()->error("Batch delivery raised: {}", e.what());
                }
                stats_.batches_delivered++;

                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_--;
            }
            done_cv_.notify_all();  // flush() and drain() re-check idleness
        }
    }

    BatchConfig config_;
    DeliverCallback deliver_;
    WakeCallback wake_callback_;
    CancelCallback cancel_callback_;

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;

    // Queue state, all guarded by mutex_
    Batch current_;
    std::deque<Batch> ready_;
    size_t pending_items_ = 0;
    size_t in_flight_ = 0;
    std::chrono::steady_clock::time_point last_swap_;
    std::chrono::milliseconds wake_period_;

    bool running_ = false;
    bool closed_ = false;      // producers rejected
    bool draining_ = false;    // final drain in progress
    bool stopping_ = false;    // timer and workers exit

    // Threads
    std::thread timer_thread_;
    std::vector<std::thread> workers_;
    BatchStats stats_;
};

// Public interface forwards to Impl

BatchManager::BatchManager(const BatchConfig& config, DeliverCallback deliver)
    : pimpl_(std::make_unique<Impl>(config, std::move(deliver))) {}

BatchManager::~BatchManager() = default;

BatchManager::BatchManager(BatchManager&&) noexcept = default;
BatchManager& BatchManager::operator=(BatchManager&&) noexcept = default;

void BatchManager::set_wake_callback(WakeCallback callback) {
    pimpl_->set_wake_callback(std::move(callback));
}

void BatchManager::set_cancel_callback(CancelCallback callback) {
    pimpl_->set_cancel_callback(std::move(callback));
}

void BatchManager::start() {
    pimpl_->start();
}

void BatchManager::shutdown() {
    pimpl_->shutdown();
}

bool BatchManager::is_running() const {
    return pimpl_->is_running();
}

bool BatchManager::enqueue(TelemetryItem item) noexcept {
    return pimpl_->enqueue(std::move(item));
}

void BatchManager::trigger_flush() {
    pimpl_->trigger_flush();
}

bool BatchManager::flush(std::chrono::milliseconds timeout) {
    return pimpl_->flush(timeout);
}

size_t BatchManager::pending_count() const {
    return pimpl_->pending_count();
}

size_t BatchManager::ready_batch_count() const {
    return pimpl_->ready_batch_count();
}

size_t BatchManager::in_flight_count() const {
    return pimpl_->in_flight_count();
}

const BatchConfig& BatchManager::get_config() const {
    return pimpl_->get_config();
}

BatchStats::Snapshot BatchManager::get_stats() const {
    return pimpl_->get_stats();
}

void BatchManager::reset_stats() {
    pimpl_->reset_stats();
}

} // namespace telemetry
