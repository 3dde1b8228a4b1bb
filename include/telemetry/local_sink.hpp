// include/telemetry/local_sink.hpp
// Purpose: In-process fallback sink
// Keeps the most recent items in a bounded ring buffer, optionally echoing them to the console

#pragma once

#include "sink.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

namespace telemetry {

class LocalSink : public TelemetrySink {
public:
    explicit LocalSink(size_t capacity = 1000, bool echo_to_console = false);

    // Never throws
    SendResult send(const Batch& batch) override;
    std::string name() const override { return "local"; }

    std::vector<TelemetryItem> items() const;
    std::vector<Event> events() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

    // Items pushed out of the ring buffer by newer ones
    uint64_t overwritten() const { return overwritten_.load(); }
    uint64_t total_received() const { return total_received_.load(); }

private:
    const size_t capacity_;
    const bool echo_to_console_;
    mutable std::mutex mutex_;
    std::deque<TelemetryItem> ring_;
    std::atomic<uint64_t> overwritten_{0};
    std::atomic<uint64_t> total_received_{0};

    void echo(const TelemetryItem& item) const;
};

} // namespace telemetry
