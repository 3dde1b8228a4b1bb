// include/telemetry/sampler.hpp
// Purpose: Admission gate that thins out high-volume low-severity events
// WARNING and above are always admitted; the random draw only applies below that

#pragma once

#include "types.hpp"
#include <atomic>
#include <cstdint>

namespace telemetry {

class Sampler {
public:
    // Rate is clamped to [0, 1]
    explicit Sampler(double sample_rate = 1.0);

    bool admit(LogLevel level);
    bool admit(const Event& event) { return admit(event.level); }

    double sample_rate() const { return rate_.load(); }
    void set_sample_rate(double sample_rate);

    struct Snapshot {
        uint64_t admitted = 0;
        uint64_t sampled_out = 0;
    };

    Snapshot snapshot() const {
        Snapshot s;
        s.admitted = admitted_.load();
        s.sampled_out = sampled_out_.load();
        return s;
    }

private:
    std::atomic<double> rate_;
    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> sampled_out_{0};
};

} // namespace telemetry
