// src/sampler.cpp
// Severity-aware probabilistic sampling

#include "telemetry/sampler.hpp"
#include <algorithm>
#include <random>

namespace telemetry {

namespace {

double clamp_rate(double rate) {
    if (!(rate >= 0.0)) return 0.0;
    return std::min(rate, 1.0);
}

double uniform_draw() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    static thread_local std::uniform_real_distribution<double> dis(0.0, 1.0);
    return dis(gen);
}

} // namespace

Sampler::Sampler(double sample_rate) : rate_(clamp_rate(sample_rate)) {}

void Sampler::set_sample_rate(double sample_rate) {
    rate_.store(clamp_rate(sample_rate));
}

bool Sampler::admit(LogLevel level) {
    bool keep;
    if (level >= LogLevel::WARNING) {
        keep = true;
    } else {
        double rate = rate_.load();
        if (rate >= 1.0) {
            keep = true;
        } else if (rate <= 0.0) {
            keep = false;
        } else {
            keep = uniform_draw() < rate;
        }
    }

    if (keep) {
        admitted_++;
    } else {
        sampled_out_++;
    }
    return keep;
}

} // namespace telemetry
