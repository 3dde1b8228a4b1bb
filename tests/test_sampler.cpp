// tests/test_sampler.cpp
// Tests for severity-aware sampling

#include <gtest/gtest.h>
#include "telemetry/sampler.hpp"

using namespace telemetry;

class SamplerTest : public ::testing::Test {
protected:
    static constexpr int kTrials = 10000;
};

TEST_F(SamplerTest, TestRateZeroDropsLowSeverityOnly) {
    Sampler sampler(0.0);

    int debug_admitted = 0;
    int info_admitted = 0;
    int error_admitted = 0;
    int critical_admitted = 0;
    for (int i = 0; i < kTrials; ++i) {
        debug_admitted += sampler.admit(LogLevel::DEBUG) ? 1 : 0;
        info_admitted += sampler.admit(LogLevel::INFO) ? 1 : 0;
        error_admitted += sampler.admit(LogLevel::ERROR) ? 1 : 0;
        critical_admitted += sampler.admit(LogLevel::CRITICAL) ? 1 : 0;
    }

    EXPECT_EQ(debug_admitted, 0);
    EXPECT_EQ(info_admitted, 0);
    EXPECT_EQ(error_admitted, kTrials);
    EXPECT_EQ(critical_admitted, kTrials);

    auto snapshot = sampler.snapshot();
    EXPECT_EQ(snapshot.admitted, 2u * kTrials);
    EXPECT_EQ(snapshot.sampled_out, 2u * kTrials);
}

TEST_F(SamplerTest, TestRateOneAdmitsEverything) {
    Sampler sampler(1.0);
    for (int i = 0; i < kTrials; ++i) {
        ASSERT_TRUE(sampler.admit(LogLevel::DEBUG));
    }
    EXPECT_EQ(sampler.snapshot().sampled_out, 0u);
}

TEST_F(SamplerTest, TestWarningBypassesDraw) {
    Sampler sampler(0.0);
    Event event;
    event.level = LogLevel::WARNING;
    EXPECT_TRUE(sampler.admit(event));
    event.level = LogLevel::INFO;
    EXPECT_FALSE(sampler.admit(event));
}

TEST_F(SamplerTest, TestFractionalRateIsApproximate) {
    Sampler sampler(0.25);
    int admitted = 0;
    for (int i = 0; i < kTrials; ++i) {
        admitted += sampler.admit(LogLevel::INFO) ? 1 : 0;
    }
    // Binomial(10000, 0.25) stays well inside this band
    EXPECT_GT(admitted, 2000);
    EXPECT_LT(admitted, 3000);
}

TEST_F(SamplerTest, TestRateIsClamped) {
    Sampler high(4.0);
    EXPECT_DOUBLE_EQ(high.sample_rate(), 1.0);

    Sampler low(-1.0);
    EXPECT_DOUBLE_EQ(low.sample_rate(), 0.0);

    low.set_sample_rate(0.5);
    EXPECT_DOUBLE_EQ(low.sample_rate(), 0.5);
}
