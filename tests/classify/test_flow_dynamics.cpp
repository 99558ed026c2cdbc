/// @file tests/classify/test_flow_dynamics.cpp
/// @brief Unit tests for the flow-dynamics analyzer.

#include <gtest/gtest.h>
#include "cqhyst/flow_dynamics.hpp"

#include <vector>

using namespace cqhyst;
using namespace cqhyst::classify;

namespace {

const std::vector<double> TIME{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
const FlowLevels LEVELS{.p25 = 2.0, .p50 = 5.0, .p75 = 8.0};

FlowDynamics analyze(const std::vector<double>& q) {
    const auto d = analyze_flow_dynamics(TIME, q, LEVELS);
    EXPECT_TRUE(d.has_value());
    return *d;
}

}  // namespace

TEST(FlowDynamics, PeakAtWindowEndIsAtPeak) {
    const auto d = analyze({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11});
    EXPECT_EQ(d.phase, FlowPhase::AtPeak);
    EXPECT_DOUBLE_EQ(d.days_since_peak, 0.0);
    EXPECT_DOUBLE_EQ(d.days_to_peak, 10.0);
    EXPECT_EQ(d.peak_position, PeakPosition::Late);
    EXPECT_EQ(d.level, stats::Position::High);
}

TEST(FlowDynamics, RecentPeakWithHighFlowIsEarlyDecline) {
    const auto d = analyze({1, 2, 3, 4, 5, 6, 7, 8, 10, 9, 8});
    EXPECT_EQ(d.phase, FlowPhase::EarlyDecline);
    EXPECT_DOUBLE_EQ(d.days_since_peak, 2.0);
}

TEST(FlowDynamics, RecentPeakWithLowFlowIsLateDecline) {
    const auto d = analyze({1, 2, 3, 4, 5, 6, 7, 8, 10, 4, 3});
    EXPECT_EQ(d.phase, FlowPhase::LateDecline);
}

TEST(FlowDynamics, EarlyPeakIsPostPeak) {
    const auto d = analyze({5, 8, 10, 9, 8, 7, 6, 5, 4, 3, 2});
    EXPECT_EQ(d.phase, FlowPhase::PostPeak);
    EXPECT_EQ(d.peak_position, PeakPosition::Early);
    EXPECT_LT(d.q_trend, 0.0);
}

TEST(FlowDynamics, LowEndFlowIsLow) {
    const auto d = analyze({1.5, 2, 3, 4, 5, 6, 5, 4, 3, 2, 1});
    EXPECT_EQ(d.phase, FlowPhase::Low);
    EXPECT_EQ(d.level, stats::Position::Low);
}

TEST(FlowDynamics, UnchangedFlowIsStable) {
    const auto d = analyze({5, 5.5, 6, 7, 8, 9, 8, 7, 6, 5.5, 5});
    EXPECT_EQ(d.phase, FlowPhase::Stable);
    EXPECT_DOUBLE_EQ(d.q_range, 4.0);
    EXPECT_EQ(d.peak_position, PeakPosition::Middle);
}

TEST(FlowDynamics, TrendAndAcceleration) {
    const std::vector<double> t{0, 1, 2, 3, 4};
    const std::vector<double> q{0, 2, 4, 6, 8};
    const auto d = analyze_flow_dynamics(t, q, LEVELS);
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(d->q_trend, 2.0, 1e-9);
    EXPECT_NEAR(d->q_acceleration, 0.0, 1e-9);
}

TEST(FlowDynamics, AcceleratingRise) {
    const std::vector<double> t{0, 1, 2, 3, 4, 5};
    const std::vector<double> q{1, 1.1, 1.2, 2, 4, 8};
    const auto d = analyze_flow_dynamics(t, q, LEVELS);
    ASSERT_TRUE(d.has_value());
    EXPECT_GT(d->q_acceleration, 0.0);
}

TEST(FlowDynamics, FewerThanTwoSamplesIsUndefined) {
    const std::vector<double> t{0};
    const std::vector<double> q{1};
    EXPECT_FALSE(analyze_flow_dynamics(t, q, LEVELS).has_value());
    EXPECT_EQ(to_string(FlowPhase::EarlyDecline), "early_decline");
}
