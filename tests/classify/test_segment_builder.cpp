/// @file tests/classify/test_segment_builder.cpp
/// @brief Unit tests for site grouping, segmentation and segment tags.

#include <gtest/gtest.h>
#include "cqhyst/errors.hpp"
#include "cqhyst/segments.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace cqhyst;
using namespace cqhyst::classify;

namespace {

MonitoringSeries two_sites() {
    return {
        {"B", 2.0, 4.0, 1.0},
        {"A", 1.0, 2.0, 3.0},
        {"B", 0.0, 2.0, 2.0},
        {"A", 0.0, 1.0, 2.0},
        {"B", 1.0, 3.0, 1.5},
        {"A", 2.0, 3.0, 2.5},
        {"A", 3.0, std::numeric_limits<double>::quiet_NaN(), 1.0},
    };
}

}  // namespace

// ─── split_by_site ────────────────────────────────────────────────────────────

TEST(SplitBySite, OrderOfFirstAppearanceAndSortedByTime) {
    const auto sites = split_by_site(two_sites());
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].site_id, "B");
    EXPECT_EQ(sites[1].site_id, "A");

    EXPECT_EQ(sites[0].time, (std::vector<double>{0.0, 1.0, 2.0}));
    EXPECT_EQ(sites[0].flow, (std::vector<double>{2.0, 3.0, 4.0}));
    EXPECT_EQ(sites[0].concentration, (std::vector<double>{2.0, 1.5, 1.0}));
}

TEST(SplitBySite, NonFiniteRowsAreDropped) {
    const auto sites = split_by_site(two_sites());
    EXPECT_EQ(sites[1].size(), 3u);
}

// ─── build_segments ───────────────────────────────────────────────────────────

TEST(BuildSegments, PointToPointByDefault) {
    const auto sites = split_by_site(two_sites());
    const auto segments = build_segments(sites);
    ASSERT_EQ(segments.size(), 4u);

    const Segment& s = segments[0];
    EXPECT_EQ(s.site_id, "B");
    EXPECT_EQ(s.segment_id, 0u);
    EXPECT_EQ(s.first, 0u);
    EXPECT_EQ(s.last, 1u);
    EXPECT_DOUBLE_EQ(s.flow_diff, 1.0);
    EXPECT_DOUBLE_EQ(s.conc_diff, -0.5);
    EXPECT_EQ(s.behavior, Behavior::Dispersion);
    ASSERT_TRUE(s.slope_linear.has_value());
    EXPECT_DOUBLE_EQ(*s.slope_linear, -0.5);
    ASSERT_TRUE(s.slope_loglog.has_value());
    EXPECT_LT(*s.slope_loglog, 0.0);

    EXPECT_EQ(segments[1].segment_id, 1u);
    EXPECT_EQ(segments[2].site_id, "A");
    EXPECT_EQ(segments[2].segment_id, 0u);
}

TEST(BuildSegments, WindowIsClippedToTheSite) {
    const auto sites = split_by_site(two_sites());
    const auto segments = build_segments(sites);
    EXPECT_EQ(segments[0].window_first, 0u);
    EXPECT_EQ(segments[0].window_last, 2u);

    const Event ev = window_event(sites[0], segments[0]);
    EXPECT_EQ(ev.size(), 3u);
    EXPECT_DOUBLE_EQ(ev.discharge.back(), 4.0);
}

TEST(BuildSegments, LengthAndStride) {
    MonitoringSeries series;
    for (int i = 0; i < 10; ++i) series.push_back({"S", double(i), 1.0 + i, 2.0});
    SegmentConfig cfg;
    cfg.length = 4;
    cfg.stride = 3;
    const auto segments = build_segments(split_by_site(series), cfg);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[2].first, 6u);
    EXPECT_EQ(segments[2].last, 9u);
    EXPECT_DOUBLE_EQ(segments[2].flow_diff, 3.0);
}

TEST(BuildSegments, InvalidConfigThrows) {
    const auto sites = split_by_site(two_sites());
    SegmentConfig cfg;
    cfg.length = 1;
    EXPECT_THROW((void)build_segments(sites, cfg), ConfigurationError);
    cfg.length = 2;
    cfg.stride = 0;
    EXPECT_THROW((void)build_segments(sites, cfg), ConfigurationError);
}

// ─── Behaviour ────────────────────────────────────────────────────────────────

TEST(ClassifyBehavior, WilliamsQuadrants) {
    EXPECT_EQ(classify_behavior(1.0, 1.0, 10.0, 10.0), Behavior::Connectivity);
    EXPECT_EQ(classify_behavior(-1.0, -1.0, 10.0, 10.0), Behavior::Recovery);
    EXPECT_EQ(classify_behavior(1.0, -1.0, 10.0, 10.0), Behavior::Dispersion);
    EXPECT_EQ(classify_behavior(-1.0, 1.0, 10.0, 10.0), Behavior::Accumulation);
    EXPECT_EQ(classify_behavior(1.0, 0.01, 10.0, 10.0), Behavior::QuasiChemostatic);
    EXPECT_EQ(classify_behavior(0.01, 1.0, 10.0, 10.0), Behavior::SourceVariation);
    EXPECT_EQ(classify_behavior(0.01, 0.01, 10.0, 10.0), Behavior::Static);
}

TEST(ClassifyBehavior, ZeroRangeCountsAsUnchanged) {
    EXPECT_EQ(classify_behavior(1.0, 1.0, 10.0, 0.0), Behavior::QuasiChemostatic);
    EXPECT_EQ(to_string(Behavior::QuasiChemostatic), "quasi_chemostatic");
}

// ─── Trajectory ───────────────────────────────────────────────────────────────

TEST(ClassifyTrajectory, BandsAgainstDeltaPercentiles) {
    stats::ThresholdSet t{};
    t.dc_p08 = -1.0;
    t.dc_p25 = -0.3;
    t.dc_p75 = 0.3;
    t.dc_p90 = 0.8;
    t.abs_dc_p50 = 0.2;
    using stats::Position;

    EXPECT_EQ(classify_trajectory(-1.5, Position::Medium, std::nullopt, t), Trajectory::SteepDecline);
    EXPECT_EQ(classify_trajectory(-1.5, Position::Low, Position::High, t),
              Trajectory::SteepDeclineFromHigh);
    EXPECT_EQ(classify_trajectory(-0.5, Position::Medium, std::nullopt, t), Trajectory::GradualDecline);
    EXPECT_EQ(classify_trajectory(1.0, Position::High, std::nullopt, t), Trajectory::RisingToMax);
    EXPECT_EQ(classify_trajectory(1.0, Position::Medium, std::nullopt, t), Trajectory::LargeIncrease);
    EXPECT_EQ(classify_trajectory(0.5, Position::Medium, std::nullopt, t), Trajectory::ModerateIncrease);
    EXPECT_EQ(classify_trajectory(0.1, Position::High, std::nullopt, t), Trajectory::AtMaximum);
    EXPECT_EQ(classify_trajectory(0.1, Position::Medium, std::nullopt, t), Trajectory::Stable);
}
