/// @file tests/hysteresis/test_normalized_event.cpp
/// @brief Unit tests for event normalization and limb interpolation.
///
/// Test categories:
///   - Min-max scaling, flat series → zeros
///   - Non-finite rows dropped before the sample-count check
///   - First argmax on ties
///   - Limb tie policy (first occurrence) and out-of-range interpolation
///   - Peak sample shared by both limbs

#include <gtest/gtest.h>
#include "hysteresis/normalized_event.hpp"

#include <cmath>
#include <limits>
#include <variant>
#include <vector>

using namespace cqhyst;
using namespace cqhyst::hysteresis::detail;

TEST(MinMaxScale, MapsToUnitInterval) {
    const std::vector<double> v{2.0, 4.0, 6.0};
    const auto s = min_max_scale(v);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s[0], 0.0);
    EXPECT_DOUBLE_EQ(s[1], 0.5);
    EXPECT_DOUBLE_EQ(s[2], 1.0);
}

TEST(MinMaxScale, FlatSeriesMapsToZeros) {
    const std::vector<double> v{3.0, 3.0, 3.0};
    for (double x : min_max_scale(v)) EXPECT_DOUBLE_EQ(x, 0.0);
}

TEST(MinMaxScale, OverflowingRangeMapsToZeros) {
    const std::vector<double> v{-1e308, 0.0, 1e308};
    for (double x : min_max_scale(v)) EXPECT_DOUBLE_EQ(x, 0.0);
}

TEST(FirstArgmax, TiesResolveToEarliest) {
    const std::vector<double> v{1.0, 5.0, 2.0, 5.0};
    EXPECT_EQ(first_argmax(v), 1u);
}

TEST(NormalizeEvent, DropsNonFiniteRows) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const Event ev{
        .time          = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0},
        .discharge     = {1.0, 2.0, nan, 4.0, 3.0, 1.0},
        .concentration = {1.0, 2.0, 3.0, 4.0, 3.0, 2.0},
    };
    const auto result = normalize_event(ev, 5);
    ASSERT_TRUE(succeeded(result));
    const auto& n = std::get<NormalizedEvent>(result);
    EXPECT_EQ(n.size(), 5u);
    EXPECT_EQ(n.peak_q, 2u);
    EXPECT_DOUBLE_EQ(n.time[2], 3.0);
    EXPECT_FALSE(n.q_flat);
}

TEST(NormalizeEvent, TooFewUsableRowsIsInsufficientData) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const Event ev{
        .time          = {0.0, 1.0, 2.0, 3.0, 4.0},
        .discharge     = {1.0, 2.0, nan, 4.0, 3.0},
        .concentration = {1.0, 2.0, 3.0, 4.0, 3.0},
    };
    const auto result = normalize_event(ev, 5);
    ASSERT_FALSE(succeeded(result));
    EXPECT_EQ(std::get<MetricError>(result).kind, ErrorKind::InsufficientData);
}

TEST(NormalizeEvent, DecreasingTimeThrows) {
    const Event ev{
        .time          = {0.0, 2.0, 1.0, 3.0, 4.0},
        .discharge     = {1.0, 2.0, 3.0, 2.0, 1.0},
        .concentration = {1.0, 2.0, 3.0, 2.0, 1.0},
    };
    EXPECT_THROW((void)normalize_event(ev, 5), ConfigurationError);
}

TEST(Limb, DuplicateDischargeKeepsFirstOccurrence) {
    const std::vector<double> q{0.0, 0.5, 0.5, 1.0};
    const std::vector<double> c{0.0, 0.2, 0.8, 1.0};
    const Limb limb(q, c);
    ASSERT_EQ(limb.size(), 3u);
    EXPECT_DOUBLE_EQ(*limb.at(0.5), 0.2);
}

TEST(Limb, InterpolatesInsideAndRefusesOutside) {
    const std::vector<double> q{0.2, 0.6};
    const std::vector<double> c{0.0, 1.0};
    const Limb limb(q, c);
    EXPECT_NEAR(*limb.at(0.4), 0.5, 1e-12);
    EXPECT_FALSE(limb.at(0.1).has_value());
    EXPECT_FALSE(limb.at(0.7).has_value());
}

TEST(Limb, SinglePointIsUndefined) {
    const std::vector<double> q{0.5};
    const std::vector<double> c{0.5};
    EXPECT_FALSE(Limb(q, c).at(0.5).has_value());
}

TEST(SplitLimbs, PeakBelongsToBothLimbs) {
    const Event ev{
        .time          = {0.0, 1.0, 2.0, 3.0, 4.0},
        .discharge     = {1.0, 2.0, 3.0, 2.0, 1.0},
        .concentration = {1.0, 3.0, 2.0, 2.0, 1.0},
    };
    const auto& n = std::get<NormalizedEvent>(normalize_event(ev, 5));
    const auto limbs = split_limbs(n);
    EXPECT_EQ(limbs.rising.size(), 3u);
    EXPECT_EQ(limbs.falling.size(), 3u);
    EXPECT_DOUBLE_EQ(limbs.rising.q_max(), 1.0);
    EXPECT_DOUBLE_EQ(limbs.falling.q_max(), 1.0);
}
