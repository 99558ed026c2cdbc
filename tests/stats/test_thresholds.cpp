/// @file tests/stats/test_thresholds.cpp
/// @brief Unit tests for quantiles, percentile ranks and ThresholdCalculator.
///
/// Test categories:
///   - Linear-interpolation quantiles on known data
///   - Non-finite values are ignored
///   - Percentile rank counts ties as half below
///   - Population below the minimum → InsufficientData
///   - Percentile ordering within each family
///   - Fixed bands copied from the configuration

#include <gtest/gtest.h>
#include "cqhyst/thresholds.hpp"

#include <cmath>
#include <limits>
#include <variant>
#include <vector>

using namespace cqhyst;
using namespace cqhyst::stats;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Population with 1..n flows and concentrations and alternating diffs.
ThresholdPopulation make_population(std::size_t n) {
    ThresholdPopulation pop;
    for (std::size_t i = 0; i < n; ++i) {
        const double v = static_cast<double>(i + 1);
        pop.flow.push_back(v);
        pop.concentration.push_back(v * 0.1);
        pop.flow_diff.push_back(i % 2 == 0 ? v : -v);
        pop.conc_diff.push_back(i % 2 == 0 ? -0.1 * v : 0.1 * v);
    }
    return pop;
}

}  // namespace

// ─── quantile ─────────────────────────────────────────────────────────────────

TEST(Quantile, LinearInterpolationOnKnownData) {
    const std::vector<double> v{5.0, 1.0, 3.0, 2.0, 4.0};
    EXPECT_DOUBLE_EQ(*quantile(v, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(*quantile(v, 0.25), 2.0);
    EXPECT_DOUBLE_EQ(*quantile(v, 0.5), 3.0);
    EXPECT_DOUBLE_EQ(*quantile(v, 1.0), 5.0);
    EXPECT_NEAR(*quantile(v, 0.1), 1.4, 1e-12);
}

TEST(Quantile, IgnoresNonFiniteValues) {
    const std::vector<double> v{NaN, 1.0, std::numeric_limits<double>::infinity(), 3.0};
    EXPECT_DOUBLE_EQ(*quantile(v, 0.5), 2.0);
}

TEST(Quantile, UndefinedForEmptyOrOutOfRange) {
    const std::vector<double> empty;
    const std::vector<double> nans{NaN, NaN};
    const std::vector<double> v{1.0, 2.0};
    EXPECT_FALSE(quantile(empty, 0.5).has_value());
    EXPECT_FALSE(quantile(nans, 0.5).has_value());
    EXPECT_FALSE(quantile(v, -0.1).has_value());
    EXPECT_FALSE(quantile(v, 1.1).has_value());
}

// ─── percentile_rank ──────────────────────────────────────────────────────────

TEST(PercentileRank, TiesCountAsHalf) {
    const std::vector<double> v{1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(*percentile_rank(v, 3.0), 62.5);
    EXPECT_DOUBLE_EQ(*percentile_rank(v, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(*percentile_rank(v, 10.0), 100.0);
}

TEST(PercentileRank, UndefinedForNonFiniteValue) {
    const std::vector<double> v{1.0, 2.0};
    EXPECT_FALSE(percentile_rank(v, NaN).has_value());
    EXPECT_FALSE(percentile_rank(std::vector<double>{}, 1.0).has_value());
}

// ─── position ─────────────────────────────────────────────────────────────────

TEST(Position, BandsAreExclusiveAtTheEdges) {
    EXPECT_EQ(position(0.5, 1.0, 2.0), Position::Low);
    EXPECT_EQ(position(1.0, 1.0, 2.0), Position::Medium);
    EXPECT_EQ(position(2.0, 1.0, 2.0), Position::Medium);
    EXPECT_EQ(position(2.5, 1.0, 2.0), Position::High);
    EXPECT_EQ(to_string(Position::High), "high");
}

// ─── ThresholdCalculator ──────────────────────────────────────────────────────

TEST(ThresholdCalculator, SmallPopulationIsInsufficientData) {
    const ThresholdCalculator calc;
    const auto result = calc.compute(make_population(4));
    ASSERT_FALSE(succeeded(result));
    EXPECT_EQ(std::get<MetricError>(result).kind, ErrorKind::InsufficientData);
}

TEST(ThresholdCalculator, NonFiniteValuesDoNotCountTowardsThePopulation) {
    auto pop = make_population(4);
    pop.flow.push_back(NaN);
    pop.concentration.push_back(NaN);
    pop.flow_diff.push_back(NaN);
    pop.conc_diff.push_back(NaN);
    const auto result = ThresholdCalculator{}.compute(pop);
    EXPECT_FALSE(succeeded(result));
}

TEST(ThresholdCalculator, FlowQuantilesMatchKnownValues) {
    const auto result = ThresholdCalculator{}.compute(make_population(11));
    ASSERT_TRUE(succeeded(result));
    const auto& t = std::get<ThresholdSet>(result);
    EXPECT_DOUBLE_EQ(t.q_p25, 3.5);
    EXPECT_DOUBLE_EQ(t.q_p50, 6.0);
    EXPECT_DOUBLE_EQ(t.q_p75, 8.5);
    EXPECT_NEAR(t.c_p50, 0.6, 1e-12);
    EXPECT_EQ(t.population_size, 11u);
}

TEST(ThresholdCalculator, PercentilesAreOrdered) {
    const auto result = ThresholdCalculator{}.compute(make_population(40));
    ASSERT_TRUE(succeeded(result));
    const auto& t = std::get<ThresholdSet>(result);

    EXPECT_LE(t.q_p25, t.q_p33);
    EXPECT_LE(t.q_p33, t.q_p50);
    EXPECT_LE(t.q_p50, t.q_p67);
    EXPECT_LE(t.q_p67, t.q_p75);

    const std::vector<double> dc{t.dc_p01, t.dc_p05, t.dc_p08, t.dc_p10, t.dc_p25,
                                 t.dc_p50, t.dc_p75, t.dc_p90, t.dc_p95};
    for (std::size_t i = 1; i < dc.size(); ++i) EXPECT_LE(dc[i - 1], dc[i]);

    const std::vector<double> dq{t.dq_p05, t.dq_p10, t.dq_p25, t.dq_p50, t.dq_p75, t.dq_p90};
    for (std::size_t i = 1; i < dq.size(); ++i) EXPECT_LE(dq[i - 1], dq[i]);

    EXPECT_GE(t.abs_dc_p50, 0.0);
    EXPECT_LE(t.abs_dc_p50, t.abs_dc_p75);
    EXPECT_LE(t.abs_dq_p50, t.abs_dq_p75);
}

TEST(ThresholdCalculator, FixedBandsComeFromConfig) {
    ThresholdConfig cfg;
    cfg.slope_directional = 0.2;
    cfg.cv_ratio_low      = 0.7;
    const auto result = ThresholdCalculator{cfg}.compute(make_population(10));
    ASSERT_TRUE(succeeded(result));
    const auto& t = std::get<ThresholdSet>(result);
    EXPECT_DOUBLE_EQ(t.slope_directional, 0.2);
    EXPECT_DOUBLE_EQ(t.slope_chemostatic, constants::SLOPE_CHEMOSTATIC);
    EXPECT_DOUBLE_EQ(t.cv_ratio_cut, constants::CV_RATIO_CUT);
    EXPECT_DOUBLE_EQ(t.cv_ratio_low, 0.7);
}

TEST(ThresholdCalculator, MinimumPopulationIsConfigurable) {
    ThresholdConfig cfg;
    cfg.min_population = 3;
    EXPECT_TRUE(succeeded(ThresholdCalculator{cfg}.compute(make_population(3))));
}
