/// @file tests/stats/test_slope_estimator.cpp
/// @brief Unit tests for the log-log power-law fit and point-to-point slopes.

#include <gtest/gtest.h>
#include "cqhyst/errors.hpp"
#include "cqhyst/slope.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace cqhyst;
using namespace cqhyst::stats;

// ─── fit_power_law ────────────────────────────────────────────────────────────

TEST(FitPowerLaw, RecoversExponentAndPrefactor) {
    std::vector<double> q;
    std::vector<double> c;
    for (int i = 1; i <= 10; ++i) {
        q.push_back(static_cast<double>(i));
        c.push_back(2.0 * std::sqrt(static_cast<double>(i)));
    }
    const auto fit = fit_power_law(q, c);
    ASSERT_TRUE(fit.has_value());
    EXPECT_NEAR(fit->slope, 0.5, 1e-9);
    EXPECT_NEAR(fit->intercept, std::log(2.0), 1e-9);
    EXPECT_NEAR(fit->prefactor(), 2.0, 1e-9);
    EXPECT_NEAR(fit->r_squared, 1.0, 1e-9);
    EXPECT_EQ(fit->n_used, 10u);
}

TEST(FitPowerLaw, DilutionGivesNegativeSlope) {
    const std::vector<double> q{1.0, 2.0, 4.0, 8.0};
    const std::vector<double> c{8.0, 4.0, 2.0, 1.0};
    const auto fit = fit_power_law(q, c);
    ASSERT_TRUE(fit.has_value());
    EXPECT_NEAR(fit->slope, -1.0, 1e-9);
}

TEST(FitPowerLaw, NonPositiveAndNonFinitePairsAreExcluded) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<double> q{1.0, 0.0, 2.0, nan, 4.0, -1.0};
    const std::vector<double> c{1.0, 5.0, 2.0, 3.0, 4.0, 2.0};
    const auto fit = fit_power_law(q, c);
    ASSERT_TRUE(fit.has_value());
    EXPECT_EQ(fit->n_used, 3u);
    EXPECT_NEAR(fit->slope, 1.0, 1e-9);
}

TEST(FitPowerLaw, TooFewPairsIsUndefined) {
    const std::vector<double> q{1.0, 2.0};
    const std::vector<double> c{1.0, 2.0};
    EXPECT_FALSE(fit_power_law(q, c).has_value());
}

TEST(FitPowerLaw, ConstantDischargeIsUndefined) {
    const std::vector<double> q{3.0, 3.0, 3.0, 3.0};
    const std::vector<double> c{1.0, 2.0, 3.0, 4.0};
    EXPECT_FALSE(fit_power_law(q, c).has_value());
}

TEST(FitPowerLaw, ConstantConcentrationHasZeroSlopeAndNanRSquared) {
    const std::vector<double> q{1.0, 2.0, 3.0, 4.0};
    const std::vector<double> c{2.0, 2.0, 2.0, 2.0};
    const auto fit = fit_power_law(q, c);
    ASSERT_TRUE(fit.has_value());
    EXPECT_NEAR(fit->slope, 0.0, 1e-12);
    EXPECT_TRUE(std::isnan(fit->r_squared));
}

TEST(FitPowerLaw, MismatchedLengthsThrow) {
    const std::vector<double> q{1.0, 2.0, 3.0};
    const std::vector<double> c{1.0, 2.0};
    EXPECT_THROW((void)fit_power_law(q, c), ConfigurationError);
}

// ─── linear_trend ─────────────────────────────────────────────────────────────

TEST(LinearTrend, SlopeOfStraightLine) {
    const std::vector<double> x{0.0, 1.0, 2.0, 3.0};
    const std::vector<double> y{1.0, 3.0, 5.0, 7.0};
    const auto slope = linear_trend(x, y);
    ASSERT_TRUE(slope.has_value());
    EXPECT_NEAR(*slope, 2.0, 1e-12);
}

TEST(LinearTrend, UndefinedForSinglePoint) {
    const std::vector<double> x{1.0};
    const std::vector<double> y{1.0};
    EXPECT_FALSE(linear_trend(x, y).has_value());
}

// ─── point_slope ──────────────────────────────────────────────────────────────

TEST(PointSlope, LogLogAndLinearKinds) {
    EXPECT_NEAR(*point_slope(1.0, 10.0, 1.0, 10.0, SlopeKind::LogLog), 1.0, 1e-12);
    EXPECT_NEAR(*point_slope(1.0, 100.0, 10.0, 1.0, SlopeKind::LogLog), -0.5, 1e-12);
    EXPECT_NEAR(*point_slope(1.0, 3.0, 1.0, 2.0, SlopeKind::Linear), 0.5, 1e-12);
}

TEST(PointSlope, UndefinedCases) {
    EXPECT_FALSE(point_slope(2.0, 2.0, 1.0, 3.0).has_value());
    EXPECT_FALSE(point_slope(0.0, 2.0, 1.0, 3.0).has_value());
    EXPECT_FALSE(point_slope(1.0, 2.0, -1.0, 3.0).has_value());
    EXPECT_TRUE(point_slope(0.0, 2.0, -1.0, 3.0, SlopeKind::Linear).has_value());
    EXPECT_FALSE(point_slope(1.0, 1.0, 1.0, 3.0, SlopeKind::Linear).has_value());
}

// ─── classify_slope ───────────────────────────────────────────────────────────

TEST(ClassifySlope, Bands) {
    EXPECT_EQ(classify_slope(0.20), SlopeSignature::Flushing);
    EXPECT_EQ(classify_slope(-0.20), SlopeSignature::Loading);
    EXPECT_EQ(classify_slope(0.05), SlopeSignature::Chemostatic);
    EXPECT_EQ(classify_slope(0.12), SlopeSignature::Ambiguous);
    EXPECT_EQ(classify_slope(std::nullopt), SlopeSignature::Unknown);
}
