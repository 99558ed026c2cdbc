/// @file tests/classify/test_phase_classifier.cpp
/// @brief Unit tests for the hierarchical phase classifier.
///
/// Test categories:
///   - One canonical segment per phase (F, L, C, D, R, V)
///   - Rule order and the conflict guard
///   - Missing inputs never satisfy a required condition
///   - Missing thresholds → V with reduced confidence
///   - Confidence composition and clamping
///   - Prior phase changes the outcome only through explicit rules
///   - Determinism

#include <gtest/gtest.h>
#include "cqhyst/classifier.hpp"

#include <vector>

using namespace cqhyst;
using namespace cqhyst::classify;

namespace {

stats::ThresholdSet make_thresholds() {
    stats::ThresholdSet t{};
    t.q_p25 = 2.0;  t.q_p33 = 3.0;  t.q_p50 = 5.0;  t.q_p67 = 7.0;  t.q_p75 = 8.0;
    t.c_p25 = 1.0;  t.c_p50 = 2.0;  t.c_p75 = 3.0;
    t.dc_p01 = -2.0; t.dc_p05 = -1.5; t.dc_p08 = -1.0; t.dc_p10 = -0.8; t.dc_p25 = -0.3;
    t.dc_p50 = 0.0;  t.dc_p75 = 0.3;  t.dc_p90 = 0.8;  t.dc_p95 = 1.2;
    t.dq_p05 = -3.0; t.dq_p10 = -2.0; t.dq_p25 = -1.0; t.dq_p50 = 0.0; t.dq_p75 = 1.0; t.dq_p90 = 2.0;
    t.abs_dc_p50 = 0.3; t.abs_dc_p75 = 0.6; t.abs_dq_p50 = 0.8; t.abs_dq_p75 = 1.5;
    t.slope_directional = constants::SLOPE_DIRECTIONAL;
    t.slope_chemostatic = constants::SLOPE_CHEMOSTATIC;
    t.cv_ratio_cut      = constants::CV_RATIO_CUT;
    t.cv_ratio_low      = constants::CV_RATIO_LOW;
    t.population_size   = 100;
    return t;
}

/// High flow, concentration dropping from a high level, clockwise window.
SegmentFeatures flushing_features() {
    SegmentFeatures f{
        .start_flow = 8.0, .end_flow = 9.0, .flow_diff = 1.0,
        .start_conc = 3.5, .end_conc = 3.0, .conc_diff = -0.5,
        .slope = 0.20, .cv_ratio = 1.4,
        .hysteresis = {.harp_area = std::nullopt, .zuecco_h = 0.2, .lloyd_hi_new = 0.3},
        .flow_phase = std::nullopt, .days_since_peak = std::nullopt,
        .previous = {},
    };
    return f;
}

/// Flow and concentration falling together some time after the peak.
SegmentFeatures declining_features(double cv_ratio, double days_since_peak) {
    SegmentFeatures f{
        .start_flow = 5.0, .end_flow = 3.0, .flow_diff = -2.0,
        .start_conc = 2.2, .end_conc = 2.0, .conc_diff = -0.2,
        .slope = 0.12, .cv_ratio = cv_ratio,
        .hysteresis = {.harp_area = 0.05, .zuecco_h = 0.04, .lloyd_hi_new = 0.05},
        .flow_phase = std::nullopt, .days_since_peak = days_since_peak,
        .previous = {},
    };
    return f;
}

const PhaseClassifier classifier;
const auto thresholds = std::optional<stats::ThresholdSet>(make_thresholds());

}  // namespace

// ─── Canonical phases ─────────────────────────────────────────────────────────

TEST(PhaseClassifier, Flushing) {
    const auto d = classifier.classify(flushing_features(), thresholds);
    EXPECT_EQ(d.phase, Phase::Flushing);
    EXPECT_GE(d.confidence, 0.65);
    EXPECT_TRUE(d.has_rule(rule::FLUSHING));
    EXPECT_TRUE(d.has_rule("conc_was_high"));
    EXPECT_TRUE(d.has_rule("clockwise_hysteresis"));
    EXPECT_TRUE(d.has_rule(rule::HYSTERESIS_AGREEMENT));
    EXPECT_FALSE(d.reduced_data_quality());
    // base + 2 corroborations + agreement
    EXPECT_NEAR(d.confidence, 0.5 + 2 * 0.15 + 0.1, 1e-12);
    EXPECT_EQ(d.rules.front(), rule::FLUSHING);
}

TEST(PhaseClassifier, Loading) {
    SegmentFeatures f = flushing_features();
    f.slope = -0.3;
    f.cv_ratio = 1.2;
    f.flow_diff = 0.5;
    f.conc_diff = 0.5;
    f.start_conc = 3.0;
    f.end_conc = 3.5;
    f.hysteresis = {.harp_area = -0.1, .zuecco_h = -0.2, .lloyd_hi_new = -0.3};
    const auto d = classifier.classify(f, thresholds);
    EXPECT_EQ(d.phase, Phase::Loading);
    EXPECT_TRUE(d.has_rule("counter_clockwise_hysteresis"));
    EXPECT_TRUE(d.has_rule("flow_stable"));
}

TEST(PhaseClassifier, Chemostatic) {
    SegmentFeatures f = declining_features(0.5, 2.0);
    f.slope = 0.05;
    f.conc_diff = 0.1;
    const auto d = classifier.classify(f, thresholds);
    EXPECT_EQ(d.phase, Phase::Chemostatic);
    EXPECT_TRUE(d.has_rule("small_conc_change"));
}

TEST(PhaseClassifier, Dilution) {
    const auto d = classifier.classify(declining_features(0.9, 2.0), thresholds);
    EXPECT_EQ(d.phase, Phase::Dilution);
    EXPECT_TRUE(d.has_rule(rule::DILUTION));
}

TEST(PhaseClassifier, RecessionSignatureSelectsRecession) {
    const auto d = classifier.classify(declining_features(0.5, 10.0), thresholds);
    EXPECT_EQ(d.phase, Phase::Recession);
    EXPECT_TRUE(d.has_rule(rule::RECESSION));
}

TEST(PhaseClassifier, PriorFlushTurnsRecessionIntoDilution) {
    const auto d = classifier.classify(declining_features(0.5, 10.0), thresholds, Phase::Flushing);
    EXPECT_EQ(d.phase, Phase::Dilution);
}

TEST(PhaseClassifier, PriorCorroboratesRecession) {
    const auto without = classifier.classify(declining_features(0.5, 10.0), thresholds);
    const auto with = classifier.classify(declining_features(0.5, 10.0), thresholds, Phase::Recession);
    EXPECT_EQ(with.phase, Phase::Recession);
    EXPECT_TRUE(with.has_rule("prior_dilution_or_recession"));
    EXPECT_GT(with.confidence, without.confidence);
}

TEST(PhaseClassifier, NoRuleMatchedIsVariable) {
    SegmentFeatures f = declining_features(0.9, 2.0);
    f.flow_diff = 1.0;
    f.conc_diff = 0.1;
    const auto d = classifier.classify(f, thresholds);
    EXPECT_EQ(d.phase, Phase::Variable);
    EXPECT_TRUE(d.has_rule(rule::NO_RULE_MATCHED));
}

// ─── Guards and missing data ──────────────────────────────────────────────────

TEST(PhaseClassifier, DirectionalSlopeWithLowVariabilityConflicts) {
    SegmentFeatures f = flushing_features();
    f.cv_ratio = 0.6;
    const auto d = classifier.classify(f, thresholds);
    EXPECT_EQ(d.phase, Phase::Variable);
    EXPECT_TRUE(d.has_rule(rule::CONFLICTING_INDICATORS));
}

TEST(PhaseClassifier, MissingSlopeNeverSatisfiesFlushing) {
    SegmentFeatures f = flushing_features();
    f.slope = std::nullopt;
    const auto d = classifier.classify(f, thresholds);
    EXPECT_NE(d.phase, Phase::Flushing);
    EXPECT_TRUE(d.reduced_data_quality());
}

TEST(PhaseClassifier, MissingInputsLowerConfidence) {
    SegmentFeatures full = declining_features(0.9, 2.0);
    SegmentFeatures partial = full;
    partial.cv_ratio = std::nullopt;
    const auto a = classifier.classify(full, thresholds);
    const auto b = classifier.classify(partial, thresholds);
    EXPECT_EQ(b.phase, Phase::Dilution);
    EXPECT_TRUE(b.reduced_data_quality());
    EXPECT_LT(b.confidence, a.confidence);
}

TEST(PhaseClassifier, MissingThresholdsYieldVariableWithReducedConfidence) {
    const auto d = classifier.classify(flushing_features(), std::nullopt);
    EXPECT_EQ(d.phase, Phase::Variable);
    EXPECT_LE(d.confidence, 0.5);
    EXPECT_TRUE(d.has_rule(rule::INSUFFICIENT_POPULATION));
    EXPECT_TRUE(d.reduced_data_quality());
}

TEST(PhaseClassifier, RisingConcentrationIsNeverFlushing) {
    // Record dominated by increases: even the low dC percentiles are positive.
    stats::ThresholdSet rising = make_thresholds();
    rising.dc_p01 = 0.1;
    rising.dc_p05 = 0.2;
    rising.dc_p08 = 0.3;
    rising.dc_p10 = 0.4;
    rising.dc_p25 = 0.5;

    SegmentFeatures f = flushing_features();
    f.start_conc = 3.0;
    f.end_conc = 3.2;
    f.conc_diff = 0.2;
    const auto d = classifier.classify(f, rising);
    EXPECT_NE(d.phase, Phase::Flushing);
    EXPECT_FALSE(d.has_rule("steep_conc_decline"));

    // A genuine decline still qualifies under the same cut points.
    f.start_conc = 3.5;
    f.end_conc = 3.0;
    f.conc_diff = -0.5;
    const auto declining = classifier.classify(f, rising);
    EXPECT_EQ(declining.phase, Phase::Flushing);
    EXPECT_TRUE(declining.has_rule("steep_conc_decline"));
}

TEST(PhaseClassifier, RecentFlushNeedsAPreviousDecline) {
    stats::ThresholdSet rising = make_thresholds();
    rising.dc_p25 = 0.5;
    SegmentFeatures f = declining_features(0.9, 2.0);
    f.previous.conc_diff = 0.2;
    EXPECT_FALSE(classifier.classify(f, rising).has_rule("recent_flush"));
    f.previous.conc_diff = -0.2;
    EXPECT_TRUE(classifier.classify(f, rising).has_rule("recent_flush"));
}

// ─── Confidence ───────────────────────────────────────────────────────────────

TEST(PhaseClassifier, ConfidenceIsClamped) {
    SegmentFeatures f = flushing_features();
    f.conc_diff = -1.5;
    f.flow_phase = FlowPhase::AtPeak;
    const auto d = classifier.classify(f, thresholds, Phase::Loading);
    EXPECT_EQ(d.phase, Phase::Flushing);
    EXPECT_DOUBLE_EQ(d.confidence, 1.0);
}

TEST(PhaseClassifier, WeightsAreConfigurable) {
    ClassifierConfig cfg;
    cfg.weights.base = 0.3;
    cfg.weights.per_corroboration = 0.0;
    cfg.weights.hysteresis_agreement = 0.0;
    const PhaseClassifier custom(cfg);
    const auto d = custom.classify(flushing_features(), thresholds);
    EXPECT_EQ(d.phase, Phase::Flushing);
    EXPECT_DOUBLE_EQ(d.confidence, 0.3);
}

TEST(PhaseClassifier, Deterministic) {
    const auto a = classifier.classify(flushing_features(), thresholds, Phase::Chemostatic);
    const auto b = classifier.classify(flushing_features(), thresholds, Phase::Chemostatic);
    EXPECT_EQ(a.phase, b.phase);
    EXPECT_EQ(a.confidence, b.confidence);
    EXPECT_EQ(a.rules, b.rules);
}

// ─── WindowHysteresis ─────────────────────────────────────────────────────────

TEST(WindowHysteresis, PrimaryPrefersZueccoThenLloydThenHarp) {
    WindowHysteresis h{.harp_area = 0.3, .zuecco_h = 0.1, .lloyd_hi_new = 0.2};
    EXPECT_DOUBLE_EQ(*h.primary(), 0.1);
    h.zuecco_h = std::nullopt;
    EXPECT_DOUBLE_EQ(*h.primary(), 0.2);
    h.lloyd_hi_new = std::nullopt;
    EXPECT_DOUBLE_EQ(*h.primary(), 0.3);
    h.harp_area = std::nullopt;
    EXPECT_FALSE(h.primary().has_value());
    EXPECT_EQ(h.defined_count(), 0u);
}

TEST(WindowHysteresis, AgreementNeedsTwoMatchingSigns) {
    EXPECT_TRUE((WindowHysteresis{.harp_area = 0.1, .zuecco_h = 0.2, .lloyd_hi_new = -0.1}
                     .agree_in_sign()));
    EXPECT_FALSE((WindowHysteresis{.harp_area = 0.1, .zuecco_h = -0.2, .lloyd_hi_new = std::nullopt}
                      .agree_in_sign()));
    EXPECT_FALSE((WindowHysteresis{.harp_area = 0.0, .zuecco_h = 0.0, .lloyd_hi_new = 0.0}
                      .agree_in_sign()));
}
