/// @file src/classify/phase_classifier.cpp
/// @brief Ordered rule table and confidence scoring for the phase classifier.

#include "cqhyst/classifier.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace cqhyst::classify {

namespace {

/// Tri-state condition: nullopt means an input was missing.
using Cond = std::optional<bool>;

[[nodiscard]] std::optional<double> finite(double v) noexcept {
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

[[nodiscard]] Cond gt(std::optional<double> a, double b) noexcept {
    if (!a || !std::isfinite(*a)) return std::nullopt;
    return *a > b;
}

[[nodiscard]] Cond lt(std::optional<double> a, double b) noexcept {
    if (!a || !std::isfinite(*a)) return std::nullopt;
    return *a < b;
}

[[nodiscard]] Cond ge(std::optional<double> a, double b) noexcept {
    if (!a || !std::isfinite(*a)) return std::nullopt;
    return *a >= b;
}

[[nodiscard]] Cond le(std::optional<double> a, double b) noexcept {
    if (!a || !std::isfinite(*a)) return std::nullopt;
    return *a <= b;
}

[[nodiscard]] Cond abs_lt(std::optional<double> a, double b) noexcept {
    if (!a || !std::isfinite(*a)) return std::nullopt;
    return std::abs(*a) < b;
}

[[nodiscard]] Cond abs_gt(std::optional<double> a, double b) noexcept {
    if (!a || !std::isfinite(*a)) return std::nullopt;
    return std::abs(*a) > b;
}

/// True if every operand is true; false if any is false; otherwise missing.
[[nodiscard]] Cond all_of(std::initializer_list<Cond> conds) noexcept {
    bool missing = false;
    for (const Cond& c : conds) {
        if (!c) missing = true;
        else if (!*c) return false;
    }
    if (missing) return std::nullopt;
    return true;
}

/// True if any operand is true; false if all are false; otherwise missing.
[[nodiscard]] Cond any_of(std::initializer_list<Cond> conds) noexcept {
    bool missing = false;
    for (const Cond& c : conds) {
        if (!c) missing = true;
        else if (*c) return true;
    }
    if (missing) return std::nullopt;
    return false;
}

template <typename T>
[[nodiscard]] Cond is_one_of(const std::optional<T>& value, std::initializer_list<T> options) noexcept {
    if (!value) return std::nullopt;
    return std::find(options.begin(), options.end(), *value) != options.end();
}

[[nodiscard]] bool holds(const Cond& c) noexcept { return c.value_or(false); }

struct Condition {
    const char* id;
    Cond        value;
};

struct Rule {
    Phase                  phase;
    const char*            id;
    std::vector<Condition> required;
    std::vector<Condition> corroborating;

    [[nodiscard]] bool fires() const noexcept {
        return std::all_of(required.begin(), required.end(),
                           [](const Condition& c) { return holds(c.value); });
    }
};

/// Hysteresis direction changed sign between consecutive segments.
[[nodiscard]] Cond hysteresis_sign_stable(std::optional<double> previous,
                                          std::optional<double> current,
                                          double transition) noexcept {
    if (!previous || !current) return std::nullopt;
    const bool pos_to_neg = *previous >  transition && *current < -transition;
    const bool neg_to_pos = *previous < -transition && *current >  transition;
    return !pos_to_neg && !neg_to_pos;
}

}  // namespace

// ─── WindowHysteresis ─────────────────────────────────────────────────────────

std::optional<double> WindowHysteresis::primary() const noexcept {
    if (zuecco_h && std::isfinite(*zuecco_h))         return zuecco_h;
    if (lloyd_hi_new && std::isfinite(*lloyd_hi_new)) return lloyd_hi_new;
    if (harp_area && std::isfinite(*harp_area))       return harp_area;
    return std::nullopt;
}

bool WindowHysteresis::agree_in_sign() const noexcept {
    int positive = 0;
    int negative = 0;
    for (const auto& v : {harp_area, zuecco_h, lloyd_hi_new}) {
        if (!v || !std::isfinite(*v)) continue;
        if (*v > 0.0) ++positive;
        else if (*v < 0.0) ++negative;
    }
    return positive >= 2 || negative >= 2;
}

std::size_t WindowHysteresis::defined_count() const noexcept {
    std::size_t n = 0;
    for (const auto& v : {harp_area, zuecco_h, lloyd_hi_new}) {
        if (v && std::isfinite(*v)) ++n;
    }
    return n;
}

// ─── PhaseDecision ────────────────────────────────────────────────────────────

bool PhaseDecision::has_rule(std::string_view id) const noexcept {
    return std::find(rules.begin(), rules.end(), id) != rules.end();
}

// ─── PhaseClassifier ──────────────────────────────────────────────────────────

PhaseClassifier::PhaseClassifier(ClassifierConfig config) noexcept : config_(config) {}

PhaseDecision
PhaseClassifier::classify(const SegmentFeatures& f,
                          const std::optional<stats::ThresholdSet>& thresholds,
                          std::optional<Phase> prior) const {
    const ConfidenceWeights& w = config_.weights;
    const bool agreement = f.hysteresis.agree_in_sign();
    const auto primary   = f.hysteresis.primary();

    const auto score = [&](std::size_t corroborations, bool reduced) {
        double c = w.base + w.per_corroboration * static_cast<double>(corroborations);
        if (agreement) c += w.hysteresis_agreement;
        if (reduced)   c -= w.reduced_data_penalty;
        return std::clamp(c, 0.0, 1.0);
    };

    if (!thresholds) {
        PhaseDecision d{Phase::Variable, 0.0,
                        {rule::INSUFFICIENT_POPULATION, rule::REDUCED_DATA_QUALITY}};
        if (agreement) d.rules.emplace_back(rule::HYSTERESIS_AGREEMENT);
        d.confidence = std::min(w.base, score(0, true));
        return d;
    }
    const stats::ThresholdSet& t = *thresholds;

    const bool reduced = !f.slope || !std::isfinite(*f.slope) ||
                         !f.cv_ratio || !std::isfinite(*f.cv_ratio) ||
                         !primary;

    const auto dq        = finite(f.flow_diff);
    const auto dc        = finite(f.conc_diff);
    const auto end_flow  = finite(f.end_flow);
    const auto start_c   = finite(f.start_conc);
    const auto end_c     = finite(f.end_conc);

    const Cond recession_signature =
        all_of({lt(f.cv_ratio, t.cv_ratio_low), gt(f.days_since_peak, config_.recession_days)});
    const Cond flow_falling = lt(dq, 0.0);
    const Cond conc_falling = lt(dc, 0.0);

    // Low delta percentiles can be positive, so a decline must also be negative.
    const auto declining_below = [](std::optional<double> v, double cut) {
        return all_of({lt(v, 0.0), lt(v, cut)});
    };

    std::vector<Rule> table;
    table.reserve(5);

    table.push_back(Rule{
        Phase::Flushing, rule::FLUSHING,
        {
            {"slope_flushing", gt(f.slope, t.slope_directional)},
            {"chemodynamic_variability", gt(f.cv_ratio, t.cv_ratio_cut)},
            {"conc_declining", declining_below(dc, t.dc_p25)},
            {"flow_high_or_rising",
             any_of({ge(end_flow, t.q_p67),
                     is_one_of(f.flow_phase, {FlowPhase::Rising, FlowPhase::AtPeak,
                                              FlowPhase::EarlyDecline}),
                     all_of({gt(dq, 0.0), ge(end_flow, t.q_p50)})})},
        },
        {
            {"steep_conc_decline", declining_below(dc, t.dc_p08)},
            {"conc_was_high", gt(start_c, t.c_p75)},
            {"clockwise_hysteresis", gt(primary, config_.hi_transition)},
            {"flow_at_peak", is_one_of(f.flow_phase, {FlowPhase::AtPeak, FlowPhase::EarlyDecline})},
            {"prior_flushing_or_loading", is_one_of(prior, {Phase::Flushing, Phase::Loading})},
        },
    });

    table.push_back(Rule{
        Phase::Loading, rule::LOADING,
        {
            {"slope_loading", lt(f.slope, -t.slope_directional)},
            {"conc_rising", gt(dc, 0.0)},
            {"conc_near_max", gt(end_c, t.c_p75)},
        },
        {
            {"large_conc_increase", gt(dc, t.dc_p90)},
            {"flow_not_peaked", is_one_of(f.flow_phase, {FlowPhase::Rising})},
            {"counter_clockwise_hysteresis", lt(primary, -config_.hi_transition)},
            {"flow_stable", le(dq, t.dq_p75)},
        },
    });

    table.push_back(Rule{
        Phase::Chemostatic, rule::CHEMOSTATIC,
        {
            {"slope_chemostatic", abs_lt(f.slope, t.slope_chemostatic)},
            {"chemostatic_variability", lt(f.cv_ratio, t.cv_ratio_cut)},
            {"low_hysteresis", abs_lt(primary, config_.low_hysteresis)},
        },
        {
            {"small_conc_change", abs_lt(dc, t.abs_dc_p50)},
            {"stable_hysteresis_sign",
             hysteresis_sign_stable(f.previous.primary_hi, primary, config_.hi_transition)},
            {"prior_chemostatic", is_one_of(prior, {Phase::Chemostatic})},
        },
    });

    // A missing recession input counts as no recession signature.
    const bool after_flush = prior == Phase::Flushing;
    table.push_back(Rule{
        Phase::Dilution, rule::DILUTION,
        {
            {"flow_declining", flow_falling},
            {"conc_falling", conc_falling},
            {"after_flush_or_no_recession", after_flush || !holds(recession_signature)},
        },
        {
            {"post_peak_flow", is_one_of(f.flow_phase, {FlowPhase::PostPeak, FlowPhase::EarlyDecline})},
            {"conc_depleted", le(end_c, t.c_p50)},
            {"large_flow_drop", lt(dq, t.dq_p10)},
            {"recent_flush", declining_below(f.previous.conc_diff, t.dc_p25)},
        },
    });

    table.push_back(Rule{
        Phase::Recession, rule::RECESSION,
        {
            {"flow_declining", flow_falling},
            {"conc_falling", conc_falling},
            {"low_variability", lt(f.cv_ratio, t.cv_ratio_low)},
            {"long_after_peak", gt(f.days_since_peak, config_.recession_days)},
        },
        {
            {"both_declining_beyond_p25",
             all_of({declining_below(dq, t.dq_p25), declining_below(dc, t.dc_p25)})},
            {"late_cycle_flow",
             any_of({is_one_of(f.flow_phase, {FlowPhase::LateDecline, FlowPhase::Low}),
                     lt(end_flow, t.q_p33)})},
            {"prior_dilution_or_recession",
             is_one_of(prior, {Phase::Dilution, Phase::Recession})},
        },
    });

    const auto finish = [&](PhaseDecision d, std::size_t corroborations) {
        if (agreement) d.rules.emplace_back(rule::HYSTERESIS_AGREEMENT);
        if (reduced)   d.rules.emplace_back(rule::REDUCED_DATA_QUALITY);
        d.confidence = score(corroborations, reduced);
        return d;
    };

    for (std::size_t i = 0; i < table.size(); ++i) {
        const Rule& r = table[i];
        if (r.fires()) {
            PhaseDecision d{r.phase, 0.0, {r.id}};
            std::size_t corroborations = 0;
            for (const auto& c : r.corroborating) {
                if (holds(c.value)) {
                    d.rules.emplace_back(c.id);
                    ++corroborations;
                }
            }
            return finish(std::move(d), corroborations);
        }

        // Directional slope with chemostatic variability that produced neither
        // F nor L.
        if (r.phase == Phase::Loading &&
            holds(all_of({abs_gt(f.slope, t.slope_directional),
                          lt(f.cv_ratio, t.cv_ratio_cut)}))) {
            return finish(PhaseDecision{Phase::Variable, 0.0, {rule::CONFLICTING_INDICATORS}}, 0);
        }
    }

    return finish(PhaseDecision{Phase::Variable, 0.0, {rule::NO_RULE_MATCHED}}, 0);
}

}  // namespace cqhyst::classify
