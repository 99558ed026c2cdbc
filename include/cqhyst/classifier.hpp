#pragma once

/// @file include/cqhyst/classifier.hpp
/// @brief Hierarchical Phase Classifier: F / L / C / D / R / V per segment.
///
/// # Module: Phase Classifier
///
/// ## Responsibility
/// Assign one geochemical process phase to a segment from its C-Q slope,
/// CVc/CVq, window-scale hysteresis indices, flow context and the phase of
/// the previous segment. Cut points come from the run's ThresholdSet, so the
/// same rules apply to compounds with very different concentration ranges.
///
/// ## Rule Order (first match wins)
///   1. F  flushing      slope > +0.15, CVc/CVq > 1, C declining, Q high or rising
///   2. L  loading       slope < −0.15, C rising toward a maximum
///      conflict guard   |slope| > 0.15 with CVc/CVq < 1 → V
///   3. C  chemostatic   |slope| < 0.10, CVc/CVq < 1, |primary HI| < 0.12
///   4. D  dilution      Q and C declining, prior F or no recession signature
///   5. R  recession     Q and C declining, CVc/CVq < 0.8, > 5 days since peak
///   6. V  variable      default
///
/// Every condition is an `std::optional<bool>`: a missing input never
/// satisfies a required condition and never counts as corroboration.
///
/// ## Confidence
///   base + per_corroboration·(corroborating conditions met)
///        + hysteresis_agreement   (≥ 2 window indices share a non-zero sign)
///        − reduced_data_penalty   (thresholds, slope, CVc/CVq or every
///                                  window index missing)
/// clamped to [0, 1].
///
/// ## Guarantees
/// - Pure: the output depends only on the arguments and the configuration
/// - The prior phase is an explicit argument, never hidden state

#include "cqhyst/constants.hpp"
#include "cqhyst/flow_dynamics.hpp"
#include "cqhyst/thresholds.hpp"
#include "cqhyst/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cqhyst::classify {

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// Hysteresis indices recomputed on the segment's surrounding window.
struct WindowHysteresis {
    std::optional<double> harp_area;
    std::optional<double> zuecco_h;
    std::optional<double> lloyd_hi_new;

    /// Zuecco h, else Lloyd mean HInew, else HARP area.
    [[nodiscard]] std::optional<double> primary() const noexcept;

    /// At least two defined indices share the same non-zero sign.
    [[nodiscard]] bool agree_in_sign() const noexcept;

    [[nodiscard]] std::size_t defined_count() const noexcept;
};

/// Context carried over from the previous segment of the same site.
struct PreviousSegment {
    std::optional<double> conc_diff;
    std::optional<double> primary_hi;
};

struct SegmentFeatures {
    double start_flow;
    double end_flow;
    double flow_diff;
    double start_conc;
    double end_conc;
    double conc_diff;

    std::optional<double> slope;     ///< Log-log C-Q slope b
    std::optional<double> cv_ratio;  ///< CVc/CVq

    WindowHysteresis hysteresis;

    std::optional<FlowPhase> flow_phase;
    std::optional<double>    days_since_peak;

    PreviousSegment previous;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct ConfidenceWeights {
    double base                 = constants::CONFIDENCE_BASE;
    double per_corroboration    = constants::CONFIDENCE_PER_CORROBORATION;
    double hysteresis_agreement = constants::CONFIDENCE_HYSTERESIS_AGREEMENT;
    double reduced_data_penalty = constants::CONFIDENCE_REDUCED_DATA_PENALTY;
};

struct ClassifierConfig {
    ConfidenceWeights weights;
    double low_hysteresis = constants::LOW_HYSTERESIS;
    double recession_days = constants::RECESSION_DAYS;
    double hi_transition  = constants::HI_TRANSITION;
};

// ─── Output ───────────────────────────────────────────────────────────────────

namespace rule {
inline constexpr const char* FLUSHING                 = "flushing";
inline constexpr const char* LOADING                  = "loading";
inline constexpr const char* CHEMOSTATIC              = "chemostatic";
inline constexpr const char* DILUTION                 = "dilution";
inline constexpr const char* RECESSION                = "recession";
inline constexpr const char* NO_RULE_MATCHED          = "no_rule_matched";
inline constexpr const char* CONFLICTING_INDICATORS   = "conflicting_indicators";
inline constexpr const char* HYSTERESIS_AGREEMENT     = "hysteresis_agreement";
inline constexpr const char* REDUCED_DATA_QUALITY     = "reduced_data_quality";
inline constexpr const char* INSUFFICIENT_POPULATION  = "insufficient_threshold_population";
}  // namespace rule

struct PhaseDecision {
    Phase                    phase;
    double                   confidence;  ///< [0, 1]
    std::vector<std::string> rules;       ///< Fired rule and condition ids, in order

    [[nodiscard]] bool has_rule(std::string_view id) const noexcept;
    [[nodiscard]] bool reduced_data_quality() const noexcept {
        return has_rule(rule::REDUCED_DATA_QUALITY);
    }
};

// ─── PhaseClassifier ──────────────────────────────────────────────────────────

class PhaseClassifier {
public:
    explicit PhaseClassifier(ClassifierConfig config = ClassifierConfig{}) noexcept;

    /// Classify one segment.
    ///
    /// # Arguments
    /// * `features`   - Segment measurements; missing values are `nullopt`
    /// * `thresholds` - Run cut points; `nullopt` when the population was
    ///                  below the minimum, which yields V with reduced confidence
    /// * `prior`      - Phase of the previous segment of the same site
    [[nodiscard]] PhaseDecision
    classify(const SegmentFeatures& features,
             const std::optional<stats::ThresholdSet>& thresholds,
             std::optional<Phase> prior = std::nullopt) const;

    [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }

private:
    ClassifierConfig config_;
};

}  // namespace cqhyst::classify
