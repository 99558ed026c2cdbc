#pragma once

/// @file include/cqhyst/hysteresis.hpp
/// @brief Event-scale hysteresis calculators: HARP, Zuecco, Lawler/Lloyd.
///
/// # Module: Hysteresis Calculators
///
/// ## Responsibility
/// Quantify the loop formed when the C-Q relationship of one flow event differs
/// between the rising and the falling limb. Three published methods are
/// computed independently; none of them depends on another's result.
///
/// ## Common Preparation
/// 1. Column lengths and time order are validated (ConfigurationError)
/// 2. Rows with a non-finite time, Q or C are dropped
/// 3. Fewer than `min_samples` (default 5) usable rows → InsufficientData
/// 4. Time, Q and C are min-max scaled to [0, 1] over the event
/// 5. Limbs split at the first maximum of Q; the peak sample is in both
///
/// ## Sign Convention
/// All three methods report a clockwise loop (concentration higher on the
/// rising limb, C peaking before Q) as positive.
///
/// ## Tie / Range Policy
/// Duplicate normalized Q values on a limb keep their first occurrence in
/// time order. A grid point or percentile outside a limb's Q range is
/// excluded from every sum and mean, never treated as zero.

#include "cqhyst/constants.hpp"
#include "cqhyst/errors.hpp"
#include "cqhyst/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace cqhyst::hysteresis {

// ─── HARP ─────────────────────────────────────────────────────────────────────
//
// Roberts et al. (2023). Loop area is the signed shoelace area of the closed,
// time-ordered path in normalized (Q, C) space:
//   area = −½ Σ (Q_i·C_{i+1} − Q_{i+1}·C_i)     (indices wrap)
// The sign flip makes a clockwise path positive.

enum class LoopDirection {
    Linear,            ///< |area| below the linear epsilon
    Clockwise,         ///< area > 0 and C peaks no later than Q
    CounterClockwise,  ///< area < 0 and C peaks no earlier than Q
    Complex,           ///< area sign and peak order disagree
    Undefined,         ///< flat Q, no distinguishable peak
};

[[nodiscard]] std::string_view to_string(LoopDirection direction) noexcept;

struct HarpConfig {
    double      linear_epsilon = constants::HARP_LINEAR_EPSILON;
    std::size_t min_samples    = constants::MIN_EVENT_SAMPLES;
};

struct HarpMetrics {
    double area;        ///< Signed loop area, clockwise positive (NaN if Q flat)
    double residual;    ///< CS_last − CS_first
    double area_lower;  ///< ∫(rise − fall) dQ below the intersection (NaN if none)
    double area_upper;  ///< ∫(rise − fall) dQ above the intersection (NaN if none)
    std::optional<double> intersection_q;  ///< Normalized Q where the limbs cross

    double peak_q;       ///< Scaled time of the Q peak [0, 1]
    double peak_c;       ///< Scaled time of the C peak [0, 1]
    double peak_time_q;  ///< Days from event start to the Q peak
    double peak_time_c;  ///< Days from event start to the C peak
    double radius_equiv; ///< √(|area| / π)

    LoopDirection direction;
};

class HarpCalculator {
public:
    explicit HarpCalculator(HarpConfig config = HarpConfig{}) noexcept;

    /// # Throws
    /// `ConfigurationError` on mismatched lengths or decreasing time.
    ///
    /// # Returns
    /// InsufficientData below `min_samples`. A flat Q series is not an
    /// error: the direction is Undefined and area and Q-peak fields are NaN.
    [[nodiscard]] MetricResult<HarpMetrics> compute(const Event& event) const;

    [[nodiscard]] const HarpConfig& config() const noexcept { return config_; }

private:
    HarpConfig config_;
};

// ─── Zuecco ───────────────────────────────────────────────────────────────────
//
// Zuecco et al. (2016). Both limbs are interpolated onto the fixed normalized-Q
// grid x = linspace(0.15, 1.0, 18). For each interval between consecutive
// valid grid points:
//   ΔA_j = trap(rise, x_j, x_{j+1}) − trap(fall, x_j, x_{j+1})
// and h = Σ ΔA_j.
//
// Class 0 for |h| < epsilon; otherwise f = |h| / (grid span) graded in
// quartiles: 1–4 for h > 0 (clockwise), 5–8 for h < 0 (counter-clockwise).

struct ZueccoConfig {
    double      zero_epsilon = constants::ZUECCO_ZERO_EPSILON;
    double      grid_start   = constants::ZUECCO_GRID_START;
    double      grid_end     = constants::ZUECCO_GRID_END;
    std::size_t grid_points  = constants::ZUECCO_GRID_POINTS;
    std::size_t min_samples  = constants::MIN_EVENT_SAMPLES;
};

struct ZueccoMetrics {
    double h_index;
    int    hyst_class;     ///< 0–8, quartile grading of h
    int    pattern_class;  ///< 0–8, published nine-pattern scheme
    double min_diff_area;
    double max_diff_area;

    std::vector<double>                grid;       ///< Normalized Q grid
    std::vector<std::optional<double>> rising;     ///< Rising-limb C at each grid point
    std::vector<std::optional<double>> falling;    ///< Falling-limb C at each grid point
    std::vector<double>                diff_area;  ///< ΔA per valid interval
};

class ZueccoCalculator {
public:
    explicit ZueccoCalculator(ZueccoConfig config = ZueccoConfig{}) noexcept;

    /// # Throws
    /// `ConfigurationError` on mismatched lengths or decreasing time.
    ///
    /// # Returns
    /// InsufficientData below `min_samples`; UndefinedMetric for flat Q, a
    /// limb with fewer than 2 distinct points, or fewer than 2 grid points
    /// covered by both limbs.
    [[nodiscard]] MetricResult<ZueccoMetrics> compute(const Event& event) const;

    [[nodiscard]] const ZueccoConfig& config() const noexcept { return config_; }

private:
    ZueccoConfig config_;
};

/// Published Zuecco (2016) pattern from the differential-area extremes and
/// the change of C along the rising limb (falling limb if the rising limb is
/// inconclusive). `c_scaled` is the normalized, time-ordered C series.
[[nodiscard]] int zuecco_pattern_class(const std::vector<double>& c_scaled,
                                       std::size_t peak_q,
                                       double min_diff_area,
                                       double max_diff_area,
                                       double h_index) noexcept;

// ─── Lawler / Lloyd ───────────────────────────────────────────────────────────
//
// Lawler et al. (2006), Lloyd et al. (2016). C is sampled on each limb at the
// normalized Q percentiles 0.1 … 0.9:
//   HInew = (C_rise − C_fall) / max(C_rise, C_fall)     ∈ [−1, 1], 0 if max = 0
//   HIL   =  C_rise / C_fall − 1       if C_rise > C_fall
//         = −C_fall / C_rise + 1       if C_rise < C_fall
//         =  0                         if equal
// HIL is undefined when its divisor is zero.

struct LloydConfig {
    std::size_t min_samples = constants::MIN_EVENT_SAMPLES;
};

struct LloydSample {
    double percentile;              ///< Normalized Q
    std::optional<double> c_rise;
    std::optional<double> c_fall;
    std::optional<double> hi_new;
    std::optional<double> hi_lawler;
};

struct LloydMetrics {
    double mean_hi_new;      ///< NaN if no percentile is in range
    double median_hi_new;
    double range_hi_new;
    double mean_abs_hi_new;
    double mean_hil;
    double median_hil;
    double range_hil;
    std::size_t n_valid;     ///< Percentiles with a defined HInew

    std::vector<LloydSample> samples;
};

/// HInew for one percentile.
[[nodiscard]] double hi_new(double c_rise, double c_fall) noexcept;

/// HIL for one percentile; `nullopt` when the divisor is zero.
[[nodiscard]] std::optional<double> hi_lawler(double c_rise, double c_fall) noexcept;

class LloydCalculator {
public:
    explicit LloydCalculator(LloydConfig config = LloydConfig{}) noexcept;

    /// # Throws
    /// `ConfigurationError` on mismatched lengths or decreasing time.
    ///
    /// # Returns
    /// InsufficientData below `min_samples`; UndefinedMetric for flat Q.
    /// Percentiles outside a limb are excluded; if none remain the summary
    /// statistics are NaN and the call still succeeds.
    [[nodiscard]] MetricResult<LloydMetrics> compute(const Event& event) const;

    [[nodiscard]] const LloydConfig& config() const noexcept { return config_; }

private:
    LloydConfig config_;
};

}  // namespace cqhyst::hysteresis
