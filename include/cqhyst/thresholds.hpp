#pragma once

/// @file include/cqhyst/thresholds.hpp
/// @brief Percentile-Threshold Calculator.
///
/// # Module: Percentile Thresholds
///
/// ## Responsibility
/// Derive the cut points used by the phase classifier from the distribution
/// of the segment population being classified together. Cut points are never
/// absolute values, so the same rules work for compounds whose concentration
/// ranges differ by orders of magnitude.
///
/// ## Quantile Definition
/// Linear interpolation between order statistics:
///   h = p·(n − 1),  Q(p) = x[⌊h⌋] + (h − ⌊h⌋)·(x[⌊h⌋+1] − x[⌊h⌋])
/// over the sorted finite values. Deterministic for identical input.
///
/// ## Guarantees
/// - Non-finite values are ignored, never propagated
/// - A population below the configured minimum yields InsufficientData
/// - The returned ThresholdSet is a plain value: immutable once computed

#include "cqhyst/constants.hpp"
#include "cqhyst/errors.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cqhyst::stats {

// ─── Population ───────────────────────────────────────────────────────────────

/// Observations pooled over every segment of one classification run.
struct ThresholdPopulation {
    std::vector<double> flow;           ///< Absolute Q values
    std::vector<double> concentration;  ///< Absolute C values
    std::vector<double> flow_diff;      ///< ΔQ between consecutive samples
    std::vector<double> conc_diff;      ///< ΔC between consecutive samples
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct ThresholdConfig {
    /// Minimum finite values in each sub-population.
    std::size_t min_population = constants::MIN_THRESHOLD_POPULATION;

    // Fixed bands copied into every ThresholdSet.
    double slope_directional = constants::SLOPE_DIRECTIONAL;
    double slope_chemostatic = constants::SLOPE_CHEMOSTATIC;
    double cv_ratio_cut      = constants::CV_RATIO_CUT;
    double cv_ratio_low      = constants::CV_RATIO_LOW;
};

// ─── ThresholdSet ─────────────────────────────────────────────────────────────

/// Cut points for one classification run.
struct ThresholdSet {
    // Absolute flow level
    double q_p25, q_p33, q_p50, q_p67, q_p75;
    // Absolute concentration level
    double c_p25, c_p50, c_p75;
    // Concentration change ΔC
    double dc_p01, dc_p05, dc_p08, dc_p10, dc_p25, dc_p50, dc_p75, dc_p90, dc_p95;
    // Flow change ΔQ
    double dq_p05, dq_p10, dq_p25, dq_p50, dq_p75, dq_p90;
    // Magnitudes of change
    double abs_dc_p50, abs_dc_p75, abs_dq_p50, abs_dq_p75;

    // Fixed bands
    double slope_directional;
    double slope_chemostatic;
    double cv_ratio_cut;
    double cv_ratio_low;

    std::size_t population_size;  ///< Finite flow observations used
};

// ─── Position ─────────────────────────────────────────────────────────────────

enum class Position { Low, Medium, High };

[[nodiscard]] std::string_view to_string(Position position) noexcept;

/// Low if value < low, High if value > high, otherwise Medium.
[[nodiscard]] Position position(double value, double low, double high) noexcept;

// ─── Free functions ───────────────────────────────────────────────────────────

/// Linear-interpolation quantile of the finite values, p ∈ [0, 1].
///
/// # Returns
/// `nullopt` if there are no finite values or p is outside [0, 1].
[[nodiscard]] std::optional<double>
quantile(std::span<const double> values, double p);

/// Percentile rank (0–100) of `value` in the population, counting ties as
/// half below: 100·(n_less + 0.5·n_equal)/n.
///
/// # Returns
/// `nullopt` if the population has no finite values or `value` is non-finite.
[[nodiscard]] std::optional<double>
percentile_rank(std::span<const double> population, double value) noexcept;

// ─── ThresholdCalculator ──────────────────────────────────────────────────────

class ThresholdCalculator {
public:
    explicit ThresholdCalculator(ThresholdConfig config = ThresholdConfig{}) noexcept;

    /// Compute all cut points from a population.
    ///
    /// # Returns
    /// InsufficientData if any sub-population (flow, concentration, ΔQ, ΔC)
    /// has fewer than `min_population` finite values.
    [[nodiscard]] MetricResult<ThresholdSet>
    compute(const ThresholdPopulation& population) const;

    [[nodiscard]] const ThresholdConfig& config() const noexcept { return config_; }

private:
    ThresholdConfig config_;
};

}  // namespace cqhyst::stats
