#pragma once

/// @file include/cqhyst/slope.hpp
/// @brief C-Q Slope Estimator: power-law exponent b in C = a·Q^b.
///
/// # Module: Slope Estimator
///
/// ## Formula
/// Ordinary least squares of ln C on ln Q:
///   ln C = ln a + b · ln Q
/// solved with a column-pivoting Householder QR of the n×2 design matrix.
///
/// ## Interpretation
///   b > +0.15   dilution / flushing signature
///   b < −0.15   enrichment / loading signature
///   |b| < 0.10  chemostatic
///   otherwise   ambiguous, contributes no directional rule
///
/// ## Edge Cases
/// - Pairs with Q ≤ 0, C ≤ 0 or non-finite values are excluded before the log
/// - Fewer than 3 valid pairs → `nullopt` (undefined, not an error)
/// - All valid ln Q equal (rank-deficient design) → `nullopt`

#include "cqhyst/constants.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace cqhyst::stats {

// ─── PowerLawFit ──────────────────────────────────────────────────────────────

struct PowerLawFit {
    double      slope;      ///< b
    double      intercept;  ///< ln a
    double      r_squared;  ///< Coefficient of determination; NaN if ln C is constant
    std::size_t n_used;     ///< Valid pairs entering the regression

    /// a = exp(intercept)
    [[nodiscard]] double prefactor() const noexcept { return std::exp(intercept); }
};

/// Fit C = a·Q^b over the valid pairs of a window.
///
/// # Throws
/// `ConfigurationError` if `discharge` and `concentration` differ in length.
[[nodiscard]] std::optional<PowerLawFit>
fit_power_law(std::span<const double> discharge,
              std::span<const double> concentration,
              std::size_t min_pairs = constants::MIN_SLOPE_PAIRS);

/// Least-squares slope of y on x over finite pairs (≥ 2 pairs, x not constant).
[[nodiscard]] std::optional<double>
linear_trend(std::span<const double> x, std::span<const double> y);

// ─── Point-to-point slope ─────────────────────────────────────────────────────

enum class SlopeKind {
    LogLog,  ///< Δlog10 C / Δlog10 Q
    Linear,  ///< ΔC / ΔQ
};

/// Local C-Q slope between two consecutive samples.
///
/// # Returns
/// `nullopt` for non-finite input, non-positive values (LogLog), or a
/// vanishing denominator.
[[nodiscard]] std::optional<double>
point_slope(double q1, double q2, double c1, double c2,
            SlopeKind kind = SlopeKind::LogLog) noexcept;

// ─── Signature ────────────────────────────────────────────────────────────────

enum class SlopeSignature { Flushing, Loading, Chemostatic, Ambiguous, Unknown };

[[nodiscard]] std::string_view to_string(SlopeSignature signature) noexcept;

[[nodiscard]] SlopeSignature
classify_slope(std::optional<double> slope,
               double directional = constants::SLOPE_DIRECTIONAL,
               double chemostatic = constants::SLOPE_CHEMOSTATIC) noexcept;

}  // namespace cqhyst::stats
