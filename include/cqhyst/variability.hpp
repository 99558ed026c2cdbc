#pragma once

/// @file include/cqhyst/variability.hpp
/// @brief Variability-Ratio Analyzer: rolling CVc/CVq (Musolff et al. 2015).
///
/// # Module: Variability Ratio
///
/// ## Formula
/// For each rolling window of `window` samples:
///   CV_Q = σ_Q / μ_Q,  CV_C = σ_C / μ_C,  ratio = CV_C / CV_Q
/// with Bessel-corrected (n − 1) sample standard deviations over the
/// finite (Q, C) pairs of the window.
///
/// ## Edge Cases
/// - Fewer than 2 finite pairs → ratio undefined
/// - μ_Q = 0, μ_C = 0 or CV_Q = 0 → undefined (never a division fault)
///
/// ## Interpretation (output convention only)
///   ratio > 1  chemodynamic
///   ratio < 1  chemostatic

#include "cqhyst/constants.hpp"
#include "cqhyst/slope.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace cqhyst::stats {

/// Statistics of one rolling window, keyed by its end sample.
struct VariabilityWindow {
    std::size_t window_id;   ///< 0 for the first full window
    std::size_t end_index;   ///< Index of the last sample in the series
    double      start_time;
    double      end_time;
    std::size_t n_samples;   ///< Finite (Q, C) pairs in the window

    std::optional<double>      cv_q;
    std::optional<double>      cv_c;
    std::optional<double>      ratio;  ///< CV_C / CV_Q
    std::optional<PowerLawFit> slope;  ///< Log-log fit over the same window
};

/// Sample coefficient of variation σ/μ over the finite values.
///
/// # Returns
/// `nullopt` for fewer than 2 finite values or μ = 0.
[[nodiscard]] std::optional<double>
coefficient_of_variation(std::span<const double> values) noexcept;

/// CV_C / CV_Q over one window of aligned samples.
///
/// # Throws
/// `ConfigurationError` if the spans differ in length.
[[nodiscard]] std::optional<double>
cv_ratio(std::span<const double> discharge, std::span<const double> concentration);

/// Rolling CVc/CVq and log-log slope, one entry per window end index
/// (index ≥ window − 1).
///
/// # Throws
/// `ConfigurationError` on mismatched lengths or `window` < 2.
[[nodiscard]] std::vector<VariabilityWindow>
rolling_variability(std::span<const double> time,
                    std::span<const double> discharge,
                    std::span<const double> concentration,
                    std::size_t window = constants::DEFAULT_CV_WINDOW);

}  // namespace cqhyst::stats
