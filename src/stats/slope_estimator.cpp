/// @file src/stats/slope_estimator.cpp
/// @brief Log-log OLS power-law fit and point-to-point C-Q slopes.

#include "cqhyst/slope.hpp"
#include "cqhyst/errors.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace cqhyst::stats {

namespace {

/// Solve y = X·β for a two-column design [1, x].
/// Returns nullopt if the design is rank-deficient.
[[nodiscard]] std::optional<Eigen::Vector2d>
solve_ols(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    Eigen::MatrixXd design(x.size(), 2);
    design.col(0).setOnes();
    design.col(1) = x;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    qr.setThreshold(1e-12);
    if (qr.rank() < 2) {
        return std::nullopt;
    }
    Eigen::Vector2d beta = qr.solve(y);
    if (!beta.allFinite()) return std::nullopt;
    return beta;
}

}  // namespace

// ─── fit_power_law ────────────────────────────────────────────────────────────

std::optional<PowerLawFit>
fit_power_law(std::span<const double> discharge,
              std::span<const double> concentration,
              std::size_t min_pairs) {
    if (discharge.size() != concentration.size()) {
        throw ConfigurationError(fmt::format(
            "slope window has mismatched lengths (Q={}, C={})",
            discharge.size(), concentration.size()));
    }

    std::vector<double> log_q;
    std::vector<double> log_c;
    log_q.reserve(discharge.size());
    log_c.reserve(discharge.size());
    for (std::size_t i = 0; i < discharge.size(); ++i) {
        const double q = discharge[i];
        const double c = concentration[i];
        if (!std::isfinite(q) || !std::isfinite(c) || q <= 0.0 || c <= 0.0) {
            continue;
        }
        log_q.push_back(std::log(q));
        log_c.push_back(std::log(c));
    }

    const std::size_t n = log_q.size();
    if (n < min_pairs || n < 2) return std::nullopt;

    const Eigen::Map<const Eigen::VectorXd> x(log_q.data(), static_cast<Eigen::Index>(n));
    const Eigen::Map<const Eigen::VectorXd> y(log_c.data(), static_cast<Eigen::Index>(n));

    auto beta = solve_ols(x, y);
    if (!beta) return std::nullopt;

    // R² = 1 − SS_res / SS_tot
    const Eigen::VectorXd fitted = ((*beta)(0) + (*beta)(1) * x.array()).matrix();
    const double ss_res = (y - fitted).squaredNorm();
    const double ss_tot = (y.array() - y.mean()).matrix().squaredNorm();
    const double r2 = ss_tot > constants::FLAT_RANGE_EPSILON
                          ? 1.0 - ss_res / ss_tot
                          : std::nan("");

    return PowerLawFit{
        .slope     = (*beta)(1),
        .intercept = (*beta)(0),
        .r_squared = r2,
        .n_used    = n,
    };
}

// ─── linear_trend ─────────────────────────────────────────────────────────────

std::optional<double>
linear_trend(std::span<const double> x, std::span<const double> y) {
    const std::size_t len = std::min(x.size(), y.size());
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(len);
    ys.reserve(len);
    for (std::size_t i = 0; i < len; ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            xs.push_back(x[i]);
            ys.push_back(y[i]);
        }
    }
    if (xs.size() < 2) return std::nullopt;

    const Eigen::Map<const Eigen::VectorXd> xv(xs.data(), static_cast<Eigen::Index>(xs.size()));
    const Eigen::Map<const Eigen::VectorXd> yv(ys.data(), static_cast<Eigen::Index>(ys.size()));
    auto beta = solve_ols(xv, yv);
    if (!beta) return std::nullopt;
    return (*beta)(1);
}

// ─── point_slope ──────────────────────────────────────────────────────────────

std::optional<double>
point_slope(double q1, double q2, double c1, double c2, SlopeKind kind) noexcept {
    if (!std::isfinite(q1) || !std::isfinite(q2) ||
        !std::isfinite(c1) || !std::isfinite(c2)) {
        return std::nullopt;
    }

    if (kind == SlopeKind::Linear) {
        const double dq = q2 - q1;
        if (std::abs(dq) < constants::SLOPE_DELTA_EPSILON) return std::nullopt;
        return (c2 - c1) / dq;
    }

    // log undefined for non-positive values
    if (q1 <= 0.0 || q2 <= 0.0 || c1 <= 0.0 || c2 <= 0.0) return std::nullopt;

    const double dlog_q = std::log10(q2) - std::log10(q1);
    if (std::abs(dlog_q) < constants::SLOPE_DELTA_EPSILON) return std::nullopt;
    const double dlog_c = std::log10(c2) - std::log10(c1);
    return dlog_c / dlog_q;
}

// ─── classify_slope ───────────────────────────────────────────────────────────

std::string_view to_string(SlopeSignature signature) noexcept {
    switch (signature) {
        case SlopeSignature::Flushing:    return "flushing";
        case SlopeSignature::Loading:     return "loading";
        case SlopeSignature::Chemostatic: return "chemostatic";
        case SlopeSignature::Ambiguous:   return "ambiguous";
        case SlopeSignature::Unknown:     return "unknown";
    }
    return "unknown";
}

SlopeSignature classify_slope(std::optional<double> slope,
                              double directional,
                              double chemostatic) noexcept {
    if (!slope || !std::isfinite(*slope)) return SlopeSignature::Unknown;
    if (*slope >  directional)            return SlopeSignature::Flushing;
    if (*slope < -directional)            return SlopeSignature::Loading;
    if (std::abs(*slope) < chemostatic)   return SlopeSignature::Chemostatic;
    return SlopeSignature::Ambiguous;
}

}  // namespace cqhyst::stats
