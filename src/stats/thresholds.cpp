/// @file src/stats/thresholds.cpp
/// @brief ThresholdCalculator and quantile helpers.

#include "cqhyst/thresholds.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace cqhyst::stats {

namespace {

[[nodiscard]] std::vector<double> sorted_finite(std::span<const double> values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) out.push_back(v);
    }
    std::sort(out.begin(), out.end());
    return out;
}

/// Quantile of an already sorted, finite, non-empty vector.
[[nodiscard]] double sorted_quantile(const std::vector<double>& sorted, double p) noexcept {
    const double h  = p * static_cast<double>(sorted.size() - 1);
    const auto   lo = static_cast<std::size_t>(std::floor(h));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

[[nodiscard]] std::vector<double> absolute(const std::vector<double>& sorted) {
    std::vector<double> out(sorted.size());
    std::transform(sorted.begin(), sorted.end(), out.begin(),
                   [](double v) { return std::abs(v); });
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

// ─── Position ─────────────────────────────────────────────────────────────────

std::string_view to_string(Position position) noexcept {
    switch (position) {
        case Position::Low:    return "low";
        case Position::Medium: return "medium";
        case Position::High:   return "high";
    }
    return "medium";
}

Position position(double value, double low, double high) noexcept {
    if (value < low)  return Position::Low;
    if (value > high) return Position::High;
    return Position::Medium;
}

// ─── quantile / percentile_rank ───────────────────────────────────────────────

std::optional<double> quantile(std::span<const double> values, double p) {
    if (!(p >= 0.0 && p <= 1.0)) return std::nullopt;
    const auto sorted = sorted_finite(values);
    if (sorted.empty()) return std::nullopt;
    return sorted_quantile(sorted, p);
}

std::optional<double> percentile_rank(std::span<const double> population,
                                      double value) noexcept {
    if (!std::isfinite(value)) return std::nullopt;
    std::size_t n = 0;
    std::size_t less = 0;
    std::size_t equal = 0;
    for (double v : population) {
        if (!std::isfinite(v)) continue;
        ++n;
        if (v < value)       ++less;
        else if (v == value) ++equal;
    }
    if (n == 0) return std::nullopt;
    return 100.0 * (static_cast<double>(less) + 0.5 * static_cast<double>(equal))
           / static_cast<double>(n);
}

// ─── ThresholdCalculator ──────────────────────────────────────────────────────

ThresholdCalculator::ThresholdCalculator(ThresholdConfig config) noexcept
    : config_(config) {}

MetricResult<ThresholdSet>
ThresholdCalculator::compute(const ThresholdPopulation& population) const {
    const auto flow = sorted_finite(population.flow);
    const auto conc = sorted_finite(population.concentration);
    const auto dq   = sorted_finite(population.flow_diff);
    const auto dc   = sorted_finite(population.conc_diff);

    const std::size_t smallest =
        std::min({flow.size(), conc.size(), dq.size(), dc.size()});
    if (smallest < config_.min_population || smallest == 0) {
        return MetricError{
            ErrorKind::InsufficientData,
            fmt::format("threshold population too small: flow={}, conc={}, "
                        "dQ={}, dC={} (need >= {})",
                        flow.size(), conc.size(), dq.size(), dc.size(),
                        config_.min_population)};
    }

    const auto abs_dq = absolute(dq);
    const auto abs_dc = absolute(dc);

    ThresholdSet t{};
    t.q_p25 = sorted_quantile(flow, 0.25);
    t.q_p33 = sorted_quantile(flow, 0.33);
    t.q_p50 = sorted_quantile(flow, 0.50);
    t.q_p67 = sorted_quantile(flow, 0.67);
    t.q_p75 = sorted_quantile(flow, 0.75);

    t.c_p25 = sorted_quantile(conc, 0.25);
    t.c_p50 = sorted_quantile(conc, 0.50);
    t.c_p75 = sorted_quantile(conc, 0.75);

    t.dc_p01 = sorted_quantile(dc, 0.01);
    t.dc_p05 = sorted_quantile(dc, 0.05);
    t.dc_p08 = sorted_quantile(dc, 0.08);
    t.dc_p10 = sorted_quantile(dc, 0.10);
    t.dc_p25 = sorted_quantile(dc, 0.25);
    t.dc_p50 = sorted_quantile(dc, 0.50);
    t.dc_p75 = sorted_quantile(dc, 0.75);
    t.dc_p90 = sorted_quantile(dc, 0.90);
    t.dc_p95 = sorted_quantile(dc, 0.95);

    t.dq_p05 = sorted_quantile(dq, 0.05);
    t.dq_p10 = sorted_quantile(dq, 0.10);
    t.dq_p25 = sorted_quantile(dq, 0.25);
    t.dq_p50 = sorted_quantile(dq, 0.50);
    t.dq_p75 = sorted_quantile(dq, 0.75);
    t.dq_p90 = sorted_quantile(dq, 0.90);

    t.abs_dc_p50 = sorted_quantile(abs_dc, 0.50);
    t.abs_dc_p75 = sorted_quantile(abs_dc, 0.75);
    t.abs_dq_p50 = sorted_quantile(abs_dq, 0.50);
    t.abs_dq_p75 = sorted_quantile(abs_dq, 0.75);

    t.slope_directional = config_.slope_directional;
    t.slope_chemostatic = config_.slope_chemostatic;
    t.cv_ratio_cut      = config_.cv_ratio_cut;
    t.cv_ratio_low      = config_.cv_ratio_low;
    t.population_size   = flow.size();

    spdlog::debug("thresholds: dC steep < {:.4g} (p08), large increase > {:.4g} (p90); "
                  "dQ decline < {:.4g} (p25), increase > {:.4g} (p75)",
                  t.dc_p08, t.dc_p90, t.dq_p25, t.dq_p75);
    return t;
}

}  // namespace cqhyst::stats
