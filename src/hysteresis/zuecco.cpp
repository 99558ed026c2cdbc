/// @file src/hysteresis/zuecco.cpp
/// @brief Zuecco differential-area hysteresis index and classes.

#include "cqhyst/hysteresis.hpp"

#include "normalized_event.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <variant>

namespace cqhyst::hysteresis {

namespace {

[[nodiscard]] std::vector<double> linspace(double start, double end, std::size_t n) {
    std::vector<double> out(n);
    if (n == 1) {
        out[0] = start;
        return out;
    }
    const double step = (end - start) / static_cast<double>(n - 1);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = start + step * static_cast<double>(i);
    }
    out.back() = end;
    return out;
}

/// Quartile grading of |h| relative to the largest attainable |h|.
[[nodiscard]] int strength_class(double h, double span, double zero_epsilon) noexcept {
    if (std::abs(h) < zero_epsilon) return 0;
    const double fraction = span > 0.0 ? std::abs(h) / span : 1.0;
    const int grade = std::min(3, static_cast<int>(std::floor(fraction * 4.0)));
    return h > 0.0 ? 1 + grade : 5 + grade;
}

[[nodiscard]] int determine_pattern(double min_diff_area,
                                    double max_diff_area,
                                    double h_index,
                                    double change_max,
                                    double change_min) noexcept {
    // 1–4 when C rises from its start value, 5–8 when it falls.
    const int base = change_max > change_min ? 1 : 5;
    if (min_diff_area > 0.0 && max_diff_area > 0.0) return base;
    if (min_diff_area < 0.0 && max_diff_area < 0.0) return base + 3;
    if (min_diff_area <= 0.0 && max_diff_area > 0.0 && h_index >= 0.0) return base + 1;
    if (min_diff_area < 0.0 && max_diff_area >= 0.0 && h_index < 0.0) return base + 2;
    return 0;
}

struct Excursion {
    double change_max;  ///< |max − start|
    double change_min;  ///< |min − start|
};

[[nodiscard]] Excursion excursion(const std::vector<double>& c,
                                  std::size_t first, std::size_t last) noexcept {
    const auto [lo, hi] = std::minmax_element(c.begin() + static_cast<std::ptrdiff_t>(first),
                                              c.begin() + static_cast<std::ptrdiff_t>(last) + 1);
    return {std::abs(*hi - c.front()), std::abs(*lo - c.front())};
}

}  // namespace

int zuecco_pattern_class(const std::vector<double>& c_scaled,
                         std::size_t peak_q,
                         double min_diff_area,
                         double max_diff_area,
                         double h_index) noexcept {
    if (c_scaled.empty() || peak_q >= c_scaled.size()) return 0;

    const auto rise = excursion(c_scaled, 0, peak_q);
    if (rise.change_max != rise.change_min) {
        return determine_pattern(min_diff_area, max_diff_area, h_index,
                                 rise.change_max, rise.change_min);
    }
    const auto fall = excursion(c_scaled, peak_q, c_scaled.size() - 1);
    if (fall.change_max != fall.change_min) {
        return determine_pattern(min_diff_area, max_diff_area, h_index,
                                 fall.change_max, fall.change_min);
    }
    return 0;
}

ZueccoCalculator::ZueccoCalculator(ZueccoConfig config) noexcept : config_(config) {}

MetricResult<ZueccoMetrics> ZueccoCalculator::compute(const Event& event) const {
    auto normalized = detail::normalize_event(event, config_.min_samples);
    if (auto* err = std::get_if<MetricError>(&normalized)) return std::move(*err);
    const auto& ev = std::get<detail::NormalizedEvent>(normalized);

    if (ev.q_flat) {
        return MetricError{ErrorKind::UndefinedMetric,
                           "flat discharge: no peak to split rising and falling limbs"};
    }

    const auto limbs = detail::split_limbs(ev);
    if (limbs.rising.size() < 2 || limbs.falling.size() < 2) {
        return MetricError{
            ErrorKind::UndefinedMetric,
            fmt::format("limb with fewer than 2 distinct discharge values "
                        "(rising={}, falling={})",
                        limbs.rising.size(), limbs.falling.size())};
    }

    ZueccoMetrics m{};
    m.grid = linspace(config_.grid_start, config_.grid_end, config_.grid_points);
    m.rising.reserve(m.grid.size());
    m.falling.reserve(m.grid.size());

    std::vector<double> x;
    std::vector<double> rise;
    std::vector<double> fall;
    for (double g : m.grid) {
        const auto r = limbs.rising.at(g);
        const auto f = limbs.falling.at(g);
        m.rising.push_back(r);
        m.falling.push_back(f);
        if (r && f) {
            x.push_back(g);
            rise.push_back(*r);
            fall.push_back(*f);
        }
    }
    if (x.size() < 2) {
        return MetricError{
            ErrorKind::UndefinedMetric,
            fmt::format("only {} grid points covered by both limbs", x.size())};
    }

    m.diff_area.reserve(x.size() - 1);
    for (std::size_t j = 0; j + 1 < x.size(); ++j) {
        const double dx = x[j + 1] - x[j];
        const double rise_trap = (rise[j] + rise[j + 1]) * dx / 2.0;
        const double fall_trap = (fall[j] + fall[j + 1]) * dx / 2.0;
        m.diff_area.push_back(rise_trap - fall_trap);
    }

    double h = 0.0;
    for (double a : m.diff_area) h += a;
    m.h_index = h;

    const auto [lo, hi] = std::minmax_element(m.diff_area.begin(), m.diff_area.end());
    m.min_diff_area = *lo;
    m.max_diff_area = *hi;

    m.hyst_class = strength_class(h, config_.grid_end - config_.grid_start,
                                  config_.zero_epsilon);
    m.pattern_class = zuecco_pattern_class(ev.c_s, ev.peak_q,
                                           m.min_diff_area, m.max_diff_area, h);
    return m;
}

}  // namespace cqhyst::hysteresis
