/// @file src/hysteresis/harp.cpp
/// @brief HARP loop area, residual, limb intersection and peak timing.

#include "cqhyst/hysteresis.hpp"

#include "normalized_event.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <utility>
#include <variant>

namespace cqhyst::hysteresis {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Shoelace area of the closed polygon, sign flipped so clockwise > 0.
[[nodiscard]] double clockwise_area(const std::vector<double>& x,
                                    const std::vector<double>& y) noexcept {
    const std::size_t n = x.size();
    double twice = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t j = (i + 1) % n;
        twice += x[i] * y[j] - x[j] * y[i];
    }
    return -0.5 * twice;
}

struct GridPoint {
    double q;
    double diff;  ///< rise − fall
};

/// rise − fall on the merged Q axis of both limbs, where both are defined.
[[nodiscard]] std::vector<GridPoint> merged_difference(const detail::Limbs& limbs) {
    std::vector<double> axis = limbs.rising.q();
    axis.insert(axis.end(), limbs.falling.q().begin(), limbs.falling.q().end());
    std::sort(axis.begin(), axis.end());
    axis.erase(std::unique(axis.begin(), axis.end()), axis.end());

    std::vector<GridPoint> out;
    out.reserve(axis.size());
    for (double q : axis) {
        const auto rise = limbs.rising.at(q);
        const auto fall = limbs.falling.at(q);
        if (rise && fall) out.push_back({q, *rise - *fall});
    }
    return out;
}

/// Q of the first strict sign change of rise − fall, linearly located.
[[nodiscard]] std::optional<double>
first_crossing(const std::vector<GridPoint>& grid) noexcept {
    std::optional<std::size_t> last_nonzero;
    for (std::size_t i = 0; i < grid.size(); ++i) {
        if (grid[i].diff == 0.0) continue;
        if (last_nonzero) {
            const GridPoint& a = grid[*last_nonzero];
            const GridPoint& b = grid[i];
            if ((a.diff > 0.0) != (b.diff > 0.0)) {
                const double w = a.diff / (a.diff - b.diff);
                return a.q + w * (b.q - a.q);
            }
        }
        last_nonzero = i;
    }
    return std::nullopt;
}

struct SplitArea {
    double lower;
    double upper;
};

/// Trapezoidal ∫(rise − fall) dQ split at `xq` (the difference is zero there).
[[nodiscard]] SplitArea split_area(const std::vector<GridPoint>& grid, double xq) noexcept {
    SplitArea out{0.0, 0.0};
    for (std::size_t i = 0; i + 1 < grid.size(); ++i) {
        const GridPoint& a = grid[i];
        const GridPoint& b = grid[i + 1];
        if (b.q <= xq) {
            out.lower += 0.5 * (a.diff + b.diff) * (b.q - a.q);
        } else if (a.q >= xq) {
            out.upper += 0.5 * (a.diff + b.diff) * (b.q - a.q);
        } else {
            out.lower += 0.5 * a.diff * (xq - a.q);
            out.upper += 0.5 * b.diff * (b.q - xq);
        }
    }
    return out;
}

[[nodiscard]] LoopDirection classify_loop(double area,
                                          std::size_t peak_q,
                                          std::size_t peak_c,
                                          double linear_epsilon) noexcept {
    if (std::abs(area) < linear_epsilon) return LoopDirection::Linear;
    if (area > 0.0 && peak_c <= peak_q)  return LoopDirection::Clockwise;
    if (area < 0.0 && peak_c >= peak_q)  return LoopDirection::CounterClockwise;
    return LoopDirection::Complex;
}

}  // namespace

std::string_view to_string(LoopDirection direction) noexcept {
    switch (direction) {
        case LoopDirection::Linear:           return "linear";
        case LoopDirection::Clockwise:        return "clockwise";
        case LoopDirection::CounterClockwise: return "counter-clockwise";
        case LoopDirection::Complex:          return "complex";
        case LoopDirection::Undefined:        return "undefined";
    }
    return "undefined";
}

HarpCalculator::HarpCalculator(HarpConfig config) noexcept : config_(config) {}

MetricResult<HarpMetrics> HarpCalculator::compute(const Event& event) const {
    auto normalized = detail::normalize_event(event, config_.min_samples);
    if (auto* err = std::get_if<MetricError>(&normalized)) return std::move(*err);
    const auto& ev = std::get<detail::NormalizedEvent>(normalized);

    HarpMetrics m{
        .area           = NaN,
        .residual       = ev.c_s.back() - ev.c_s.front(),
        .area_lower     = NaN,
        .area_upper     = NaN,
        .intersection_q = std::nullopt,
        .peak_q         = NaN,
        .peak_c         = ev.time_s[ev.peak_c],
        .peak_time_q    = NaN,
        .peak_time_c    = ev.time[ev.peak_c],
        .radius_equiv   = NaN,
        .direction      = LoopDirection::Undefined,
    };
    if (ev.q_flat) return m;

    m.peak_q      = ev.time_s[ev.peak_q];
    m.peak_time_q = ev.time[ev.peak_q];
    m.area        = clockwise_area(ev.q_s, ev.c_s);
    m.radius_equiv = std::sqrt(std::abs(m.area) / std::numbers::pi);

    const auto limbs = detail::split_limbs(ev);
    const auto grid  = merged_difference(limbs);
    m.intersection_q = first_crossing(grid);
    if (m.intersection_q) {
        const auto split = split_area(grid, *m.intersection_q);
        m.area_lower = split.lower;
        m.area_upper = split.upper;
    }

    m.direction = classify_loop(m.area, ev.peak_q, ev.peak_c, config_.linear_epsilon);
    return m;
}

}  // namespace cqhyst::hysteresis
