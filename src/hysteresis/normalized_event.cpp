/// @file src/hysteresis/normalized_event.cpp
/// @brief Event normalization and limb interpolation.

#include "normalized_event.hpp"

#include "cqhyst/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace cqhyst::hysteresis::detail {

std::vector<double> min_max_scale(std::span<const double> values) {
    std::vector<double> out(values.size(), 0.0);
    if (values.empty()) return out;

    const auto [lo_it, hi_it] = std::minmax_element(values.begin(), values.end());
    const double lo = *lo_it;
    const double range = *hi_it - lo;
    if (!std::isfinite(range) || range < constants::FLAT_RANGE_EPSILON) return out;

    for (std::size_t i = 0; i < values.size(); ++i) {
        out[i] = (values[i] - lo) / range;
    }
    return out;
}

std::size_t first_argmax(std::span<const double> values) noexcept {
    std::size_t best = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[best]) best = i;
    }
    return best;
}

namespace {

[[nodiscard]] bool is_flat(std::span<const double> values) noexcept {
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    const double range = *hi - *lo;
    return !std::isfinite(range) || range < constants::FLAT_RANGE_EPSILON;
}

}  // namespace

MetricResult<NormalizedEvent>
normalize_event(const Event& event, std::size_t min_samples) {
    validate_event(event);
    const Event clean = event.finite_rows();

    if (clean.size() < min_samples || clean.size() == 0) {
        return MetricError{
            ErrorKind::InsufficientData,
            fmt::format("insufficient data: {} usable samples, need at least {}",
                        clean.size(), min_samples)};
    }

    NormalizedEvent out;
    out.time.resize(clean.size());
    const double t0 = clean.time.front();
    std::transform(clean.time.begin(), clean.time.end(), out.time.begin(),
                   [t0](double t) { return t - t0; });

    out.time_s = min_max_scale(clean.time);
    out.q_s    = min_max_scale(clean.discharge);
    out.c_s    = min_max_scale(clean.concentration);
    out.peak_q = first_argmax(clean.discharge);
    out.peak_c = first_argmax(clean.concentration);
    out.q_flat = is_flat(clean.discharge);
    out.c_flat = is_flat(clean.concentration);
    return out;
}

// ─── Limb ─────────────────────────────────────────────────────────────────────

Limb::Limb(std::span<const double> q, std::span<const double> c) {
    const std::size_t n = std::min(q.size(), c.size());
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&q](std::size_t a, std::size_t b) { return q[a] < q[b]; });

    q_.reserve(n);
    c_.reserve(n);
    for (std::size_t idx : order) {
        if (!q_.empty() && q[idx] == q_.back()) continue;  // keep first occurrence
        q_.push_back(q[idx]);
        c_.push_back(c[idx]);
    }
}

std::optional<double> Limb::at(double q) const noexcept {
    if (q_.size() < 2 || !(q >= q_.front() && q <= q_.back())) {
        return std::nullopt;
    }
    const auto it = std::lower_bound(q_.begin(), q_.end(), q);
    const auto hi = static_cast<std::size_t>(it - q_.begin());
    if (q_[hi] == q) return c_[hi];

    const std::size_t lo = hi - 1;
    const double w = (q - q_[lo]) / (q_[hi] - q_[lo]);
    return c_[lo] + w * (c_[hi] - c_[lo]);
}

Limbs split_limbs(const NormalizedEvent& event) {
    const std::span<const double> q(event.q_s);
    const std::span<const double> c(event.c_s);
    const std::size_t peak = event.peak_q;
    return Limbs{
        .rising  = Limb(q.first(peak + 1), c.first(peak + 1)),
        .falling = Limb(q.subspan(peak), c.subspan(peak)),
    };
}

}  // namespace cqhyst::hysteresis::detail
