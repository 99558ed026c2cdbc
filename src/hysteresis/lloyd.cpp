/// @file src/hysteresis/lloyd.cpp
/// @brief Lawler (HIL) and Lloyd (HInew) percentile hysteresis indices.

#include "cqhyst/hysteresis.hpp"
#include "cqhyst/thresholds.hpp"

#include "normalized_event.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>
#include <variant>

namespace cqhyst::hysteresis {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

constexpr std::array<double, 9> PERCENTILES{0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8, 0.9};

struct Summary {
    double mean   = NaN;
    double median = NaN;
    double range  = NaN;
};

/// Mean, median and range of the defined values; all NaN for an empty set.
[[nodiscard]] Summary summarize(const std::vector<double>& values) {
    Summary s;
    if (values.empty()) return s;
    double sum = 0.0;
    for (double v : values) sum += v;
    s.mean = sum / static_cast<double>(values.size());
    s.median = stats::quantile(values, 0.5).value_or(NaN);
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    s.range = *hi - *lo;
    return s;
}

}  // namespace

double hi_new(double c_rise, double c_fall) noexcept {
    const double c_mid = std::max(c_rise, c_fall);
    if (c_mid == 0.0) return 0.0;
    return (c_rise - c_fall) / c_mid;
}

std::optional<double> hi_lawler(double c_rise, double c_fall) noexcept {
    if (c_rise == c_fall) return 0.0;
    if (c_rise > c_fall) {
        if (c_fall == 0.0) return std::nullopt;
        return c_rise / c_fall - 1.0;
    }
    if (c_rise == 0.0) return std::nullopt;
    return -c_fall / c_rise + 1.0;
}

LloydCalculator::LloydCalculator(LloydConfig config) noexcept : config_(config) {}

MetricResult<LloydMetrics> LloydCalculator::compute(const Event& event) const {
    auto normalized = detail::normalize_event(event, config_.min_samples);
    if (auto* err = std::get_if<MetricError>(&normalized)) return std::move(*err);
    const auto& ev = std::get<detail::NormalizedEvent>(normalized);

    if (ev.q_flat) {
        return MetricError{ErrorKind::UndefinedMetric,
                           "flat discharge: no peak to split rising and falling limbs"};
    }
    const auto limbs = detail::split_limbs(ev);

    LloydMetrics m{};
    m.samples.reserve(PERCENTILES.size());
    std::vector<double> new_values;
    std::vector<double> abs_values;
    std::vector<double> hil_values;

    for (double p : PERCENTILES) {
        LloydSample s{.percentile = p,
                      .c_rise     = limbs.rising.at(p),
                      .c_fall     = limbs.falling.at(p),
                      .hi_new     = std::nullopt,
                      .hi_lawler  = std::nullopt};
        if (s.c_rise && s.c_fall) {
            s.hi_new    = hi_new(*s.c_rise, *s.c_fall);
            s.hi_lawler = hi_lawler(*s.c_rise, *s.c_fall);
            new_values.push_back(*s.hi_new);
            abs_values.push_back(std::abs(*s.hi_new));
            if (s.hi_lawler) hil_values.push_back(*s.hi_lawler);
        }
        m.samples.push_back(s);
    }

    const Summary hn  = summarize(new_values);
    const Summary hab = summarize(abs_values);
    const Summary hil = summarize(hil_values);
    m.mean_hi_new     = hn.mean;
    m.median_hi_new   = hn.median;
    m.range_hi_new    = hn.range;
    m.mean_abs_hi_new = hab.mean;
    m.mean_hil        = hil.mean;
    m.median_hil      = hil.median;
    m.range_hil       = hil.range;
    m.n_valid         = new_values.size();
    return m;
}

}  // namespace cqhyst::hysteresis
