/// @file src/classify/flow_dynamics.cpp
/// @brief Peak timing, flow phase and trend of a flow window.

#include "cqhyst/flow_dynamics.hpp"
#include "cqhyst/slope.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace cqhyst::classify {

namespace {

constexpr double EARLY_PEAK_FRACTION = 0.33;
constexpr double LATE_PEAK_FRACTION  = 0.67;
constexpr double RECENT_PEAK_FRACTION = 0.3;
constexpr double AT_PEAK_DAYS = 1.0;
constexpr double TREND_BAND = 0.1;

[[nodiscard]] PeakPosition peak_position(double days_to_peak, double duration) noexcept {
    if (duration <= 0.0) return PeakPosition::Middle;
    const double frac = days_to_peak / duration;
    if (frac < EARLY_PEAK_FRACTION) return PeakPosition::Early;
    if (frac > LATE_PEAK_FRACTION)  return PeakPosition::Late;
    return PeakPosition::Middle;
}

[[nodiscard]] FlowPhase flow_phase(const FlowDynamics& d, const FlowLevels& levels) noexcept {
    if (d.days_since_peak < AT_PEAK_DAYS) return FlowPhase::AtPeak;
    if (d.days_since_peak < d.duration * RECENT_PEAK_FRACTION) {
        return d.end_q > levels.p50 ? FlowPhase::EarlyDecline : FlowPhase::LateDecline;
    }
    if (d.days_to_peak < d.duration * RECENT_PEAK_FRACTION) return FlowPhase::PostPeak;
    if (d.peak_position == PeakPosition::Late && d.end_q > d.start_q) return FlowPhase::Rising;
    if (d.level == stats::Position::Low) return FlowPhase::Low;

    if (d.end_q > d.start_q * (1.0 + TREND_BAND)) return FlowPhase::Rising;
    if (d.end_q < d.start_q * (1.0 - TREND_BAND)) {
        return d.level == stats::Position::High ? FlowPhase::EarlyDecline
                                                : FlowPhase::LateDecline;
    }
    return FlowPhase::Stable;
}

}  // namespace

std::string_view to_string(FlowPhase phase) noexcept {
    switch (phase) {
        case FlowPhase::AtPeak:       return "at_peak";
        case FlowPhase::EarlyDecline: return "early_decline";
        case FlowPhase::LateDecline:  return "late_decline";
        case FlowPhase::PostPeak:     return "post_peak";
        case FlowPhase::Rising:       return "rising";
        case FlowPhase::Low:          return "low";
        case FlowPhase::Stable:       return "stable";
    }
    return "stable";
}

std::string_view to_string(PeakPosition position) noexcept {
    switch (position) {
        case PeakPosition::Early:  return "early";
        case PeakPosition::Middle: return "middle";
        case PeakPosition::Late:   return "late";
    }
    return "middle";
}

std::optional<FlowDynamics>
analyze_flow_dynamics(std::span<const double> time,
                      std::span<const double> discharge,
                      const FlowLevels& levels) {
    std::vector<double> t;
    std::vector<double> q;
    const std::size_t n_in = std::min(time.size(), discharge.size());
    t.reserve(n_in);
    q.reserve(n_in);
    for (std::size_t i = 0; i < n_in; ++i) {
        if (std::isfinite(time[i]) && std::isfinite(discharge[i])) {
            t.push_back(time[i]);
            q.push_back(discharge[i]);
        }
    }
    const std::size_t n = q.size();
    if (n < 2) return std::nullopt;

    const auto peak_it = std::max_element(q.begin(), q.end());
    const auto peak = static_cast<std::size_t>(peak_it - q.begin());
    const auto [lo_it, hi_it] = std::minmax_element(q.begin(), q.end());

    FlowDynamics d{};
    d.peak_q          = q[peak];
    d.peak_time       = t[peak];
    d.duration        = t.back() - t.front();
    d.days_to_peak    = t[peak] - t.front();
    d.days_since_peak = t.back() - t[peak];
    d.start_q         = q.front();
    d.end_q           = q.back();
    d.q_range         = *hi_it - *lo_it;
    d.peak_position   = peak_position(d.days_to_peak, d.duration);
    d.level           = stats::position(d.end_q, levels.p25, levels.p75);
    d.phase           = flow_phase(d, levels);

    if (n > 2) {
        d.q_trend = stats::linear_trend(t, q).value_or(0.0);
        const std::size_t mid = n / 2;
        const std::span<const double> ts(t);
        const std::span<const double> qs(q);
        const double first  = mid > 1 ? stats::linear_trend(ts.first(mid), qs.first(mid)).value_or(0.0)
                                      : 0.0;
        const double second = n - mid > 1
                                  ? stats::linear_trend(ts.subspan(mid), qs.subspan(mid)).value_or(0.0)
                                  : 0.0;
        d.q_acceleration = second - first;
    } else {
        d.q_trend = (d.end_q - d.start_q) / std::max(1.0, d.duration);
        d.q_acceleration = 0.0;
    }
    return d;
}

}  // namespace cqhyst::classify
