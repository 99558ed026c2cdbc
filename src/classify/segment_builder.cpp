/// @file src/classify/segment_builder.cpp
/// @brief Site grouping, segmentation, behaviour and trajectory tags.

#include "cqhyst/segments.hpp"
#include "cqhyst/errors.hpp"
#include "cqhyst/slope.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

namespace cqhyst::classify {

namespace {

constexpr double SPAN_EPSILON = 1e-10;

struct Range {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    void add(double v) noexcept {
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    [[nodiscard]] double span() const noexcept { return hi > lo ? hi - lo : 0.0; }
};

}  // namespace

// ─── split_by_site ────────────────────────────────────────────────────────────

std::vector<SiteSeries> split_by_site(const MonitoringSeries& series) {
    std::vector<SiteSeries> sites;
    std::map<std::string, std::size_t> index;
    std::size_t dropped = 0;

    for (const auto& obs : series) {
        if (!std::isfinite(obs.time) || !std::isfinite(obs.flow) ||
            !std::isfinite(obs.concentration)) {
            ++dropped;
            continue;
        }
        auto [it, inserted] = index.try_emplace(obs.site_id, sites.size());
        if (inserted) sites.push_back(SiteSeries{.site_id = obs.site_id});
        auto& site = sites[it->second];
        site.time.push_back(obs.time);
        site.flow.push_back(obs.flow);
        site.concentration.push_back(obs.concentration);
    }
    if (dropped > 0) {
        spdlog::debug("dropped {} observations with non-finite time, flow or concentration",
                      dropped);
    }

    for (auto& site : sites) {
        std::vector<std::size_t> order(site.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&site](std::size_t a, std::size_t b) {
            return site.time[a] < site.time[b];
        });

        SiteSeries sorted{.site_id = site.site_id};
        sorted.time.reserve(order.size());
        sorted.flow.reserve(order.size());
        sorted.concentration.reserve(order.size());
        for (std::size_t i : order) {
            sorted.time.push_back(site.time[i]);
            sorted.flow.push_back(site.flow[i]);
            sorted.concentration.push_back(site.concentration[i]);
        }
        site = std::move(sorted);
    }
    return sites;
}

// ─── Behaviour ────────────────────────────────────────────────────────────────

std::string_view to_string(Behavior behavior) noexcept {
    switch (behavior) {
        case Behavior::Connectivity:     return "connectivity";
        case Behavior::Dispersion:       return "dispersion";
        case Behavior::Accumulation:     return "accumulation";
        case Behavior::Recovery:         return "recovery";
        case Behavior::QuasiChemostatic: return "quasi_chemostatic";
        case Behavior::SourceVariation:  return "source_variation";
        case Behavior::Static:           return "static";
    }
    return "static";
}

Behavior classify_behavior(double flow_diff, double conc_diff,
                           double flow_span, double conc_span,
                           double threshold) noexcept {
    const bool flow_changing =
        flow_span > SPAN_EPSILON && std::abs(flow_diff) > threshold * flow_span;
    const bool conc_changing =
        conc_span > SPAN_EPSILON && std::abs(conc_diff) > threshold * conc_span;

    if (!flow_changing && !conc_changing) return Behavior::Static;
    if (flow_changing && !conc_changing)  return Behavior::QuasiChemostatic;
    if (!flow_changing)                   return Behavior::SourceVariation;

    if (flow_diff > 0.0 && conc_diff > 0.0) return Behavior::Connectivity;
    if (flow_diff < 0.0 && conc_diff < 0.0) return Behavior::Recovery;
    if (flow_diff > 0.0)                    return Behavior::Dispersion;
    return Behavior::Accumulation;
}

// ─── Trajectory ───────────────────────────────────────────────────────────────

std::string_view to_string(Trajectory trajectory) noexcept {
    switch (trajectory) {
        case Trajectory::SteepDecline:         return "steep_decline";
        case Trajectory::SteepDeclineFromHigh: return "steep_decline_from_high";
        case Trajectory::GradualDecline:       return "gradual_decline";
        case Trajectory::RisingToMax:          return "rising_to_max";
        case Trajectory::LargeIncrease:        return "large_increase";
        case Trajectory::ModerateIncrease:     return "moderate_increase";
        case Trajectory::AtMaximum:            return "at_maximum";
        case Trajectory::Stable:               return "stable";
    }
    return "stable";
}

Trajectory classify_trajectory(double conc_diff,
                               stats::Position conc_position,
                               std::optional<stats::Position> previous_conc_position,
                               const stats::ThresholdSet& t) noexcept {
    const bool high = conc_position == stats::Position::High;
    if (conc_diff < t.dc_p08) {
        return previous_conc_position == stats::Position::High
                   ? Trajectory::SteepDeclineFromHigh
                   : Trajectory::SteepDecline;
    }
    if (conc_diff < t.dc_p25) return Trajectory::GradualDecline;
    if (conc_diff > t.dc_p90) return high ? Trajectory::RisingToMax : Trajectory::LargeIncrease;
    if (conc_diff > t.dc_p75) return Trajectory::ModerateIncrease;
    if (high && std::abs(conc_diff) < t.abs_dc_p50) return Trajectory::AtMaximum;
    return Trajectory::Stable;
}

// ─── build_segments ───────────────────────────────────────────────────────────

std::vector<Segment>
build_segments(const std::vector<SiteSeries>& sites, const SegmentConfig& config) {
    if (config.length < 2 || config.stride < 1) {
        throw ConfigurationError(fmt::format(
            "segment length must be >= 2 and stride >= 1 (got length={}, stride={})",
            config.length, config.stride));
    }

    // Significance of a change is judged against the ranges pooled over sites.
    Range flow_range;
    Range conc_range;
    for (const auto& site : sites) {
        for (double q : site.flow) flow_range.add(q);
        for (double c : site.concentration) conc_range.add(c);
    }

    std::vector<Segment> segments;
    for (const auto& site : sites) {
        const std::size_t n = site.size();
        if (n < config.length) continue;

        std::size_t segment_id = 0;
        for (std::size_t first = 0; first + config.length <= n; first += config.stride) {
            const std::size_t last = first + config.length - 1;

            Segment s{
                .site_id      = site.site_id,
                .segment_id   = segment_id++,
                .first        = first,
                .last         = last,
                .start_time   = site.time[first],
                .end_time     = site.time[last],
                .start_flow   = site.flow[first],
                .end_flow     = site.flow[last],
                .start_conc   = site.concentration[first],
                .end_conc     = site.concentration[last],
                .flow_diff    = site.flow[last] - site.flow[first],
                .conc_diff    = site.concentration[last] - site.concentration[first],
                .behavior     = Behavior::Static,
                .slope_loglog = std::nullopt,
                .slope_linear = std::nullopt,
                .window_first = first > config.window_before ? first - config.window_before : 0,
                .window_last  = std::min(n - 1, last + config.window_after),
            };
            s.behavior = classify_behavior(s.flow_diff, s.conc_diff,
                                           flow_range.span(), conc_range.span(),
                                           config.behavior_threshold);
            s.slope_loglog = stats::point_slope(s.start_flow, s.end_flow,
                                                s.start_conc, s.end_conc,
                                                stats::SlopeKind::LogLog);
            s.slope_linear = stats::point_slope(s.start_flow, s.end_flow,
                                                s.start_conc, s.end_conc,
                                                stats::SlopeKind::Linear);
            segments.push_back(std::move(s));
        }
    }
    return segments;
}

Event window_event(const SiteSeries& site, const Segment& segment) {
    const auto begin = static_cast<std::ptrdiff_t>(segment.window_first);
    const auto end   = static_cast<std::ptrdiff_t>(segment.window_last) + 1;
    return Event{
        .time          = {site.time.begin() + begin, site.time.begin() + end},
        .discharge     = {site.flow.begin() + begin, site.flow.begin() + end},
        .concentration = {site.concentration.begin() + begin,
                          site.concentration.begin() + end},
    };
}

}  // namespace cqhyst::classify
