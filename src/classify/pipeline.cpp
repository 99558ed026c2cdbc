/// @file src/classify/pipeline.cpp
/// @brief End-to-end segment classification of a monitoring series.

#include "cqhyst/pipeline.hpp"
#include "cqhyst/errors.hpp"
#include "cqhyst/variability.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <span>
#include <variant>

namespace cqhyst::classify {

namespace {

[[nodiscard]] std::optional<double> defined(double v) noexcept {
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

/// Linear interpolation of y at t over increasing x; nullopt outside [x0, xn].
[[nodiscard]] std::optional<double> interpolate(std::span<const double> x,
                                                std::span<const double> y,
                                                double t) noexcept {
    if (x.empty() || !(t >= x.front() && t <= x.back())) return std::nullopt;
    const auto it = std::lower_bound(x.begin(), x.end(), t);
    const auto hi = static_cast<std::size_t>(it - x.begin());
    if (x[hi] == t || hi == 0) return y[hi];
    const std::size_t lo = hi - 1;
    const double w = (t - x[lo]) / (x[hi] - x[lo]);
    return y[lo] + w * (y[hi] - y[lo]);
}

[[nodiscard]] stats::ThresholdPopulation population(const std::vector<SiteSeries>& sites) {
    stats::ThresholdPopulation pop;
    for (const auto& site : sites) {
        pop.flow.insert(pop.flow.end(), site.flow.begin(), site.flow.end());
        pop.concentration.insert(pop.concentration.end(),
                                 site.concentration.begin(), site.concentration.end());
        for (std::size_t i = 1; i < site.size(); ++i) {
            pop.flow_diff.push_back(site.flow[i] - site.flow[i - 1]);
            pop.conc_diff.push_back(site.concentration[i] - site.concentration[i - 1]);
        }
    }
    return pop;
}

/// Time-ordered high-resolution flow per site, non-finite samples dropped.
[[nodiscard]] std::map<std::string, std::vector<FlowSample>>
sorted_highres(const HighResFlow& highres) {
    std::map<std::string, std::vector<FlowSample>> out;
    for (const auto& [site, samples] : highres) {
        auto& dst = out[site];
        for (const auto& s : samples) {
            if (std::isfinite(s.time) && std::isfinite(s.flow)) dst.push_back(s);
        }
        std::stable_sort(dst.begin(), dst.end(),
                         [](const FlowSample& a, const FlowSample& b) { return a.time < b.time; });
    }
    return out;
}

/// High-resolution flow around a segment with concentration interpolated
/// from the monitoring series.
[[nodiscard]] Event highres_window(const std::vector<FlowSample>& flow,
                                   const SiteSeries& site,
                                   const Segment& segment,
                                   double head, double tail) {
    const double duration = segment.end_time - segment.start_time;
    const double lo = segment.start_time - head * duration;
    const double hi = segment.end_time + tail * duration;

    Event ev;
    for (const auto& s : flow) {
        if (s.time < lo) continue;
        if (s.time > hi) break;
        const auto c = interpolate(site.time, site.concentration, s.time);
        if (!c) continue;
        ev.time.push_back(s.time);
        ev.discharge.push_back(s.flow);
        ev.concentration.push_back(*c);
    }
    return ev;
}

[[nodiscard]] WindowHysteresis window_indices(const hysteresis::HysteresisReport& report) {
    WindowHysteresis h;
    if (report.harp)   h.harp_area    = defined(report.harp->area);
    if (report.zuecco) h.zuecco_h     = defined(report.zuecco->h_index);
    if (report.lloyd)  h.lloyd_hi_new = defined(report.lloyd->mean_hi_new);
    return h;
}

}  // namespace

ClassificationPipeline::ClassificationPipeline(PipelineConfig config)
    : config_(std::move(config)),
      thresholds_(config_.thresholds),
      orchestrator_(config_.hysteresis),
      classifier_(config_.classifier) {}

ClassificationRun ClassificationPipeline::run(const MonitoringSeries& series) const {
    return run(series, HighResFlow{});
}

ClassificationRun ClassificationPipeline::run(const MonitoringSeries& series,
                                              const HighResFlow& highres) const {
    if (config_.cv_window < 2) {
        throw ConfigurationError(fmt::format(
            "variability window must span at least 2 samples (got {})", config_.cv_window));
    }
    ClassificationRun result;

    const auto sites = split_by_site(series);
    const auto pop   = population(sites);

    // ── Thresholds ──
    auto computed = thresholds_.compute(pop);
    if (auto* t = std::get_if<stats::ThresholdSet>(&computed)) {
        result.thresholds = *t;
    } else {
        spdlog::warn("classifying with reduced data quality: {}",
                     std::get<MetricError>(computed).to_string());
    }

    std::optional<FlowLevels> levels;
    if (result.thresholds) {
        levels = FlowLevels::from(*result.thresholds);
    } else if (!pop.flow.empty()) {
        levels = FlowLevels{stats::quantile(pop.flow, 0.25).value_or(0.0),
                            stats::quantile(pop.flow, 0.50).value_or(0.0),
                            stats::quantile(pop.flow, 0.75).value_or(0.0)};
    }

    // ── Variability and segments ──
    std::map<std::string, std::size_t> site_index;
    std::vector<std::vector<stats::VariabilityWindow>> variability;
    variability.reserve(sites.size());
    for (std::size_t i = 0; i < sites.size(); ++i) {
        const auto& site = sites[i];
        site_index.emplace(site.site_id, i);
        variability.push_back(stats::rolling_variability(site.time, site.flow,
                                                         site.concentration,
                                                         config_.cv_window));
    }

    const auto segments = build_segments(sites, config_.segments);
    const auto flow_hr  = sorted_highres(highres);
    spdlog::info("classifying {} segments across {} sites{}", segments.size(), sites.size(),
                 flow_hr.empty() ? "" : " with high-resolution flow");

    result.rows.reserve(segments.size());

    // Per-site context threaded in time order.
    std::string             current_site;
    std::optional<Phase>    prior;
    PreviousSegment         previous;
    std::optional<stats::Position> previous_conc_position;

    for (const auto& seg : segments) {
        const std::size_t si = site_index.at(seg.site_id);
        const SiteSeries& site = sites[si];
        if (seg.site_id != current_site) {
            current_site = seg.site_id;
            prior.reset();
            previous = PreviousSegment{};
            previous_conc_position.reset();
        }

        // ── Window-scale hysteresis ──
        const auto hr = flow_hr.find(seg.site_id);
        const Event window = hr != flow_hr.end() && !hr->second.empty()
                                 ? highres_window(hr->second, site, seg,
                                                  config_.head_extension,
                                                  config_.tail_extension)
                                 : window_event(site, seg);
        const auto report = orchestrator_.analyze(window);

        ClassificationRow row{
            .site_id      = seg.site_id,
            .segment_id   = seg.segment_id,
            .start_time   = seg.start_time,
            .end_time     = seg.end_time,
            .start_flow   = seg.start_flow,
            .end_flow     = seg.end_flow,
            .start_conc   = seg.start_conc,
            .end_conc     = seg.end_conc,
            .flow_diff    = seg.flow_diff,
            .conc_diff    = seg.conc_diff,
            .phase        = Phase::Variable,
            .confidence   = 0.0,
            .rules        = {},
            .hysteresis   = window_indices(report),
            .window_direction = std::nullopt,
            .cv_c         = std::nullopt,
            .cv_q         = std::nullopt,
            .cv_ratio     = std::nullopt,
            .slope        = std::nullopt,
            .slope_point  = seg.slope_loglog,
            .slope_linear = seg.slope_linear,
            .flow_percentile = stats::percentile_rank(pop.flow, seg.end_flow),
            .conc_percentile = stats::percentile_rank(pop.concentration, seg.end_conc),
            .flow_position   = std::nullopt,
            .conc_position   = std::nullopt,
            .behavior        = seg.behavior,
            .trajectory      = std::nullopt,
            .flow_phase      = std::nullopt,
            .days_since_peak = std::nullopt,
        };
        if (report.lloyd) row.window_direction = report.classifications.lloyd;

        // ── Flow context up to the segment end ──
        if (levels) {
            std::size_t n = 0;
            while (n < window.size() && window.time[n] <= seg.end_time) ++n;
            const std::span<const double> t(window.time);
            const std::span<const double> q(window.discharge);
            if (auto dyn = analyze_flow_dynamics(t.first(n), q.first(n), *levels)) {
                row.flow_phase      = dyn->phase;
                row.days_since_peak = dyn->days_since_peak;
            }
        }

        // ── Variability window ending at the segment end ──
        const auto& var = variability[si];
        if (!var.empty() && seg.last + 1 >= config_.cv_window) {
            const auto& vw = var[seg.last + 1 - config_.cv_window];
            row.cv_c     = vw.cv_c;
            row.cv_q     = vw.cv_q;
            row.cv_ratio = vw.ratio;
            if (vw.slope) row.slope = vw.slope->slope;
        }

        // ── Percentile positions and trajectory ──
        if (result.thresholds) {
            const auto& t = *result.thresholds;
            row.flow_position = stats::position(seg.end_flow, t.q_p25, t.q_p75);
            row.conc_position = stats::position(seg.end_conc, t.c_p25, t.c_p75);
            row.trajectory = classify_trajectory(seg.conc_diff, *row.conc_position,
                                                 previous_conc_position, t);
        }

        const SegmentFeatures features{
            .start_flow      = seg.start_flow,
            .end_flow        = seg.end_flow,
            .flow_diff       = seg.flow_diff,
            .start_conc      = seg.start_conc,
            .end_conc        = seg.end_conc,
            .conc_diff       = seg.conc_diff,
            .slope           = row.slope ? row.slope : row.slope_point,
            .cv_ratio        = row.cv_ratio,
            .hysteresis      = row.hysteresis,
            .flow_phase      = row.flow_phase,
            .days_since_peak = row.days_since_peak,
            .previous        = previous,
        };

        auto decision = classifier_.classify(features, result.thresholds, prior);
        row.phase      = decision.phase;
        row.confidence = decision.confidence;
        row.rules      = std::move(decision.rules);

        prior                  = row.phase;
        previous               = PreviousSegment{seg.conc_diff, row.hysteresis.primary()};
        previous_conc_position = row.conc_position;

        result.rows.push_back(std::move(row));
    }

    if (spdlog::should_log(spdlog::level::debug)) {
        std::map<char, std::size_t> counts;
        for (const auto& row : result.rows) ++counts[to_char(row.phase)];
        for (const auto& [phase, count] : counts) {
            spdlog::debug("phase {}: {} segments", phase, count);
        }
    }
    return result;
}

ClassificationRun classify_series(const MonitoringSeries& series,
                                  const PipelineConfig& config,
                                  const HighResFlow& highres) {
    return ClassificationPipeline(config).run(series, highres);
}

}  // namespace cqhyst::classify
