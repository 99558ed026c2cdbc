/// @file src/hysteresis/metrics_orchestrator.cpp
/// @brief Best-effort assembly of the three hysteresis methods.

#include "cqhyst/metrics.hpp"

#include "normalized_event.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>
#include <variant>

namespace cqhyst::hysteresis {

namespace {

/// Unwrap a calculator result into `slot`, or append its failure to `errors`.
template <typename T>
void collect(MetricResult<T>&& result, std::string_view method,
             std::optional<T>& slot, std::vector<std::string>& errors) {
    if (auto* value = std::get_if<T>(&result)) {
        slot = std::move(*value);
        return;
    }
    const auto& err = std::get<MetricError>(result);
    spdlog::debug("{} metrics undefined: {}", method, err.message);
    errors.push_back(fmt::format("{}: {}", method, err.to_string()));
}

}  // namespace

std::string_view to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Clockwise:        return "clockwise";
        case Direction::CounterClockwise: return "counter-clockwise";
        case Direction::Weak:             return "weak";
        case Direction::Unknown:          return "unknown";
    }
    return "unknown";
}

Direction direction_from_mean(double mean, double threshold) noexcept {
    if (!std::isfinite(mean)) return Direction::Unknown;
    if (mean >  threshold)    return Direction::Clockwise;
    if (mean < -threshold)    return Direction::CounterClockwise;
    return Direction::Weak;
}

// ─── HysteresisReport ─────────────────────────────────────────────────────────

std::map<std::string, double> HysteresisReport::to_metric_map() const {
    std::map<std::string, double> out;
    if (harp) {
        out["harp.area"]         = harp->area;
        out["harp.residual"]     = harp->residual;
        out["harp.area_lower"]   = harp->area_lower;
        out["harp.area_upper"]   = harp->area_upper;
        out["harp.intersection_q"] = harp->intersection_q.value_or(std::nan(""));
        out["harp.peak_q"]       = harp->peak_q;
        out["harp.peak_c"]       = harp->peak_c;
        out["harp.peak_time_q"]  = harp->peak_time_q;
        out["harp.peak_time_c"]  = harp->peak_time_c;
        out["harp.radius_equiv"] = harp->radius_equiv;
    }
    if (zuecco) {
        out["zuecco.h_index"]       = zuecco->h_index;
        out["zuecco.hyst_class"]    = static_cast<double>(zuecco->hyst_class);
        out["zuecco.pattern_class"] = static_cast<double>(zuecco->pattern_class);
        out["zuecco.min_diff_area"] = zuecco->min_diff_area;
        out["zuecco.max_diff_area"] = zuecco->max_diff_area;
    }
    if (lloyd) {
        out["lloyd.mean_hi_new"]     = lloyd->mean_hi_new;
        out["lloyd.median_hi_new"]   = lloyd->median_hi_new;
        out["lloyd.range_hi_new"]    = lloyd->range_hi_new;
        out["lloyd.mean_abs_hi_new"] = lloyd->mean_abs_hi_new;
        out["lloyd.mean_hil"]        = lloyd->mean_hil;
        out["lloyd.median_hil"]      = lloyd->median_hil;
        out["lloyd.range_hil"]       = lloyd->range_hil;
        out["lloyd.n_valid"]         = static_cast<double>(lloyd->n_valid);
    }
    return out;
}

// ─── MetricsOrchestrator ──────────────────────────────────────────────────────

MetricsOrchestrator::MetricsOrchestrator(HysteresisConfig config) noexcept
    : config_(config),
      harp_(config.harp),
      zuecco_(config.zuecco),
      lloyd_(config.lloyd) {}

HysteresisReport MetricsOrchestrator::analyze(const Event& event) const {
    HysteresisReport report;

    // Validation throws here, before any calculator runs.
    auto normalized = detail::normalize_event(event, config_.min_samples);
    if (auto* err = std::get_if<MetricError>(&normalized)) {
        report.error = err->message;
        return report;
    }
    const auto& ev = std::get<detail::NormalizedEvent>(normalized);

    report.processed.time        = ev.time;
    report.processed.time_scaled = ev.time_s;
    report.processed.q_scaled    = ev.q_s;
    report.processed.c_scaled    = ev.c_s;
    report.processed.rising.resize(ev.size());
    for (std::size_t i = 0; i < ev.size(); ++i) {
        report.processed.rising[i] = !ev.q_flat && i < ev.peak_q;
    }

    std::vector<std::string> errors;
    collect(harp_.compute(event),   "harp",   report.harp,   errors);
    collect(zuecco_.compute(event), "zuecco", report.zuecco, errors);
    collect(lloyd_.compute(event),  "lloyd",  report.lloyd,  errors);

    auto& cls = report.classifications;
    if (report.harp) cls.harp = report.harp->direction;
    if (report.zuecco) {
        cls.zuecco_class   = report.zuecco->hyst_class;
        cls.zuecco_pattern = report.zuecco->pattern_class;
    }
    if (report.lloyd) {
        cls.lloyd  = direction_from_mean(report.lloyd->mean_hi_new, config_.direction_threshold);
        cls.lawler = direction_from_mean(report.lloyd->mean_hil, config_.direction_threshold);
    }

    if (!errors.empty()) {
        report.error = fmt::format("{}", fmt::join(errors, "; "));
    }
    return report;
}

}  // namespace cqhyst::hysteresis
