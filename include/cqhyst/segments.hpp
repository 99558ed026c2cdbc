#pragma once

/// @file include/cqhyst/segments.hpp
/// @brief Segment Builder: cuts monitoring records into classifiable segments.
///
/// # Module: Segment Builder
///
/// ## Responsibility
/// Group a monitoring series by site, order each site by time and cut it into
/// segments of `length` samples every `stride` samples (default 2 / 1, i.e.
/// point-to-point). Every segment carries its own change in flow and
/// concentration, a Williams-type behaviour tag, point-to-point C-Q slopes and
/// the surrounding window of samples used for window-scale hysteresis.
///
/// ## Behaviour (Williams 1989, Evans & Davies 1998)
/// A change is significant if |Δ| > threshold · (pooled range of the variable):
///   ΔQ, ΔC both significant   connectivity (+,+), recovery (−,−),
///                             dispersion (+,−), accumulation (−,+)
///   only ΔQ significant       quasi_chemostatic
///   only ΔC significant       source_variation
///   neither                   static
///
/// ## Guarantees
/// - Deterministic for identical input (stable sort by time)
/// - Rows with a non-finite time, flow or concentration are dropped

#include "cqhyst/constants.hpp"
#include "cqhyst/thresholds.hpp"
#include "cqhyst/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cqhyst::classify {

// ─── Site series ──────────────────────────────────────────────────────────────

/// One site's observations as aligned, time-ordered columns.
struct SiteSeries {
    std::string         site_id;
    std::vector<double> time;
    std::vector<double> flow;
    std::vector<double> concentration;

    [[nodiscard]] std::size_t size() const noexcept { return time.size(); }
};

/// Split by site id (order of first appearance), drop non-finite rows and
/// stable-sort each site by time.
[[nodiscard]] std::vector<SiteSeries> split_by_site(const MonitoringSeries& series);

// ─── Tags ─────────────────────────────────────────────────────────────────────

enum class Behavior {
    Connectivity,
    Dispersion,
    Accumulation,
    Recovery,
    QuasiChemostatic,
    SourceVariation,
    Static,
};

[[nodiscard]] std::string_view to_string(Behavior behavior) noexcept;

/// Williams behaviour of one change. A span below 1e-10 makes its variable
/// count as not changing.
[[nodiscard]] Behavior classify_behavior(double flow_diff, double conc_diff,
                                         double flow_span, double conc_span,
                                         double threshold = constants::BEHAVIOR_CHANGE_FRACTION) noexcept;

/// Concentration trajectory of a segment against the ΔC percentiles.
enum class Trajectory {
    SteepDecline,          ///< ΔC < p08
    SteepDeclineFromHigh,  ///< ΔC < p08 and the previous segment ended high
    GradualDecline,        ///< ΔC < p25
    RisingToMax,           ///< ΔC > p90 and C ends high
    LargeIncrease,         ///< ΔC > p90
    ModerateIncrease,      ///< ΔC > p75
    AtMaximum,             ///< C high and |ΔC| < |ΔC| p50
    Stable,
};

[[nodiscard]] std::string_view to_string(Trajectory trajectory) noexcept;

[[nodiscard]] Trajectory
classify_trajectory(double conc_diff,
                    stats::Position conc_position,
                    std::optional<stats::Position> previous_conc_position,
                    const stats::ThresholdSet& thresholds) noexcept;

// ─── Segment ──────────────────────────────────────────────────────────────────

struct SegmentConfig {
    std::size_t length        = 2;  ///< Samples per segment (≥ 2)
    std::size_t stride        = 1;  ///< Samples between segment starts (≥ 1)
    std::size_t window_before = 8;  ///< Hysteresis window samples before the segment
    std::size_t window_after  = 4;  ///< Hysteresis window samples after the segment
    double behavior_threshold = constants::BEHAVIOR_CHANGE_FRACTION;
};

struct Segment {
    std::string site_id;
    std::size_t segment_id;  ///< Position within the site
    std::size_t first;       ///< Index of the first sample in the site series
    std::size_t last;        ///< Index of the last sample in the site series

    double start_time;
    double end_time;
    double start_flow;
    double end_flow;
    double start_conc;
    double end_conc;
    double flow_diff;
    double conc_diff;

    Behavior behavior;
    std::optional<double> slope_loglog;  ///< Point-to-point, first to last sample
    std::optional<double> slope_linear;

    std::size_t window_first;  ///< Surrounding hysteresis window, inclusive
    std::size_t window_last;
};

/// Cut every site into segments.
///
/// # Throws
/// `ConfigurationError` if `length` < 2 or `stride` < 1.
[[nodiscard]] std::vector<Segment>
build_segments(const std::vector<SiteSeries>& sites,
               const SegmentConfig& config = SegmentConfig{});

/// Samples [window_first, window_last] of a segment's site as an event.
[[nodiscard]] Event window_event(const SiteSeries& site, const Segment& segment);

}  // namespace cqhyst::classify
