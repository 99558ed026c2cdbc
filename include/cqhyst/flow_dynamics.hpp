#pragma once

/// @file include/cqhyst/flow_dynamics.hpp
/// @brief Flow-Dynamics Analyzer: position of a window relative to its flow peak.
///
/// # Module: Flow Dynamics
///
/// ## Responsibility
/// Describe where a segment sits on the local hydrograph: how long ago the
/// flow peaked, whether flow is rising or declining, and how high it is
/// relative to the run's flow percentiles. The result is temporal context
/// for the phase classifier (at-peak, early decline, recession, ...).
///
/// ## Flow Phase (first match)
///   days since peak < 1                          at_peak
///   days since peak < 0.3·duration               early_decline if end Q > Q p50,
///                                                else late_decline
///   days to peak < 0.3·duration                  post_peak
///   peak in the last third and end Q > start Q   rising
///   end Q < Q p25                                low
///   end Q > 1.1·start Q                          rising
///   end Q < 0.9·start Q                          early_decline if end Q > Q p75,
///                                                else late_decline
///   otherwise                                    stable

#include "cqhyst/thresholds.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace cqhyst::classify {

enum class FlowPhase {
    AtPeak,
    EarlyDecline,
    LateDecline,
    PostPeak,
    Rising,
    Low,
    Stable,
};

[[nodiscard]] std::string_view to_string(FlowPhase phase) noexcept;

enum class PeakPosition { Early, Middle, Late };

[[nodiscard]] std::string_view to_string(PeakPosition position) noexcept;

/// Flow percentiles used for the level and phase tests.
struct FlowLevels {
    double p25;
    double p50;
    double p75;

    [[nodiscard]] static FlowLevels from(const stats::ThresholdSet& t) noexcept {
        return {t.q_p25, t.q_p50, t.q_p75};
    }
};

struct FlowDynamics {
    double peak_q;
    double peak_time;        ///< Days
    double days_to_peak;     ///< From window start
    double days_since_peak;  ///< To window end
    double duration;         ///< Window length in days

    PeakPosition    peak_position;
    FlowPhase       phase;
    stats::Position level;   ///< End Q against Q p25 / p75

    double q_trend;          ///< dQ/dt per day, least squares
    double q_acceleration;   ///< Trend of the second half minus the first, per day
    double q_range;
    double start_q;
    double end_q;
};

/// Analyze one time-ordered (time, Q) window.
///
/// # Returns
/// `nullopt` if fewer than 2 finite samples remain.
[[nodiscard]] std::optional<FlowDynamics>
analyze_flow_dynamics(std::span<const double> time,
                      std::span<const double> discharge,
                      const FlowLevels& levels);

}  // namespace cqhyst::classify
