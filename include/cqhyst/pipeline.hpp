#pragma once

/// @file include/cqhyst/pipeline.hpp
/// @brief Classification Pipeline: monitoring series → classified segments.
///
/// # Module: Classification Pipeline
///
/// ## Stages
///   1. Split the series by site, drop non-finite rows, order by time
///   2. Percentile thresholds over every site (absent if the population is
///      below the minimum)
///   3. Rolling CVc/CVq and log-log slope per site
///   4. Segments (point-to-point by default)
///   5. Window-scale hysteresis through the metrics orchestrator, on the
///      high-resolution flow table when one is supplied for the site,
///      otherwise on the segment's window of the monitoring series
///   6. Flow context of the window up to the segment end
///   7. Phase classification, threading the prior phase per site in time order
///
/// ## Guarantees
/// - Deterministic for identical input
/// - Calculator failures only leave fields undefined; a ConfigurationError
///   aborts the call

#include "cqhyst/classifier.hpp"
#include "cqhyst/flow_dynamics.hpp"
#include "cqhyst/metrics.hpp"
#include "cqhyst/segments.hpp"
#include "cqhyst/thresholds.hpp"
#include "cqhyst/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cqhyst::classify {

struct PipelineConfig {
    stats::ThresholdConfig       thresholds;
    SegmentConfig                segments;
    hysteresis::HysteresisConfig hysteresis;
    ClassifierConfig             classifier;

    std::size_t cv_window     = constants::DEFAULT_CV_WINDOW;
    double      head_extension = constants::WINDOW_HEAD_EXTENSION;  ///< High-res window, fraction of duration
    double      tail_extension = constants::WINDOW_TAIL_EXTENSION;
};

/// One classified segment with every diagnostic that fed the decision.
struct ClassificationRow {
    std::string site_id;
    std::size_t segment_id;
    double      start_time;
    double      end_time;
    double      start_flow;
    double      end_flow;
    double      start_conc;
    double      end_conc;
    double      flow_diff;
    double      conc_diff;

    Phase                    phase;
    double                   confidence;
    std::vector<std::string> rules;

    WindowHysteresis                         hysteresis;
    std::optional<hysteresis::Direction>     window_direction;  ///< Lloyd direction of the window
    std::optional<double>                    cv_c;
    std::optional<double>                    cv_q;
    std::optional<double>                    cv_ratio;
    std::optional<double>                    slope;             ///< Window log-log slope
    std::optional<double>                    slope_point;       ///< Point-to-point log-log slope
    std::optional<double>                    slope_linear;      ///< Point-to-point linear slope

    std::optional<double>          flow_percentile;  ///< Rank of end flow, 0–100
    std::optional<double>          conc_percentile;  ///< Rank of end concentration, 0–100
    std::optional<stats::Position> flow_position;
    std::optional<stats::Position> conc_position;

    Behavior                  behavior;
    std::optional<Trajectory> trajectory;
    std::optional<FlowPhase>  flow_phase;
    std::optional<double>     days_since_peak;
};

struct ClassificationRun {
    std::vector<ClassificationRow>     rows;
    std::optional<stats::ThresholdSet> thresholds;  ///< Cut points used, if any
};

class ClassificationPipeline {
public:
    explicit ClassificationPipeline(PipelineConfig config = PipelineConfig{});

    /// # Throws
    /// `ConfigurationError` for an invalid segment or window configuration.
    [[nodiscard]] ClassificationRun run(const MonitoringSeries& series) const;

    /// As `run(series)`, using high-resolution flow where a site has it.
    [[nodiscard]] ClassificationRun run(const MonitoringSeries& series,
                                        const HighResFlow& highres) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig                  config_;
    stats::ThresholdCalculator      thresholds_;
    hysteresis::MetricsOrchestrator orchestrator_;
    PhaseClassifier                 classifier_;
};

/// One-shot form of `ClassificationPipeline{config}.run(series, highres)`.
[[nodiscard]] ClassificationRun classify_series(const MonitoringSeries& series,
                                                const PipelineConfig& config = PipelineConfig{},
                                                const HighResFlow& highres = HighResFlow{});

}  // namespace cqhyst::classify
