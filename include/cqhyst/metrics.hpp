#pragma once

/// @file include/cqhyst/metrics.hpp
/// @brief Metrics Orchestrator: runs HARP, Zuecco and Lloyd over one event.
///
/// # Module: Metrics Orchestrator
///
/// ## Responsibility
/// Validate one event, run the three hysteresis calculators independently and
/// assemble a single report. Hysteresis analysis is best-effort across
/// methods: a failing calculator contributes a message to `error` while the
/// others keep their results.
///
/// ## Guarantees
/// - ConfigurationError (mismatched lengths, decreasing time) is raised before
///   any calculator runs and aborts only this call
/// - Fewer than `min_samples` usable rows → every method empty and an
///   "insufficient data" error string
/// - Never throws for undefined metrics (flat Q, empty limbs)

#include "cqhyst/constants.hpp"
#include "cqhyst/hysteresis.hpp"
#include "cqhyst/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cqhyst::hysteresis {

// ─── Direction label ──────────────────────────────────────────────────────────

enum class Direction { Clockwise, CounterClockwise, Weak, Unknown };

[[nodiscard]] std::string_view to_string(Direction direction) noexcept;

/// mean > threshold clockwise, < −threshold counter-clockwise, otherwise weak;
/// unknown for NaN.
[[nodiscard]] Direction direction_from_mean(
    double mean, double threshold = constants::LLOYD_DIRECTION_THRESHOLD) noexcept;

// ─── Report ───────────────────────────────────────────────────────────────────

struct HysteresisConfig {
    HarpConfig   harp;
    ZueccoConfig zuecco;
    LloydConfig  lloyd;
    double       direction_threshold = constants::LLOYD_DIRECTION_THRESHOLD;
    std::size_t  min_samples         = constants::MIN_EVENT_SAMPLES;
};

struct MethodClassifications {
    LoopDirection      harp           = LoopDirection::Undefined;
    std::optional<int> zuecco_class;
    std::optional<int> zuecco_pattern;
    Direction          lloyd          = Direction::Unknown;  ///< From mean HInew
    Direction          lawler         = Direction::Unknown;  ///< From mean HIL
};

/// Normalized series shared by every method.
struct ProcessedSeries {
    std::vector<double> time;         ///< Days since the first usable sample
    std::vector<double> time_scaled;
    std::vector<double> q_scaled;
    std::vector<double> c_scaled;
    std::vector<bool>   rising;       ///< Sample precedes the Q peak
};

struct HysteresisReport {
    std::optional<HarpMetrics>   harp;
    std::optional<ZueccoMetrics> zuecco;
    std::optional<LloydMetrics>  lloyd;
    MethodClassifications        classifications;
    ProcessedSeries              processed;
    std::optional<std::string>   error;  ///< "; "-joined calculator failures

    /// All three methods succeeded.
    [[nodiscard]] bool complete() const noexcept {
        return harp.has_value() && zuecco.has_value() && lloyd.has_value();
    }

    /// Flatten scalar metrics into "<method>.<name>" → value. Missing methods
    /// contribute no keys; undefined values inside a method are NaN.
    [[nodiscard]] std::map<std::string, double> to_metric_map() const;
};

// ─── MetricsOrchestrator ──────────────────────────────────────────────────────

class MetricsOrchestrator {
public:
    explicit MetricsOrchestrator(HysteresisConfig config = HysteresisConfig{}) noexcept;

    /// # Throws
    /// `ConfigurationError` on mismatched lengths or decreasing time.
    [[nodiscard]] HysteresisReport analyze(const Event& event) const;

    [[nodiscard]] const HysteresisConfig& config() const noexcept { return config_; }

private:
    HysteresisConfig  config_;
    HarpCalculator    harp_;
    ZueccoCalculator  zuecco_;
    LloydCalculator   lloyd_;
};

}  // namespace cqhyst::hysteresis
