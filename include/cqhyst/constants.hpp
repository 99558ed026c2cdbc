#pragma once

#include <cstddef>

/// @file include/cqhyst/constants.hpp
/// @brief Numerical defaults and published thresholds for the C-Q toolkit.
///
/// Every value here is a default for one of the configuration structs; none of
/// them is read directly by a rule once a run has been configured.

namespace cqhyst::constants {

// ─── Sample-Size Minimums ─────────────────────────────────────────────────────

/// Minimum usable (finite Q and C) samples for any hysteresis calculator.
static constexpr std::size_t MIN_EVENT_SAMPLES = 5;

/// Minimum finite observations for a percentile threshold population.
static constexpr std::size_t MIN_THRESHOLD_POPULATION = 5;

/// Minimum strictly positive (Q, C) pairs for a log-log regression.
static constexpr std::size_t MIN_SLOPE_PAIRS = 3;

/// Default rolling window for CVc/CVq (Musolff et al. 2015).
static constexpr std::size_t DEFAULT_CV_WINDOW = 5;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// A normalization range narrower than this is treated as flat.
static constexpr double FLAT_RANGE_EPSILON = 1e-12;

/// Δlog10(Q) or ΔQ below this makes a point-to-point slope undefined.
static constexpr double SLOPE_DELTA_EPSILON = 1e-12;

// ─── C-Q Slope Bands ──────────────────────────────────────────────────────────

/// |b| above this is a directional signature (b > 0 flushing, b < 0 loading).
static constexpr double SLOPE_DIRECTIONAL = 0.15;

/// |b| below this is chemostatic. The band (0.10, 0.15) is ambiguous.
static constexpr double SLOPE_CHEMOSTATIC = 0.10;

// ─── Variability Ratio ────────────────────────────────────────────────────────

/// CVc/CVq above this is chemodynamic, below it chemostatic.
static constexpr double CV_RATIO_CUT = 1.0;

/// CVc/CVq below this is the low-variability recession signature.
static constexpr double CV_RATIO_LOW = 0.8;

// ─── Hysteresis Methods ───────────────────────────────────────────────────────

/// |HARP area| below this is classified as a linear (loop-free) response.
static constexpr double HARP_LINEAR_EPSILON = 0.01;

/// |Zuecco h| below this is class 0.
static constexpr double ZUECCO_ZERO_EPSILON = 1e-3;

/// Fixed normalized-Q integration grid of Zuecco et al. (2016).
static constexpr double ZUECCO_GRID_START  = 0.15;
static constexpr double ZUECCO_GRID_END    = 1.0;
static constexpr std::size_t ZUECCO_GRID_POINTS = 18;

/// |mean HI| above this gives a clockwise / counter-clockwise direction.
static constexpr double LLOYD_DIRECTION_THRESHOLD = 0.1;

// ─── Phase Classifier ─────────────────────────────────────────────────────────

/// |primary window HI| below this counts as low hysteresis.
static constexpr double LOW_HYSTERESIS = 0.12;

/// Days since the flow peak after which a decline counts as recession.
static constexpr double RECESSION_DAYS = 5.0;

/// |HI| a window must exceed on both sides of a sign change to count as a
/// hysteresis transition between consecutive segments.
static constexpr double HI_TRANSITION = 0.01;

static constexpr double CONFIDENCE_BASE                 = 0.5;
static constexpr double CONFIDENCE_PER_CORROBORATION    = 0.15;
static constexpr double CONFIDENCE_HYSTERESIS_AGREEMENT = 0.1;
static constexpr double CONFIDENCE_REDUCED_DATA_PENALTY = 0.2;

// ─── Segmentation ─────────────────────────────────────────────────────────────

/// Relative change (fraction of the pooled range) that counts as significant
/// in the Williams behaviour tag.
static constexpr double BEHAVIOR_CHANGE_FRACTION = 0.01;

/// Fractions of a segment's duration added before / after it when the
/// hysteresis window is cut from a high-resolution flow table.
static constexpr double WINDOW_HEAD_EXTENSION = 0.4;
static constexpr double WINDOW_TAIL_EXTENSION = 0.2;

}  // namespace cqhyst::constants
