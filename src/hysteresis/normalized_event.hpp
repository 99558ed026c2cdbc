#pragma once

/// @file src/hysteresis/normalized_event.hpp
/// @brief Min-max normalized event and rising/falling limbs (internal).
///
/// Shared preparation step of the HARP, Zuecco and Lloyd calculators:
///   1. validate column alignment and time order (ConfigurationError)
///   2. drop rows with non-finite time, Q or C
///   3. min-max scale time, Q and C to [0, 1]
///   4. split at the first argmax of Q; the peak sample belongs to both limbs
///
/// ## Limb policy
/// Each limb is sorted by normalized Q (stable, so time order breaks ties)
/// and duplicate Q values keep their first occurrence in time order.
/// Interpolation outside a limb's Q range is undefined, never extrapolated.

#include "cqhyst/errors.hpp"
#include "cqhyst/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace cqhyst::hysteresis::detail {

struct NormalizedEvent {
    std::vector<double> time;      ///< Days since the first usable sample
    std::vector<double> time_s;    ///< Scaled time [0, 1]
    std::vector<double> q_s;       ///< Scaled Q [0, 1]
    std::vector<double> c_s;       ///< Scaled C [0, 1]
    std::size_t peak_q = 0;        ///< First argmax of Q
    std::size_t peak_c = 0;        ///< First argmax of C
    bool q_flat = false;           ///< max(Q) − min(Q) below epsilon or not finite
    bool c_flat = false;

    [[nodiscard]] std::size_t size() const noexcept { return q_s.size(); }
};

/// Scale values to [0, 1]. A flat series, or one whose range overflows,
/// maps to all zeros.
[[nodiscard]] std::vector<double> min_max_scale(std::span<const double> values);

/// Index of the first maximum. Precondition: `values` is non-empty.
[[nodiscard]] std::size_t first_argmax(std::span<const double> values) noexcept;

/// Validate, clean and normalize an event.
///
/// # Throws
/// `ConfigurationError` on mismatched lengths or decreasing time.
///
/// # Returns
/// InsufficientData if fewer than `min_samples` finite rows remain.
[[nodiscard]] MetricResult<NormalizedEvent>
normalize_event(const Event& event, std::size_t min_samples);

// ─── Limb ─────────────────────────────────────────────────────────────────────

/// One limb as a monotonically increasing Q axis with its C values.
class Limb {
public:
    /// Build from time-ordered samples: stable sort by Q, keep the first
    /// occurrence of each Q value.
    Limb(std::span<const double> q, std::span<const double> c);

    [[nodiscard]] std::size_t size() const noexcept { return q_.size(); }
    [[nodiscard]] bool empty() const noexcept { return q_.empty(); }
    [[nodiscard]] double q_min() const noexcept { return q_.front(); }
    [[nodiscard]] double q_max() const noexcept { return q_.back(); }
    [[nodiscard]] const std::vector<double>& q() const noexcept { return q_; }
    [[nodiscard]] const std::vector<double>& c() const noexcept { return c_; }

    /// Linear interpolation of C at `q`; `nullopt` outside [q_min, q_max]
    /// or for a limb with fewer than 2 distinct points.
    [[nodiscard]] std::optional<double> at(double q) const noexcept;

private:
    std::vector<double> q_;
    std::vector<double> c_;
};

struct Limbs {
    Limb rising;
    Limb falling;
};

/// Split at `peak_q`; the peak sample is in both limbs.
[[nodiscard]] Limbs split_limbs(const NormalizedEvent& event);

}  // namespace cqhyst::hysteresis::detail
