#pragma once

/// @file include/cqhyst/types.hpp
/// @brief Shared value types: events, monitoring observations, phase labels.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cqhyst {

// ─── Event ────────────────────────────────────────────────────────────────────

/// One rise-and-fall flow event: aligned (time, Q, C) samples.
///
/// Time is in days. Rows are kept exactly as supplied; calculators drop rows
/// with non-finite Q or C themselves.
struct Event {
    std::vector<double> time;           ///< Days, non-decreasing
    std::vector<double> discharge;      ///< Q
    std::vector<double> concentration;  ///< C

    [[nodiscard]] std::size_t size() const noexcept { return time.size(); }

    /// Build and validate an event.
    ///
    /// # Throws
    /// `ConfigurationError` if the three columns differ in length or time
    /// decreases anywhere (an ordering precondition violation).
    [[nodiscard]] static Event make(std::vector<double> time,
                                    std::vector<double> discharge,
                                    std::vector<double> concentration);

    /// Copy without rows whose time, Q or C is non-finite.
    [[nodiscard]] Event finite_rows() const;
};

/// Validate column alignment and time ordering of an event.
///
/// # Throws
/// `ConfigurationError` on mismatched lengths or decreasing time.
void validate_event(const Event& event);

// ─── Monitoring series ────────────────────────────────────────────────────────

/// One row of a long monitoring record.
struct Observation {
    std::string site_id;
    double time;           ///< Days
    double flow;           ///< Q
    double concentration;  ///< C
};

using MonitoringSeries = std::vector<Observation>;

/// One sample of an optional high-resolution flow record.
struct FlowSample {
    double time;  ///< Days
    double flow;
};

/// High-resolution flow per site id, used only for flow context and for
/// window-scale hysteresis.
using HighResFlow = std::map<std::string, std::vector<FlowSample>>;

// ─── Phase label ──────────────────────────────────────────────────────────────

/// Geochemical process phase assigned to a segment.
enum class Phase : char {
    Flushing    = 'F',
    Loading     = 'L',
    Chemostatic = 'C',
    Dilution    = 'D',
    Recession   = 'R',
    Variable    = 'V',
};

[[nodiscard]] constexpr char to_char(Phase phase) noexcept {
    return static_cast<char>(phase);
}

[[nodiscard]] std::string_view to_string(Phase phase) noexcept;

/// Parse 'F', 'L', 'C', 'D', 'R' or 'V'.
[[nodiscard]] std::optional<Phase> phase_from_char(char c) noexcept;

}  // namespace cqhyst
