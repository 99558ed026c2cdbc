/// @file src/core/types.cpp
/// @brief Event validation, phase labels and error formatting.

#include "cqhyst/errors.hpp"
#include "cqhyst/types.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <utility>

namespace cqhyst {

// ─── MetricError ──────────────────────────────────────────────────────────────

std::string MetricError::to_string() const {
    return fmt::format("{}: {}", cqhyst::to_string(kind), message);
}

// ─── Event ────────────────────────────────────────────────────────────────────

void validate_event(const Event& event) {
    const std::size_t n = event.time.size();
    if (event.discharge.size() != n || event.concentration.size() != n) {
        throw ConfigurationError(fmt::format(
            "event columns have mismatched lengths (time={}, Q={}, C={})",
            n, event.discharge.size(), event.concentration.size()));
    }

    // NaN time stamps are skipped here; finite_rows() drops them later.
    double last = -std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
        const double t = event.time[i];
        if (!std::isfinite(t)) continue;
        if (t < last) {
            throw ConfigurationError(fmt::format(
                "event time decreases at row {} ({} after {}); "
                "samples must be in chronological order", i, t, last));
        }
        last = t;
    }
}

Event Event::make(std::vector<double> time,
                  std::vector<double> discharge,
                  std::vector<double> concentration) {
    Event event{std::move(time), std::move(discharge), std::move(concentration)};
    validate_event(event);
    return event;
}

Event Event::finite_rows() const {
    Event out;
    out.time.reserve(time.size());
    out.discharge.reserve(time.size());
    out.concentration.reserve(time.size());
    for (std::size_t i = 0; i < time.size(); ++i) {
        if (!std::isfinite(time[i]) || !std::isfinite(discharge[i]) ||
            !std::isfinite(concentration[i])) {
            continue;
        }
        out.time.push_back(time[i]);
        out.discharge.push_back(discharge[i]);
        out.concentration.push_back(concentration[i]);
    }
    return out;
}

// ─── Phase ────────────────────────────────────────────────────────────────────

std::string_view to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Flushing:    return "Flushing";
        case Phase::Loading:     return "Loading";
        case Phase::Chemostatic: return "Chemostatic";
        case Phase::Dilution:    return "Dilution";
        case Phase::Recession:   return "Recession";
        case Phase::Variable:    return "Variable";
    }
    return "Variable";
}

std::optional<Phase> phase_from_char(char c) noexcept {
    switch (c) {
        case 'F': return Phase::Flushing;
        case 'L': return Phase::Loading;
        case 'C': return Phase::Chemostatic;
        case 'D': return Phase::Dilution;
        case 'R': return Phase::Recession;
        case 'V': return Phase::Variable;
        default:  return std::nullopt;
    }
}

}  // namespace cqhyst
