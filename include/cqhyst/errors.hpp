#pragma once

/// @file include/cqhyst/errors.hpp
/// @brief Error taxonomy shared by every calculator.
///
/// Two families:
///   - `MetricError` (InsufficientData, UndefinedMetric) is non-fatal. It is
///     returned inside a `MetricResult<T>` and callers degrade to NaN fields,
///     a reduced confidence, or an error string.
///   - `ConfigurationError` is fatal for the single call that raised it
///     (mismatched column lengths, a missing column, decreasing time).

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace cqhyst {

// ─── Non-fatal metric errors ──────────────────────────────────────────────────

enum class ErrorKind {
    InsufficientData,  ///< Below the minimum sample count for a method
    UndefinedMetric,   ///< Mathematically undefined (flat series, empty limb, ...)
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InsufficientData: return "InsufficientDataError";
        case ErrorKind::UndefinedMetric:  return "UndefinedMetricError";
    }
    return "UnknownError";
}

struct MetricError {
    ErrorKind   kind;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] std::string to_string() const;
};

/// Tagged result of one calculator: the metrics, or why they are undefined.
template <typename T>
using MetricResult = std::variant<T, MetricError>;

template <typename T>
[[nodiscard]] constexpr bool succeeded(const MetricResult<T>& result) noexcept {
    return std::holds_alternative<T>(result);
}

// ─── Fatal configuration errors ───────────────────────────────────────────────

/// Invalid call: the input cannot be interpreted at all.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace cqhyst
