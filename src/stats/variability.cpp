/// @file src/stats/variability.cpp
/// @brief Rolling CVc/CVq windows.
///
/// Each window is evaluated independently from its own samples, so a window
/// result never depends on data outside it.

#include "cqhyst/variability.hpp"
#include "cqhyst/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace cqhyst::stats {

namespace {

struct Moments {
    double      mean;
    double      stddev;
    std::size_t n;
};

/// Mean and Bessel-corrected stddev of the finite values. n < 2 → nullopt.
[[nodiscard]] std::optional<Moments> moments(std::span<const double> values) noexcept {
    double sum = 0.0;
    std::size_t n = 0;
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        sum += v;
        ++n;
    }
    if (n < 2) return std::nullopt;
    const double mean = sum / static_cast<double>(n);

    double sq_sum = 0.0;
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        const double d = v - mean;
        sq_sum += d * d;
    }
    return Moments{mean, std::sqrt(sq_sum / static_cast<double>(n - 1)), n};
}

void check_lengths(std::size_t a, std::size_t b, std::string_view what) {
    if (a != b) {
        throw ConfigurationError(
            fmt::format("{} has mismatched lengths ({} vs {})", what, a, b));
    }
}

}  // namespace

// ─── coefficient_of_variation ─────────────────────────────────────────────────

std::optional<double>
coefficient_of_variation(std::span<const double> values) noexcept {
    const auto m = moments(values);
    if (!m || m->mean == 0.0) return std::nullopt;
    const double cv = m->stddev / m->mean;
    if (!std::isfinite(cv)) return std::nullopt;
    return cv;
}

// ─── cv_ratio ─────────────────────────────────────────────────────────────────

std::optional<double>
cv_ratio(std::span<const double> discharge, std::span<const double> concentration) {
    check_lengths(discharge.size(), concentration.size(), "variability window");

    // Only pairs where both values are finite take part.
    std::vector<double> q;
    std::vector<double> c;
    q.reserve(discharge.size());
    c.reserve(discharge.size());
    for (std::size_t i = 0; i < discharge.size(); ++i) {
        if (std::isfinite(discharge[i]) && std::isfinite(concentration[i])) {
            q.push_back(discharge[i]);
            c.push_back(concentration[i]);
        }
    }

    const auto cv_q = coefficient_of_variation(q);
    const auto cv_c = coefficient_of_variation(c);
    if (!cv_q || !cv_c || *cv_q == 0.0) return std::nullopt;
    const double ratio = *cv_c / *cv_q;
    if (!std::isfinite(ratio)) return std::nullopt;
    return ratio;
}

// ─── rolling_variability ──────────────────────────────────────────────────────

std::vector<VariabilityWindow>
rolling_variability(std::span<const double> time,
                    std::span<const double> discharge,
                    std::span<const double> concentration,
                    std::size_t window) {
    check_lengths(time.size(), discharge.size(), "variability series (time, Q)");
    check_lengths(time.size(), concentration.size(), "variability series (time, C)");
    if (window < 2) {
        throw ConfigurationError(
            fmt::format("variability window must be >= 2 samples, got {}", window));
    }

    std::vector<VariabilityWindow> out;
    if (time.size() < window) return out;
    out.reserve(time.size() - window + 1);

    std::vector<double> q;
    std::vector<double> c;
    for (std::size_t end = window - 1; end < time.size(); ++end) {
        const std::size_t begin = end + 1 - window;

        q.clear();
        c.clear();
        for (std::size_t i = begin; i <= end; ++i) {
            if (std::isfinite(discharge[i]) && std::isfinite(concentration[i])) {
                q.push_back(discharge[i]);
                c.push_back(concentration[i]);
            }
        }

        VariabilityWindow w{
            .window_id  = begin,
            .end_index  = end,
            .start_time = time[begin],
            .end_time   = time[end],
            .n_samples  = q.size(),
            .cv_q       = coefficient_of_variation(q),
            .cv_c       = coefficient_of_variation(c),
            .ratio      = std::nullopt,
            .slope      = fit_power_law(q, c),
        };
        if (w.cv_q && w.cv_c && *w.cv_q != 0.0) {
            const double ratio = *w.cv_c / *w.cv_q;
            if (std::isfinite(ratio)) w.ratio = ratio;
        }
        out.push_back(std::move(w));
    }
    return out;
}

}  // namespace cqhyst::stats
