/**
 * @file  fuzz_hysteresis.cpp
 * @brief libFuzzer target for the MetricsOrchestrator (HARP, Zuecco, Lloyd)
 *
 * Build:
 *   cmake -DCQHYST_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_hysteresis
 *
 * Run for 60 seconds:
 *   ./fuzz_hysteresis -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Only ConfigurationError may escape analyze() (decreasing time).
 *   3. Every HInew sample lies in [−1, 1].
 *   4. A report without errors has all three methods populated.
 *
 * Fuzzer strategy:
 *   The input is read as consecutive (ΔT, Q, C) double triples. ΔT is made
 *   non-negative so most inputs pass validation, while Q and C keep every
 *   bit pattern, including NaN, ±inf, denormals and huge magnitudes.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "cqhyst/errors.hpp"
#include "cqhyst/metrics.hpp"

using namespace cqhyst;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr std::size_t TRIPLE = 3 * sizeof(double);
    const std::size_t n = size / TRIPLE;
    if (n > 4096) return 0;

    Event ev;
    double t = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double v[3];
        std::memcpy(v, data + i * TRIPLE, TRIPLE);
        if (std::isfinite(v[0])) t += std::abs(v[0]);
        ev.time.push_back(t);
        ev.discharge.push_back(v[1]);
        ev.concentration.push_back(v[2]);
    }

    try {
        const auto report = hysteresis::MetricsOrchestrator{}.analyze(ev);
        if (report.lloyd) {
            for (const auto& s : report.lloyd->samples) {
                if (s.hi_new && (*s.hi_new < -1.0 || *s.hi_new > 1.0)) __builtin_trap();
            }
        }
        if (!report.error && !(report.harp && report.zuecco && report.lloyd)) __builtin_trap();
    } catch (const ConfigurationError&) {
        // Overflowing time sums can still produce an invalid event.
    }
    return 0;
}
