/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV DataLoader and the classification pipeline
 *
 * Build:
 *   cmake -DCQHYST_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed rows are skipped; only ConfigurationError (missing column)
 *      may escape the parser.
 *   3. Any parsed series classifies without throwing and every confidence
 *      lies in [0, 1].
 *
 * Fuzzer strategy:
 *   The input is prefixed with a valid header so that the row parser, the
 *   ISO-date reader and the numeric field reader see most of the traffic:
 *     • Binary garbage (null bytes, high bytes)
 *     • "NaN", "inf", quoted fields, trailing commas
 *     • Dates with out-of-range months, days and clock fields
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "cqhyst/data_loader.hpp"
#include "cqhyst/errors.hpp"
#include "cqhyst/pipeline.hpp"

using namespace cqhyst;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > 1 << 16) return 0;
    const std::string body(reinterpret_cast<const char*>(data), size);

    try {
        const auto series =
            io::DataLoader::parse_series_csv("site_id,time,flow,concentration\n" + body);
        const auto run = classify::classify_series(series);
        for (const auto& row : run.rows) {
            if (!(row.confidence >= 0.0 && row.confidence <= 1.0)) __builtin_trap();
        }
    } catch (const ConfigurationError&) {
        // Rejected input.
    }

    for (std::size_t i = 0; i < body.size() && i < 64; ++i) {
        (void)io::DataLoader::parse_time(std::string_view(body).substr(i, 32));
    }
    return 0;
}
