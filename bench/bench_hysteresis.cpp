/**
 * @file  bench/bench_hysteresis.cpp
 * @brief Google Benchmark suite for the hysteresis calculators and the
 *        segment classification pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Harp / BM_Zuecco / BM_Lloyd   single calculator on an N-sample event
 *   BM_Orchestrator                  all three methods plus normalisation
 *   BM_Pipeline                      end-to-end classification of a series
 *
 * Build (CMake):
 *   cmake -DCQHYST_BENCH=ON ..
 *   cmake --build build --target bench_hysteresis
 *   ./build/bench_hysteresis --benchmark_format=json
 *
 * Throughput units: items/second (samples processed).
 */

#include "benchmark/benchmark.h"

#include "cqhyst/hysteresis.hpp"
#include "cqhyst/metrics.hpp"
#include "cqhyst/pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <string>

using namespace cqhyst;

namespace {

/// One storm: Q rises and falls once, C leads Q by a quarter of the event.
Event make_event(std::size_t n) {
    Event ev;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(n - 1);
        ev.time.push_back(static_cast<double>(i) * 0.25);
        ev.discharge.push_back(1.0 + 9.0 * std::sin(std::numbers::pi * x));
        ev.concentration.push_back(1.0 + 4.0 * std::sin(std::numbers::pi * std::min(1.0, x * 1.3)));
    }
    return ev;
}

MonitoringSeries make_series(std::size_t sites, std::size_t samples) {
    MonitoringSeries series;
    for (std::size_t s = 0; s < sites; ++s) {
        const std::string id = "site" + std::to_string(s);
        for (std::size_t i = 0; i < samples; ++i) {
            const double w = 2.0 * std::numbers::pi * static_cast<double>(i) / 26.0;
            series.push_back({id, static_cast<double>(i) * 14.0,
                              5.0 + 4.0 * std::sin(w + 0.3 * static_cast<double>(s)),
                              2.0 + 1.5 * std::sin(w + 0.8)});
        }
    }
    return series;
}

template <typename Calculator>
void run_calculator(benchmark::State& state) {
    const Event ev = make_event(static_cast<std::size_t>(state.range(0)));
    const Calculator calc;
    for (auto _ : state) {
        auto result = calc.compute(ev);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

}  // namespace

static void BM_Harp(benchmark::State& state)   { run_calculator<hysteresis::HarpCalculator>(state); }
static void BM_Zuecco(benchmark::State& state) { run_calculator<hysteresis::ZueccoCalculator>(state); }
static void BM_Lloyd(benchmark::State& state)  { run_calculator<hysteresis::LloydCalculator>(state); }
BENCHMARK(BM_Harp)->RangeMultiplier(4)->Range(16, 4096);
BENCHMARK(BM_Zuecco)->RangeMultiplier(4)->Range(16, 4096);
BENCHMARK(BM_Lloyd)->RangeMultiplier(4)->Range(16, 4096);

static void BM_Orchestrator(benchmark::State& state) {
    const Event ev = make_event(static_cast<std::size_t>(state.range(0)));
    const hysteresis::MetricsOrchestrator orchestrator;
    for (auto _ : state) {
        auto report = orchestrator.analyze(ev);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Orchestrator)->RangeMultiplier(4)->Range(16, 4096);

static void BM_Pipeline(benchmark::State& state) {
    const auto samples = static_cast<std::size_t>(state.range(0));
    const MonitoringSeries series = make_series(4, samples);
    const classify::ClassificationPipeline pipeline;
    for (auto _ : state) {
        auto run = pipeline.run(series);
        benchmark::DoNotOptimize(run);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(series.size()));
}
BENCHMARK(BM_Pipeline)->Arg(52)->Arg(260)->Arg(1040);

BENCHMARK_MAIN();
