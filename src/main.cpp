/// @file src/main.cpp
/// @brief cqhyst CLI entry point.
///
/// Usage:
///   cqhyst --event <csv>      Hysteresis metrics of one flow event
///   cqhyst --classify <csv>   Phase classification of a monitoring series
///   cqhyst --help             Print usage

#include "cqhyst/data_loader.hpp"
#include "cqhyst/errors.hpp"
#include "cqhyst/metrics.hpp"
#include "cqhyst/pipeline.hpp"
#include "cqhyst/table_writer.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  cqhyst --event <csv>      Print HARP, Zuecco and Lloyd metrics of one event\n"
        "  cqhyst --classify <csv>   Classify a monitoring series into F/L/C/D/R/V phases\n"
        "  cqhyst --help             Show this help\n"
        "\n"
        "Options:\n"
        "  --time <name>       Time column (default: time)\n"
        "  --flow <name>       Discharge column (default: discharge for --event, flow otherwise)\n"
        "  --conc <name>       Concentration column (default: concentration)\n"
        "  --site <name>       Site column for --classify (default: site_id)\n"
        "  --highres <csv>     High-resolution flow table (site, time, flow) for --classify\n"
        "  --window <n>        Rolling CVc/CVq window in samples (default: 5)\n"
        "  --output <csv>      Write the result here instead of stdout\n"
        "  --verbose           Debug logging\n"
        "\n"
        "Time may be given in days or as ISO dates (YYYY-MM-DD).\n"
    );
}

struct Options {
    std::optional<std::string> event;
    std::optional<std::string> classify;
    std::optional<std::string> highres;
    std::optional<std::string> output;
    std::optional<std::string> time;
    std::optional<std::string> flow;
    std::optional<std::string> conc;
    std::optional<std::string> site;
    std::size_t                window  = cqhyst::constants::DEFAULT_CV_WINDOW;
    bool                       verbose = false;
    bool                       help    = false;
};

/// Returns nullopt (after printing the reason) on a malformed command line.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") { opts.help = true; continue; }
        if (arg == "--verbose" || arg == "-v") { opts.verbose = true; continue; }

        std::optional<std::string>* target = nullptr;
        if      (arg == "--event")    target = &opts.event;
        else if (arg == "--classify") target = &opts.classify;
        else if (arg == "--highres")  target = &opts.highres;
        else if (arg == "--output")   target = &opts.output;
        else if (arg == "--time")     target = &opts.time;
        else if (arg == "--flow")     target = &opts.flow;
        else if (arg == "--conc")     target = &opts.conc;
        else if (arg == "--site")     target = &opts.site;

        if (target == nullptr && arg != "--window") {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (target != nullptr) {
            *target = value;
            continue;
        }
        std::size_t window = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), window);
        if (ec != std::errc{} || ptr != value.data() + value.size() || window < 2) {
            fmt::print(stderr, "Error: --window expects an integer >= 2, got '{}'\n", value);
            return std::nullopt;
        }
        opts.window = window;
    }
    return opts;
}

/// Metric dictionary of one event. Returns 0 if every method succeeded,
/// 2 if some were undefined, 1 on error.
int run_event(const Options& opts) {
    cqhyst::io::EventColumns columns;
    if (opts.time) columns.time = *opts.time;
    if (opts.flow) columns.discharge = *opts.flow;
    if (opts.conc) columns.concentration = *opts.conc;

    auto event = cqhyst::io::DataLoader::load_event_csv(*opts.event, columns);
    if (!event) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.event);
        return 1;
    }

    const cqhyst::hysteresis::MetricsOrchestrator orchestrator;
    const auto report = orchestrator.analyze(*event);
    if (report.error) spdlog::warn("{}", *report.error);

    const auto metrics = report.to_metric_map();
    if (opts.output) {
        std::ofstream file(*opts.output);
        if (!file.is_open()) {
            fmt::print(stderr, "Error: cannot write '{}'\n", *opts.output);
            return 1;
        }
        cqhyst::io::TableWriter::write_metrics(file, metrics);
    } else {
        cqhyst::io::TableWriter::write_metrics(std::cout, metrics);
    }

    const auto& c = report.classifications;
    fmt::print(stderr, "HARP: {}  Lloyd: {}  Lawler: {}\n",
               cqhyst::hysteresis::to_string(c.harp),
               cqhyst::hysteresis::to_string(c.lloyd),
               cqhyst::hysteresis::to_string(c.lawler));
    return report.complete() ? 0 : 2;
}

/// Classification table of a monitoring series. Returns 0 on success, 1 on error.
int run_classify(const Options& opts) {
    cqhyst::io::SeriesColumns columns;
    if (opts.site) columns.site = *opts.site;
    if (opts.time) columns.time = *opts.time;
    if (opts.flow) columns.flow = *opts.flow;
    if (opts.conc) columns.concentration = *opts.conc;

    auto series = cqhyst::io::DataLoader::load_series_csv(*opts.classify, columns);
    if (!series) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.classify);
        return 1;
    }
    if (series->empty()) {
        fmt::print(stderr, "Error: no valid observations loaded from '{}'\n", *opts.classify);
        return 1;
    }

    cqhyst::HighResFlow highres;
    if (opts.highres) {
        cqhyst::io::FlowColumns flow_columns;
        if (opts.site) flow_columns.site = *opts.site;
        if (opts.time) flow_columns.time = *opts.time;
        if (opts.flow) flow_columns.flow = *opts.flow;
        auto loaded = cqhyst::io::DataLoader::load_flow_csv(*opts.highres, flow_columns);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.highres);
            return 1;
        }
        highres = std::move(*loaded);
    }

    cqhyst::classify::PipelineConfig config;
    config.cv_window = opts.window;
    const cqhyst::classify::ClassificationPipeline pipeline(config);
    const auto run = pipeline.run(*series, highres);

    if (opts.output) {
        if (!cqhyst::io::TableWriter::save_csv(*opts.output, run)) {
            fmt::print(stderr, "Error: cannot write '{}'\n", *opts.output);
            return 1;
        }
        fmt::print("Classified {} segments into '{}'\n", run.rows.size(), *opts.output);
    } else {
        cqhyst::io::TableWriter::write_csv(std::cout, run);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    if (opts->help) {
        print_usage();
        return 0;
    }

    spdlog::set_level(opts->verbose ? spdlog::level::debug : spdlog::level::warn);

    if (opts->event.has_value() == opts->classify.has_value()) {
        fmt::print(stderr, "Error: give exactly one of --event or --classify\n");
        print_usage();
        return 1;
    }

    try {
        return opts->event ? run_event(*opts) : run_classify(*opts);
    } catch (const cqhyst::ConfigurationError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
