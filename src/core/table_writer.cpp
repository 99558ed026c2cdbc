/// @file src/core/table_writer.cpp
/// @brief CSV TableWriter for classification rows.

#include "cqhyst/table_writer.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace cqhyst::io {

namespace {

/// 15 significant digits keep sub-second times in days since 1970.
[[nodiscard]] std::string number(double v) {
    if (!std::isfinite(v)) return {};
    return fmt::format("{:.15g}", v);
}

[[nodiscard]] std::string number(const std::optional<double>& v) {
    return v ? number(*v) : std::string{};
}

template <typename Enum>
[[nodiscard]] std::string label(const std::optional<Enum>& v) {
    return v ? std::string(to_string(*v)) : std::string{};
}

/// Site ids are the only free-text column.
[[nodiscard]] std::string quoted(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char ch : s) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

}  // namespace

std::string TableWriter::header() {
    return "site_id,segment_id,start_time,end_time,start_flow,end_flow,start_conc,end_conc,"
           "flow_diff,conc_diff,phase,confidence,rules,harp_area,zuecco_h,lloyd_hi_new,"
           "primary_hi,window_direction,cv_c,cv_q,cv_ratio,slope,slope_point,slope_linear,"
           "flow_percentile,conc_percentile,flow_position,conc_position,behavior,trajectory,"
           "flow_phase,days_since_peak";
}

std::string TableWriter::format_row(const classify::ClassificationRow& r) {
    return fmt::format(
        "{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}",
        quoted(r.site_id), r.segment_id,
        number(r.start_time), number(r.end_time),
        number(r.start_flow), number(r.end_flow),
        number(r.start_conc), number(r.end_conc),
        number(r.flow_diff), number(r.conc_diff),
        to_char(r.phase), number(r.confidence), fmt::join(r.rules, "|"),
        number(r.hysteresis.harp_area), number(r.hysteresis.zuecco_h),
        number(r.hysteresis.lloyd_hi_new), number(r.hysteresis.primary()),
        label(r.window_direction),
        number(r.cv_c), number(r.cv_q), number(r.cv_ratio),
        number(r.slope), number(r.slope_point), number(r.slope_linear),
        number(r.flow_percentile), number(r.conc_percentile),
        label(r.flow_position), label(r.conc_position),
        to_string(r.behavior), label(r.trajectory),
        label(r.flow_phase), number(r.days_since_peak));
}

void TableWriter::write_csv(std::ostream& out, const classify::ClassificationRun& run) {
    out << header() << '\n';
    for (const auto& row : run.rows) out << format_row(row) << '\n';
}

std::string TableWriter::to_csv(const classify::ClassificationRun& run) {
    std::ostringstream out;
    write_csv(out, run);
    return out.str();
}

bool TableWriter::save_csv(const std::string& filepath, const classify::ClassificationRun& run) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("cannot open '{}' for writing", filepath);
        return false;
    }
    write_csv(file, run);
    spdlog::info("wrote {} rows to '{}'", run.rows.size(), filepath);
    return static_cast<bool>(file);
}

void TableWriter::write_metrics(std::ostream& out, const std::map<std::string, double>& metrics) {
    out << "metric,value\n";
    for (const auto& [key, value] : metrics) {
        fmt::print(out, "{},{}\n", key, number(value));
    }
}

}  // namespace cqhyst::io
