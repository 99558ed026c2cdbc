/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for events, monitoring series and high-res flow.

#include "cqhyst/data_loader.hpp"
#include "cqhyst/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace cqhyst::io {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    s = s.substr(first, last - first + 1);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

[[nodiscard]] std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) fields.emplace_back(trim(token));
    // A trailing comma still denotes an (empty) last field.
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

[[nodiscard]] std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

/// Header row and the data rows that follow it. Blank and '#' lines are skipped.
struct Table {
    std::vector<std::string>              header;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::size_t>              line_numbers;

    [[nodiscard]] std::size_t column(const std::string& name) const {
        const std::string wanted = lower(name);
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (lower(header[i]) == wanted) return i;
        }
        throw ConfigurationError(fmt::format("missing column '{}' (available: {})",
                                             name, fmt::join(header, ", ")));
    }
};

[[nodiscard]] Table read_table(const std::string& csv_content) {
    Table table;
    std::istringstream stream(csv_content);
    std::string line;
    std::size_t line_no = 0;
    bool header_read = false;

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty() || line[0] == '#') continue;

        if (!header_read) {
            table.header = split_row(line);
            header_read = true;
            continue;
        }
        table.rows.push_back(split_row(line));
        table.line_numbers.push_back(line_no);
    }
    return table;
}

[[nodiscard]] std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("cannot open '{}'", filepath);
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

[[nodiscard]] std::optional<int> parse_int(std::string_view s) noexcept {
    if (s.empty() || s.size() > 9) return std::nullopt;
    int v = 0;
    for (char ch : s) {
        if (ch < '0' || ch > '9') return std::nullopt;
        v = v * 10 + (ch - '0');
    }
    return v;
}

/// `YYYY-MM-DD[(T| )HH:MM[:SS]]` → days since 1970-01-01.
[[nodiscard]] std::optional<double> parse_iso_date(std::string_view s) noexcept {
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    const auto y = parse_int(s.substr(0, 4));
    const auto m = parse_int(s.substr(5, 2));
    const auto d = parse_int(s.substr(8, 2));
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{std::chrono::year{*y},
                                          std::chrono::month{static_cast<unsigned>(*m)},
                                          std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;
    double days = static_cast<double>(
        std::chrono::sys_days{ymd}.time_since_epoch().count());

    if (s.size() == 10) return days;
    if (s[10] != 'T' && s[10] != ' ') return std::nullopt;
    const auto clock = s.substr(11);
    if (clock.size() < 5 || clock[2] != ':') return std::nullopt;
    const auto hh = parse_int(clock.substr(0, 2));
    const auto mm = parse_int(clock.substr(3, 2));
    if (!hh || !mm || *hh > 23 || *mm > 59) return std::nullopt;
    int ss = 0;
    if (clock.size() >= 8 && clock[5] == ':') {
        const auto sec = parse_int(clock.substr(6, 2));
        if (!sec || *sec > 60) return std::nullopt;
        ss = *sec;
    }
    days += (*hh * 3600.0 + *mm * 60.0 + ss) / 86400.0;
    return days;
}

void warn_skipped(std::size_t skipped, std::string_view what) {
    if (skipped > 0) spdlog::warn("skipped {} malformed {} rows", skipped, what);
}

}  // namespace

// ─── Field parsing ────────────────────────────────────────────────────────────

std::optional<double> DataLoader::parse_value(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::numeric_limits<double>::quiet_NaN();
    const std::string lowered = lower(token);
    if (lowered == "nan" || lowered == "na") return std::numeric_limits<double>::quiet_NaN();
    try {
        const std::string s(token);
        std::size_t pos = 0;
        const double val = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;  // trailing garbage
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> DataLoader::parse_time(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;
    if (auto date = parse_iso_date(token)) return date;
    const auto v = parse_value(token);
    if (!v || !std::isfinite(*v)) return std::nullopt;
    return v;
}

// ─── Events ───────────────────────────────────────────────────────────────────

Event DataLoader::parse_event_csv(const std::string& csv_content, const EventColumns& columns) {
    const Table table = read_table(csv_content);
    const std::size_t ti = table.column(columns.time);
    const std::size_t qi = table.column(columns.discharge);
    const std::size_t ci = table.column(columns.concentration);
    const std::size_t width = std::max({ti, qi, ci}) + 1;

    std::vector<double> time;
    std::vector<double> discharge;
    std::vector<double> concentration;
    std::size_t skipped = 0;

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const auto t = row.size() >= width ? parse_time(row[ti]) : std::nullopt;
        const auto q = t ? parse_value(row[qi]) : std::nullopt;
        const auto c = q ? parse_value(row[ci]) : std::nullopt;
        if (!c) {
            spdlog::debug("skipping event row at line {}", table.line_numbers[r]);
            ++skipped;
            continue;
        }
        time.push_back(*t);
        discharge.push_back(*q);
        concentration.push_back(*c);
    }
    warn_skipped(skipped, "event");
    return Event::make(std::move(time), std::move(discharge), std::move(concentration));
}

std::optional<Event>
DataLoader::load_event_csv(const std::string& filepath, const EventColumns& columns) {
    auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_event_csv(*contents, columns);
}

// ─── Monitoring series ────────────────────────────────────────────────────────

MonitoringSeries
DataLoader::parse_series_csv(const std::string& csv_content, const SeriesColumns& columns) {
    const Table table = read_table(csv_content);
    const std::size_t si = table.column(columns.site);
    const std::size_t ti = table.column(columns.time);
    const std::size_t qi = table.column(columns.flow);
    const std::size_t ci = table.column(columns.concentration);
    const std::size_t width = std::max({si, ti, qi, ci}) + 1;

    MonitoringSeries series;
    series.reserve(table.rows.size());
    std::size_t skipped = 0;

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const auto t = row.size() >= width ? parse_time(row[ti]) : std::nullopt;
        const auto q = t ? parse_value(row[qi]) : std::nullopt;
        const auto c = q ? parse_value(row[ci]) : std::nullopt;
        if (!c || row[si].empty()) {
            spdlog::debug("skipping series row at line {}", table.line_numbers[r]);
            ++skipped;
            continue;
        }
        series.push_back(Observation{row[si], *t, *q, *c});
    }
    warn_skipped(skipped, "series");
    spdlog::info("loaded {} observations", series.size());
    return series;
}

std::optional<MonitoringSeries>
DataLoader::load_series_csv(const std::string& filepath, const SeriesColumns& columns) {
    auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_series_csv(*contents, columns);
}

// ─── High-resolution flow ─────────────────────────────────────────────────────

HighResFlow DataLoader::parse_flow_csv(const std::string& csv_content, const FlowColumns& columns) {
    const Table table = read_table(csv_content);
    const std::size_t si = table.column(columns.site);
    const std::size_t ti = table.column(columns.time);
    const std::size_t qi = table.column(columns.flow);
    const std::size_t width = std::max({si, ti, qi}) + 1;

    HighResFlow flow;
    std::size_t skipped = 0;
    for (const auto& row : table.rows) {
        const auto t = row.size() >= width ? parse_time(row[ti]) : std::nullopt;
        const auto q = t ? parse_value(row[qi]) : std::nullopt;
        if (!q || !std::isfinite(*q) || row[si].empty()) {
            ++skipped;
            continue;
        }
        flow[row[si]].push_back(FlowSample{*t, *q});
    }
    warn_skipped(skipped, "flow");
    return flow;
}

std::optional<HighResFlow>
DataLoader::load_flow_csv(const std::string& filepath, const FlowColumns& columns) {
    auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_flow_csv(*contents, columns);
}

}  // namespace cqhyst::io
