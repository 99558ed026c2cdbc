#pragma once

/// @file include/cqhyst/data_loader.hpp
/// @brief CSV loaders for flow events, monitoring series and high-res flow.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV tables into the in-memory types the calculators consume. Column
/// names are chosen by the caller and matched case-insensitively against the
/// header row.
///
/// ## Expected CSV Format
/// ```
/// site_id,date,flow,concentration
/// A,2021-03-01,12.4,0.83
/// A,2021-03-08,30.1,1.20
/// ```
/// Time is either a number of days or an ISO date (`YYYY-MM-DD`, optionally
/// followed by `THH:MM[:SS]`), converted to days since 1970-01-01.
///
/// ## Guarantees
/// - A required column missing from the header → `ConfigurationError`
/// - Rows with an unparsable time are skipped with a warning
/// - An empty Q or C field is read as NaN; calculators drop such rows
/// - `load_*` return `nullopt` only when the file cannot be opened

#include "cqhyst/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cqhyst::io {

struct EventColumns {
    std::string time          = "time";
    std::string discharge     = "discharge";
    std::string concentration = "concentration";
};

struct SeriesColumns {
    std::string site          = "site_id";
    std::string time          = "time";
    std::string flow          = "flow";
    std::string concentration = "concentration";
};

struct FlowColumns {
    std::string site = "site_id";
    std::string time = "time";
    std::string flow = "flow";
};

class DataLoader {
public:
    /// Parse one event table.
    ///
    /// # Throws
    /// `ConfigurationError` for a missing column or decreasing time.
    [[nodiscard]] static Event
    parse_event_csv(const std::string& csv_content, const EventColumns& columns = {});

    [[nodiscard]] static std::optional<Event>
    load_event_csv(const std::string& filepath, const EventColumns& columns = {});

    /// Parse a long monitoring table with one row per (site, time).
    ///
    /// # Throws
    /// `ConfigurationError` for a missing column.
    [[nodiscard]] static MonitoringSeries
    parse_series_csv(const std::string& csv_content, const SeriesColumns& columns = {});

    [[nodiscard]] static std::optional<MonitoringSeries>
    load_series_csv(const std::string& filepath, const SeriesColumns& columns = {});

    /// Parse a high-resolution flow table, grouped by site.
    [[nodiscard]] static HighResFlow
    parse_flow_csv(const std::string& csv_content, const FlowColumns& columns = {});

    [[nodiscard]] static std::optional<HighResFlow>
    load_flow_csv(const std::string& filepath, const FlowColumns& columns = {});

    /// Days from a numeric token or an ISO date; nullopt if neither.
    [[nodiscard]] static std::optional<double> parse_time(std::string_view token) noexcept;

    /// Numeric value of a field; NaN for an empty field, nullopt if malformed.
    [[nodiscard]] static std::optional<double> parse_value(std::string_view token) noexcept;
};

}  // namespace cqhyst::io
