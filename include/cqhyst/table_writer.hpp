#pragma once

/// @file include/cqhyst/table_writer.hpp
/// @brief CSV output for classification tables and event metric dictionaries.
///
/// Undefined values (nullopt or NaN) are written as empty fields; the rule
/// list of a row is joined with `|`.

#include "cqhyst/pipeline.hpp"

#include <map>
#include <ostream>
#include <string>

namespace cqhyst::io {

class TableWriter {
public:
    /// Header line of the classification table, without a newline.
    [[nodiscard]] static std::string header();

    /// One classification row, without a newline.
    [[nodiscard]] static std::string format_row(const classify::ClassificationRow& row);

    static void write_csv(std::ostream& out, const classify::ClassificationRun& run);

    [[nodiscard]] static std::string to_csv(const classify::ClassificationRun& run);

    /// Write the table to a file. Returns false if the file cannot be opened.
    [[nodiscard]] static bool save_csv(const std::string& filepath,
                                       const classify::ClassificationRun& run);

    /// `metric,value` lines in key order.
    static void write_metrics(std::ostream& out, const std::map<std::string, double>& metrics);
};

}  // namespace cqhyst::io
