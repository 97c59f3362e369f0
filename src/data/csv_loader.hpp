#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tracemark/series_source.hpp>
#include <vector>

namespace tracemark
{

// Lightweight CSV parser for numeric data.
// Supports comma, semicolon, and tab delimiters.
// First row is treated as header if it contains a field that is neither a number
// nor a timestamp. A first column of ISO-8601 timestamps becomes a time index.
struct CsvData
{
    std::vector<std::string>         headers;   // Column names (generated if no header row)
    std::vector<std::vector<double>> columns;   // Column-major; unparsable cells are NaN
    size_t                           num_rows   = 0;
    size_t                           num_cols   = 0;
    bool                             time_index = false;   // Column 0 holds epoch seconds
    std::string                      error;                // Non-empty on parse failure
};

CsvData parse_csv(const std::string& path);
CsvData parse_csv_text(const std::string& text);

// "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[.fff][Z]", read as UTC.
std::optional<double> parse_timestamp(std::string_view text);

// One record per value column, indexed by the first column when it is a time or index
// column, positionally otherwise. Metadata carries the source and column name.
SeriesSource csv_to_source(const CsvData& data, const std::string& source_name);

// parse_csv + csv_to_source; the file path doubles as the source name.
SeriesSource load_csv_series(const std::string& path);

// List .csv/.tsv/.txt files in a directory (non-recursive).
std::vector<std::string> list_csv_files(const std::string& directory);

// Loads every file, expanding directories with list_csv_files(), into `model`.
// Returns the number of items the model accepted.
size_t load_csv_paths(SessionModel& model, const std::vector<std::string>& paths);

}   // namespace tracemark
