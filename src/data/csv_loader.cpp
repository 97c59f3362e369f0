#include "data/csv_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <tracemark/logger.hpp>
#include <tracemark/session_model.hpp>

namespace tracemark
{

namespace
{

char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

std::string trimmed(std::string s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    return s;
}

bool try_parse_double(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    char*  end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (end == s.c_str() || (end && *end != '\0'))
        return false;
    out = val;
    return true;
}

// Split a line by delimiter, respecting quoted fields.
std::vector<std::string> split_line(const std::string& line, char delim)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     in_quotes = false;

    for (char c : line)
    {
        if (c == '"')
            in_quotes = !in_quotes;
        else if (c == delim && !in_quotes)
        {
            fields.push_back(trimmed(field));
            field.clear();
        }
        else
            field += c;
    }
    fields.push_back(trimmed(field));
    return fields;
}

bool is_index_header(std::string header)
{
    std::transform(header.begin(),
                   header.end(),
                   header.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return header == "time" || header == "timestamp" || header == "date" || header == "datetime"
           || header == "index" || header == "x";
}

}   // namespace

std::optional<double> parse_timestamp(std::string_view text)
{
    std::string s = trimmed(std::string(text));
    if (s.size() < 10 || s[4] != '-' || s[7] != '-')
        return std::nullopt;

    std::tm tm{};
    int     consumed = 0;
    int matched =
        std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &consumed);
    if (matched != 3 || consumed != 10)
        return std::nullopt;

    double fraction = 0.0;
    if (s.size() > 10)
    {
        if (s[10] != ' ' && s[10] != 'T')
            return std::nullopt;
        int rest = 0;
        if (std::sscanf(s.c_str() + 11, "%2d:%2d:%2d%n", &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &rest)
            != 3)
            return std::nullopt;
        size_t pos = 11 + static_cast<size_t>(rest);
        if (pos < s.size() && s[pos] == '.')
        {
            size_t digits_end = pos + 1;
            while (digits_end < s.size() && std::isdigit(static_cast<unsigned char>(s[digits_end])))
                ++digits_end;
            fraction = std::strtod(s.substr(pos, digits_end - pos).c_str(), nullptr);
            pos      = digits_end;
        }
        if (pos < s.size() && s[pos] == 'Z')
            ++pos;
        if (pos != s.size())
            return std::nullopt;
    }

    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31)
        return std::nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return static_cast<double>(timegm(&tm)) + fraction;
}

CsvData parse_csv_text(const std::string& text)
{
    CsvData result;

    std::vector<std::string> lines;
    std::istringstream       in(text);
    std::string              line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!trimmed(line).empty())
            lines.push_back(line);
    }

    if (lines.empty())
    {
        result.error = "File is empty";
        return result;
    }

    char delim        = detect_delimiter(lines[0]);
    auto first_fields = split_line(lines[0], delim);
    result.num_cols   = first_fields.size();

    bool has_header = false;
    for (const auto& f : first_fields)
    {
        double dummy;
        if (!try_parse_double(f, dummy) && !parse_timestamp(f))
        {
            has_header = true;
            break;
        }
    }

    size_t data_start = 0;
    if (has_header)
    {
        result.headers = first_fields;
        data_start     = 1;
    }
    else
    {
        for (size_t i = 0; i < result.num_cols; ++i)
            result.headers.push_back("Column " + std::to_string(i + 1));
    }

    if (data_start < lines.size())
    {
        auto   first_row = split_line(lines[data_start], delim);
        double dummy;
        result.time_index = !first_row.empty() && !try_parse_double(first_row[0], dummy)
                            && parse_timestamp(first_row[0]).has_value();
    }

    result.columns.resize(result.num_cols);
    for (size_t i = data_start; i < lines.size(); ++i)
    {
        auto fields = split_line(lines[i], delim);
        for (size_t c = 0; c < result.num_cols; ++c)
        {
            double val = std::numeric_limits<double>::quiet_NaN();
            if (c < fields.size())
            {
                if (c == 0 && result.time_index)
                    val = parse_timestamp(fields[c]).value_or(val);
                else
                    try_parse_double(fields[c], val);
            }
            result.columns[c].push_back(val);
        }
    }

    result.num_rows = lines.size() - data_start;
    return result;
}

CsvData parse_csv(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        CsvData result;
        result.error = "Cannot open file: " + path;
        return result;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse_csv_text(text);
}

SeriesSource csv_to_source(const CsvData& data, const std::string& source_name)
{
    SeriesSource::List records;
    if (!data.error.empty() || data.num_cols == 0)
    {
        TRACEMARK_LOG_ERROR("io", "Cannot load {}: {}", source_name, data.error);
        return SeriesSource::list(std::move(records));
    }

    bool indexed = data.time_index || (data.num_cols > 1 && is_index_header(data.headers[0]));
    size_t first_value_col = indexed ? 1 : 0;

    for (size_t c = first_value_col; c < data.num_cols; ++c)
    {
        Series series = indexed
                            ? Series(data.columns[0],
                                     data.columns[c],
                                     data.time_index ? IndexKind::Time : IndexKind::Number)
                            : Series::from_values(data.columns[c]);

        SeriesSource::Record record;
        record.series   = std::move(series);
        record.name     = data.headers[c];
        record.metadata = {{"source", source_name}, {"column", data.headers[c]}};
        records.emplace_back(std::move(record));
    }

    TRACEMARK_LOG_INFO("io",
                       "Loaded {} columns ({} rows) from {}",
                       records.size(),
                       data.num_rows,
                       source_name);
    return SeriesSource::list(std::move(records));
}

SeriesSource load_csv_series(const std::string& path)
{
    return csv_to_source(parse_csv(path), path);
}

std::vector<std::string> list_csv_files(const std::string& directory)
{
    std::vector<std::string> files;
    std::error_code          ec;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec))
    {
        if (!entry.is_regular_file())
            continue;
        auto ext = entry.path().extension().string();
        std::transform(ext.begin(),
                       ext.end(),
                       ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".csv" || ext == ".tsv" || ext == ".txt")
            files.push_back(entry.path().string());
    }
    if (ec)
        TRACEMARK_LOG_WARN("io", "Cannot list {}: {}", directory, ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

size_t load_csv_paths(SessionModel& model, const std::vector<std::string>& paths)
{
    size_t added = 0;
    for (const auto& path : paths)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec))
        {
            auto files = list_csv_files(path);
            if (files.empty())
                TRACEMARK_LOG_WARN("io", "No CSV files in {}", path);
            for (const auto& file : files)
                added += load_sources(model, load_csv_series(file));
            continue;
        }
        added += load_sources(model, load_csv_series(path));
    }
    return added;
}

}   // namespace tracemark
