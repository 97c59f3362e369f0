#include "data/gaps.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace tracemark::data
{

std::vector<MarkingRecord> detect_gaps(const Series& series, double threshold, Label label)
{
    std::vector<MarkingRecord> gaps;
    auto                       index = series.index();
    for (size_t i = 1; i < index.size(); ++i)
    {
        if (index[i] - index[i - 1] > threshold)
            gaps.push_back(MarkingRecord{index[i - 1], index[i], label, std::nullopt});
    }
    return gaps;
}

std::optional<double> parse_gap_threshold(std::string_view text, IndexKind kind)
{
    std::string s(text);
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }),
            s.end());
    if (s.empty())
        return std::nullopt;

    char*  end   = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || value < 0.0)
        return std::nullopt;

    std::string unit(end);
    std::transform(unit.begin(),
                   unit.end(),
                   unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (kind == IndexKind::Number)
    {
        if (!unit.empty())
            return std::nullopt;
        return value;
    }

    if (unit.empty() || unit == "s" || unit == "sec")
        return value;
    if (unit == "ms")
        return value / 1000.0;
    if (unit == "min" || unit == "t")
        return value * 60.0;
    if (unit == "h")
        return value * 3600.0;
    if (unit == "d")
        return value * 86400.0;
    return std::nullopt;
}

}   // namespace tracemark::data
