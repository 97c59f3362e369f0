#include <algorithm>
#include <cmath>
#include <numeric>
#include <tracemark/series.hpp>

namespace tracemark
{

const char* index_kind_name(IndexKind kind)
{
    return kind == IndexKind::Time ? "time" : "number";
}

Series::Series(std::vector<double> index,
               std::vector<double> values,
               IndexKind           kind,
               std::string         name)
    : index_(std::move(index)), values_(std::move(values)), kind_(kind)
{
    if (!name.empty())
        name_ = std::move(name);
    validate();
}

Series Series::from_values(std::vector<double> values, std::string name)
{
    std::vector<double> index(values.size());
    std::iota(index.begin(), index.end(), 0.0);
    return Series(std::move(index), std::move(values), IndexKind::Number, std::move(name));
}

Series Series::from_time_points(const std::vector<TimePoint>& index,
                                std::vector<double>           values,
                                std::string                   name)
{
    std::vector<double> seconds;
    seconds.reserve(index.size());
    for (const auto& tp : index)
    {
        seconds.push_back(std::chrono::duration<double>(tp.time_since_epoch()).count());
    }
    return Series(std::move(seconds), std::move(values), IndexKind::Time, std::move(name));
}

void Series::validate()
{
    if (index_.size() != values_.size())
    {
        error_ = "index has " + std::to_string(index_.size()) + " entries but there are "
                 + std::to_string(values_.size()) + " values";
        return;
    }
    for (size_t i = 0; i < index_.size(); ++i)
    {
        if (!std::isfinite(index_[i]))
        {
            error_ = "non-finite index at position " + std::to_string(i);
            return;
        }
        if (i > 0 && !(index_[i] > index_[i - 1]))
        {
            error_ = "index is not strictly increasing at position " + std::to_string(i);
            return;
        }
    }
}

std::pair<size_t, size_t> Series::slice_bounds(double x0, double x1) const
{
    if (x1 < x0)
        std::swap(x0, x1);
    auto first = std::lower_bound(index_.begin(), index_.end(), x0);
    auto last  = std::upper_bound(first, index_.end(), x1);
    return {static_cast<size_t>(first - index_.begin()),
            static_cast<size_t>(last - index_.begin())};
}

std::optional<std::pair<double, double>> Series::value_range(size_t first, size_t last) const
{
    last = std::min(last, values_.size());
    std::optional<std::pair<double, double>> range;
    for (size_t i = first; i < last; ++i)
    {
        double v = values_[i];
        if (std::isnan(v))
            continue;
        if (!range)
            range = std::make_pair(v, v);
        else
        {
            range->first  = std::min(range->first, v);
            range->second = std::max(range->second, v);
        }
    }
    return range;
}

}   // namespace tracemark
