#include "data/decimation.hpp"

#include <algorithm>
#include <cmath>
#include <tracemark/logger.hpp>
#include <tracemark/series.hpp>

namespace tracemark::data
{

double outline_bucket_period(double span_seconds, std::size_t n, std::size_t target_points)
{
    if (n == 0 || target_points == 0)
        return 1.0;

    double period = span_seconds / static_cast<double>(target_points);
    if (span_seconds / static_cast<double>(n) <= 0.1)
    {
        // Above 10 Hz on average: whole milliseconds, never 0 ms.
        double ms = std::max(std::floor(period * 1000.0), 1.0);
        return ms / 1000.0;
    }
    return std::floor(std::max(period, 1.0));
}

DecimatedSeries bucket_mean(std::span<const double> x, std::span<const double> y, double period)
{
    DecimatedSeries out;
    const std::size_t n = std::min(x.size(), y.size());
    if (n == 0 || !(period > 0.0))
        return out;

    double      bucket = std::floor(x[0] / period);
    double      sum    = 0.0;
    std::size_t count  = 0;

    auto flush = [&]()
    {
        if (count > 0)
        {
            out.x.push_back(bucket * period);
            out.y.push_back(sum / static_cast<double>(count));
        }
        sum   = 0.0;
        count = 0;
    };

    for (std::size_t i = 0; i < n; ++i)
    {
        double b = std::floor(x[i] / period);
        if (b != bucket)
        {
            flush();
            bucket = b;
        }
        if (!std::isnan(y[i]))
        {
            sum += y[i];
            ++count;
        }
    }
    flush();
    return out;
}

DecimatedSeries stride_subsample(std::span<const double> x,
                                 std::span<const double> y,
                                 std::size_t             stride)
{
    DecimatedSeries out;
    const std::size_t n = std::min(x.size(), y.size());
    stride              = std::max<std::size_t>(stride, 1);
    out.x.reserve(n / stride + 1);
    out.y.reserve(n / stride + 1);
    for (std::size_t i = 0; i < n; i += stride)
    {
        out.x.push_back(x[i]);
        out.y.push_back(y[i]);
    }
    return out;
}

DecimatedSeries outline_decimate(const Series& series,
                                 std::size_t   threshold,
                                 std::size_t   target_points)
{
    const std::size_t n = series.size();
    if (n < threshold || n < 2 || target_points == 0)
    {
        DecimatedSeries out;
        out.x.assign(series.index().begin(), series.index().end());
        out.y.assign(series.values().begin(), series.values().end());
        return out;
    }

    DecimatedSeries out;
    if (series.index_kind() == IndexKind::Time)
    {
        double span   = series.last_index() - series.first_index();
        double period = outline_bucket_period(span, n, target_points);
        TRACEMARK_LOG_DEBUG("span", "Using period {} s for outline resample", period);
        out = bucket_mean(series.index(), series.values(), period);
    }
    else
    {
        out = stride_subsample(series.index(), series.values(), n / target_points);
    }

    TRACEMARK_LOG_DEBUG("span", "Resampled outline view from {} to {}", n, out.size());
    return out;
}

}   // namespace tracemark::data
