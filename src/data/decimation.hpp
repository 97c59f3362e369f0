#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace tracemark
{
class Series;
}

namespace tracemark::data
{

struct DecimatedSeries
{
    std::vector<double> x;
    std::vector<double> y;

    std::size_t size() const { return x.size(); }
};

/// Bucket width in seconds for reducing a time series spanning `span_seconds` with
/// `n` samples to about `target_points` buckets. Sub-0.1 s average spacing gives whole
/// milliseconds (at least 1 ms), anything coarser whole seconds (at least 1 s).
[[nodiscard]] double outline_bucket_period(double      span_seconds,
                                           std::size_t n,
                                           std::size_t target_points);

/// Averages y over fixed-width x buckets aligned to multiples of `period`.
/// Each output point sits at its bucket's left edge; empty buckets are skipped.
[[nodiscard]] DecimatedSeries bucket_mean(std::span<const double> x,
                                          std::span<const double> y,
                                          double                  period);

/// Keeps every `stride`-th sample, starting with the first.
[[nodiscard]] DecimatedSeries stride_subsample(std::span<const double> x,
                                               std::span<const double> y,
                                               std::size_t             stride);

/// Overview rendering data for a series. Series shorter than `threshold` pass through;
/// longer ones are bucket-averaged (time index) or strided (numeric index) down to
/// roughly `target_points`.
[[nodiscard]] DecimatedSeries outline_decimate(const Series& series,
                                               std::size_t   threshold,
                                               std::size_t   target_points);

}   // namespace tracemark::data
