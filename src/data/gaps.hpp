#pragma once

#include <optional>
#include <string_view>
#include <tracemark/label.hpp>
#include <tracemark/marking.hpp>
#include <tracemark/series.hpp>
#include <vector>

namespace tracemark::data
{

/// One record per consecutive index pair whose difference is strictly greater than
/// `threshold` (seconds for time series). The record spans the two samples.
[[nodiscard]] std::vector<MarkingRecord> detect_gaps(const Series& series,
                                                     double        threshold,
                                                     Label         label);

/// Parses a gap limit. Time series take a number with an optional unit
/// (ms, s, min, h, d; bare numbers are seconds), numeric series a plain number.
[[nodiscard]] std::optional<double> parse_gap_threshold(std::string_view text, IndexKind kind);

}   // namespace tracemark::data
