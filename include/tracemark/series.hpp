#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace tracemark
{

// Time indices are seconds since the Unix epoch.
enum class IndexKind
{
    Time,
    Number,
};

const char* index_kind_name(IndexKind kind);

// Ordered (index, value) pairs with a strictly increasing index.
// Construction never throws: a malformed input yields a series with valid() == false
// and a description in error().
class Series
{
   public:
    using TimePoint = std::chrono::system_clock::time_point;

    Series() = default;
    Series(std::vector<double> index,
           std::vector<double> values,
           IndexKind           kind = IndexKind::Number,
           std::string         name = {});

    // Positional index 0..n-1.
    static Series from_values(std::vector<double> values, std::string name = {});
    static Series from_time_points(const std::vector<TimePoint>& index,
                                   std::vector<double>           values,
                                   std::string                   name = {});

    bool               valid() const { return error_.empty(); }
    const std::string& error() const { return error_; }
    bool               empty() const { return values_.empty(); }
    size_t             size() const { return values_.size(); }
    IndexKind          index_kind() const { return kind_; }

    const std::optional<std::string>& name() const { return name_; }
    Series&                           name(std::string n)
    {
        name_ = std::move(n);
        return *this;
    }

    std::span<const double> index() const { return index_; }
    std::span<const double> values() const { return values_; }

    double first_index() const { return index_.front(); }
    double last_index() const { return index_.back(); }

    // Half-open position range [first, last) of samples with x0 <= index <= x1.
    std::pair<size_t, size_t> slice_bounds(double x0, double x1) const;

    // Min/max of the non-NaN values in positions [first, last). Empty when none.
    std::optional<std::pair<double, double>> value_range(size_t first, size_t last) const;
    std::optional<std::pair<double, double>> value_range() const
    {
        return value_range(0, size());
    }

   private:
    void validate();

    std::vector<double>        index_;
    std::vector<double>        values_;
    IndexKind                  kind_ = IndexKind::Number;
    std::optional<std::string> name_;
    std::string                error_;
};

}   // namespace tracemark
