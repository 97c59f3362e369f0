#pragma once

#include <tracemark/series.hpp>

namespace tracemark::sync
{

// Linear map between the index domain and the x axis the views draw in.
// Numbers are drawn as-is; time indices (epoch seconds) are drawn in days since
// the epoch so that calendar tick spacing stays readable.
class IndexProjection
{
   public:
    static constexpr double kSecondsPerDay = 86400.0;

    IndexProjection() = default;
    explicit IndexProjection(IndexKind kind) : kind_(kind) {}

    IndexKind kind() const { return kind_; }
    void      set_kind(IndexKind kind) { kind_ = kind; }

    double to_axis(double domain) const
    {
        return kind_ == IndexKind::Time ? domain / kSecondsPerDay : domain;
    }

    double to_domain(double axis) const
    {
        return kind_ == IndexKind::Time ? axis * kSecondsPerDay : axis;
    }

   private:
    IndexKind kind_ = IndexKind::Number;
};

}   // namespace tracemark::sync
