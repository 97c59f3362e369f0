#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "sync/span_view.hpp"

namespace tracemark
{
class Series;
}

namespace tracemark::sync
{

// Interval shown when the first item arrives: from the first sample to the one
// min(preshow_cap, n / fraction_preshown) positions later, at least one step in.
// Empty for series with fewer than two samples.
std::optional<std::pair<double, double>> initial_interval(const Series&    series,
                                                          const AppConfig& config);

// Overview of every item over its full extent, drawn from decimated data. Dragging
// selects the interval the detail view shows.
class OutlineView : public SpanView
{
   public:
    // Selected interval in the index domain.
    using IntervalCallback = std::function<void(double x0, double x1)>;

    explicit OutlineView(const AppConfig& config = {});

    void add_item(const DataItem& item) override;
    void remove_item(const DataItem& item) override;

    bool on_span_select(double x0, double x1) override;

    // Selects the extent of the visible items, or of all items when none is visible.
    void maximize_interval();

    // Index-domain extent used for limits and maximize_interval().
    std::optional<std::pair<double, double>> data_extent() const;

    // Current selection in axis space.
    std::optional<AxisRange> selection() const { return selection_; }

    void set_on_interval_selected(IntervalCallback cb) { on_interval_selected_ = std::move(cb); }

   private:
    void update_limits();

    std::optional<AxisRange> selection_;
    IntervalCallback         on_interval_selected_;
};

}   // namespace tracemark::sync
