#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "sync/span_view.hpp"

namespace tracemark::sync
{

// Full-resolution view of the interval selected in the outline. Dragging here
// creates markings.
class DetailView : public SpanView
{
   public:
    // Dragged interval in the index domain.
    using SelectionCallback = std::function<void(double x0, double x1)>;

    explicit DetailView(const AppConfig& config = {});

    void add_item(const DataItem& item) override;

    bool on_span_select(double x0, double x1) override;

    // Narrows every trace to [x0, x1] (index domain) and rescales y over the visible
    // items, with a margin on each side and a floor on the span.
    void display_interval(double x0, double x1);

    // Last interval passed to display_interval().
    std::optional<std::pair<double, double>> interval() const { return interval_; }

    // Topmost visible span covering axis position x.
    const SpanRecord* pick_span(double x) const;

    void toggle_steps();
    void toggle_markers();
    bool steps() const { return steps_; }
    bool markers() const { return markers_; }

    void set_on_span_selected(SelectionCallback cb) { on_span_selected_ = std::move(cb); }

   private:
    std::optional<std::pair<double, double>> interval_;
    bool                                     steps_   = false;
    bool                                     markers_ = false;
    SelectionCallback                        on_span_selected_;
};

}   // namespace tracemark::sync
