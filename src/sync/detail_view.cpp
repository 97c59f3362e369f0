#include "sync/detail_view.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <tracemark/data_item.hpp>
#include <tracemark/logger.hpp>

#include "sync/outline_view.hpp"

namespace tracemark::sync
{

DetailView::DetailView(const AppConfig& config) : SpanView("detail", config) {}

void DetailView::add_item(const DataItem& item)
{
    if (has_item(item))
        return;

    const Series&             series = item.series();
    std::pair<double, double> shown;
    if (interval_ && !traces().empty())
        shown = *interval_;
    else if (auto initial = initial_interval(series, config_))
        shown = *initial;
    else
        shown = {series.first_index(), series.last_index()};

    insert_trace(item, {}, {});
    display_interval(shown.first, shown.second);
}

bool DetailView::on_span_select(double x0, double x1)
{
    if (x0 == x1)
        return false;
    if (x1 < x0)
        std::swap(x0, x1);

    if (on_span_selected_)
        on_span_selected_(projection().to_domain(x0), projection().to_domain(x1));
    return true;
}

void DetailView::display_interval(double x0, double x1)
{
    TRACEMARK_LOG_DEBUG("sync", "Displaying interval [{}, {}]", x0, x1);
    interval_ = std::make_pair(x0, x1);

    double ymin = std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();
    for (auto& trace : mutable_traces())
    {
        const Series& series = trace.item->series();
        auto [first, last]   = series.slice_bounds(x0, x1);

        auto index  = series.index();
        auto values = series.values();
        trace.y.assign(values.begin() + static_cast<std::ptrdiff_t>(first),
                       values.begin() + static_cast<std::ptrdiff_t>(last));
        trace.x.clear();
        trace.x.reserve(last - first);
        for (size_t i = first; i < last; ++i)
            trace.x.push_back(projection().to_axis(index[i]));

        if (!trace.visible)
            continue;
        if (auto range = series.value_range(first, last))
        {
            ymin = std::min(ymin, range->first);
            ymax = std::max(ymax, range->second);
        }
    }
    if (ymin > ymax)
        ymin = ymax = 0.0;

    set_xlim(projection().to_axis(x0), projection().to_axis(x1));
    double yspan = std::max(std::abs(ymax - ymin), config_.minimum_y_range);
    set_ylim(ymin - yspan * config_.y_margin, ymax + yspan * config_.y_margin);
    request_redraw();
}

const SpanRecord* DetailView::pick_span(double x) const
{
    const SpanRecord* picked = nullptr;
    for (const SpanRecord* span : spans().all())
    {
        if (span->visible && span->x0 <= x && x <= span->x1)
            picked = span;
    }
    return picked;
}

void DetailView::toggle_steps()
{
    steps_ = !steps_;
    request_redraw();
}

void DetailView::toggle_markers()
{
    markers_ = !markers_;
    request_redraw();
}

}   // namespace tracemark::sync
