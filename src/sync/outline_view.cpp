#include "sync/outline_view.hpp"

#include <algorithm>
#include <limits>
#include <tracemark/data_item.hpp>
#include <tracemark/logger.hpp>

#include "data/decimation.hpp"

namespace tracemark::sync
{

std::optional<std::pair<double, double>> initial_interval(const Series&    series,
                                                          const AppConfig& config)
{
    size_t n = series.size();
    if (n < 2)
        return std::nullopt;

    size_t fraction = std::max<size_t>(config.fraction_preshown, 1);
    size_t end_idx  = std::min(config.preshow_cap, n / fraction);
    end_idx         = std::clamp<size_t>(end_idx, 1, n - 1);

    auto index = series.index();
    return std::make_pair(index[0], index[end_idx]);
}

OutlineView::OutlineView(const AppConfig& config) : SpanView("outline", config) {}

void OutlineView::add_item(const DataItem& item)
{
    if (has_item(item))
        return;

    const Series& series = item.series();
    auto decimated =
        data::outline_decimate(series, config_.decimate_threshold, config_.decimated_points);
    if (decimated.size() != series.size())
    {
        TRACEMARK_LOG_DEBUG("sync",
                            "Outline of {} reduced from {} to {} points",
                            item.name(),
                            series.size(),
                            decimated.size());
    }
    for (double& x : decimated.x)
        x = projection().to_axis(x);

    bool first = traces().empty();
    insert_trace(item, std::move(decimated.x), std::move(decimated.y));
    update_limits();

    if (first)
    {
        if (auto interval = initial_interval(series, config_))
            on_span_select(projection().to_axis(interval->first),
                           projection().to_axis(interval->second));
    }
    request_redraw();
}

void OutlineView::remove_item(const DataItem& item)
{
    SpanView::remove_item(item);
    if (traces().empty())
        selection_.reset();
    else
        update_limits();
}

bool OutlineView::on_span_select(double x0, double x1)
{
    if (x0 == x1)
        return false;
    if (x1 < x0)
        std::swap(x0, x1);

    selection_ = AxisRange{x0, x1};

    double lo = projection().to_domain(x0);
    double hi = projection().to_domain(x1);
    TRACEMARK_LOG_INFO("sync", "Viewing {} <==> {} ({})", lo, hi, hi - lo);
    if (on_interval_selected_)
        on_interval_selected_(lo, hi);
    request_redraw();
    return true;
}

void OutlineView::maximize_interval()
{
    auto extent = data_extent();
    if (!extent)
    {
        on_span_select(0.0, 1.0);
        return;
    }
    on_span_select(projection().to_axis(extent->first), projection().to_axis(extent->second));
}

std::optional<std::pair<double, double>> OutlineView::data_extent() const
{
    bool any_visible =
        std::any_of(traces().begin(), traces().end(), [](const Trace& t) { return t.visible; });

    std::optional<std::pair<double, double>> extent;
    for (const auto& trace : traces())
    {
        if (any_visible && !trace.visible)
            continue;
        const Series& s = trace.item->series();
        if (s.empty())
            continue;
        if (!extent)
            extent = std::make_pair(s.first_index(), s.last_index());
        extent->first  = std::min(extent->first, s.first_index());
        extent->second = std::max(extent->second, s.last_index());
    }
    return extent;
}

void OutlineView::update_limits()
{
    auto extent = data_extent();
    if (!extent)
        return;
    set_xlim(projection().to_axis(extent->first), projection().to_axis(extent->second));

    double ymin = std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();
    for (const auto& trace : traces())
    {
        if (auto range = trace.item->series().value_range())
        {
            ymin = std::min(ymin, range->first);
            ymax = std::max(ymax, range->second);
        }
    }
    if (ymin <= ymax)
        set_ylim(ymin, ymax);
}

}   // namespace tracemark::sync
