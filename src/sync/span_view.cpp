#include "sync/span_view.hpp"

#include <algorithm>
#include <tracemark/data_item.hpp>
#include <tracemark/logger.hpp>

namespace tracemark::sync
{

SpanView::SpanView(std::string name, const AppConfig& config)
    : config_(config), name_(std::move(name))
{
}

// ─── Items ───────────────────────────────────────────────────────────────────

Trace& SpanView::insert_trace(const DataItem& item, std::vector<double> x, std::vector<double> y)
{
    Trace trace;
    trace.item    = &item;
    trace.color   = item.color().with_alpha(config_.data_alpha);
    trace.visible = item.visible();
    trace.x       = std::move(x);
    trace.y       = std::move(y);
    traces_.push_back(std::move(trace));

    for (const auto& marking : item.markings())
        add_marking_span(item, *marking);

    return traces_.back();
}

void SpanView::remove_item(const DataItem& item)
{
    if (!has_item(item))
        return;

    size_t removed = spans_.remove_item(item);
    std::erase_if(traces_, [&item](const Trace& t) { return t.item == &item; });
    TRACEMARK_LOG_DEBUG("span", "{}: removed {} ({} spans)", name_, item.name(), removed);
    request_redraw();
}

void SpanView::set_item_visible(const DataItem& item, bool visible)
{
    Trace* trace = mutable_trace(item);
    if (!trace || trace->visible == visible)
        return;
    trace->visible = visible;
    spans_.set_item_visible(item, visible);
    request_redraw();
}

bool SpanView::has_item(const DataItem& item) const
{
    return trace_for(item) != nullptr;
}

const Trace* SpanView::trace_for(const DataItem& item) const
{
    auto it = std::find_if(traces_.begin(),
                           traces_.end(),
                           [&item](const Trace& t) { return t.item == &item; });
    return it != traces_.end() ? &*it : nullptr;
}

Trace* SpanView::mutable_trace(const DataItem& item)
{
    auto it = std::find_if(traces_.begin(),
                           traces_.end(),
                           [&item](const Trace& t) { return t.item == &item; });
    return it != traces_.end() ? &*it : nullptr;
}

// ─── Spans ───────────────────────────────────────────────────────────────────

Color SpanView::span_color(const Marking& marking) const
{
    return label_color(marking.label()).with_alpha(config_.span_alpha);
}

void SpanView::add_marking_span(const DataItem& item, const Marking& marking)
{
    const Trace* trace = trace_for(item);
    if (!trace)
    {
        TRACEMARK_LOG_WARN("span", "{}: no trace for {}, span not added", name_, item.name());
        return;
    }
    spans_.add(item,
               marking,
               projection_.to_axis(marking.start()),
               projection_.to_axis(marking.end()),
               span_color(marking),
               trace->visible);
    request_redraw();
}

void SpanView::remove_marking_span(const Marking& marking)
{
    if (!spans_.remove_marking(marking.id()))
    {
        TRACEMARK_LOG_WARN("span", "{}: no span for marking {}", name_, marking.id());
        return;
    }
    request_redraw();
}

void SpanView::update_span_color(const Marking& marking)
{
    if (spans_.set_color(marking.id(), span_color(marking)))
        request_redraw();
}

// ─── Limits ──────────────────────────────────────────────────────────────────

std::pair<double, double> SpanView::domain_xlim() const
{
    return {projection_.to_domain(xlim_.min), projection_.to_domain(xlim_.max)};
}

void SpanView::set_xlim(double x0, double x1)
{
    xlim_ = AxisRange{x0, x1};
}

void SpanView::set_ylim(double y0, double y1)
{
    ylim_ = AxisRange{y0, y1};
}

void SpanView::request_redraw()
{
    if (on_redraw_)
        on_redraw_();
}

}   // namespace tracemark::sync
