#include "sync/interval_sync.hpp"

#include <tracemark/logger.hpp>
#include <tracemark/session_model.hpp>

namespace tracemark::sync
{

IntervalSync::IntervalSync(SessionModel& model, const AppConfig& config)
    : model_(model), config_(config), outline_(config), detail_(config)
{
    SessionEvents& events = model_.events();

    connections_.connect(events.item_added, [this](DataItem& item) { attach(item); });
    connections_.connect(events.item_removed,
                         [this](DataItem& item)
                         {
                             detail_.remove_item(item);
                             outline_.remove_item(item);
                         });
    connections_.connect(events.item_visibility_changed,
                         [this](DataItem& item)
                         {
                             detail_.set_item_visible(item, item.visible());
                             outline_.set_item_visible(item, item.visible());
                         });
    connections_.connect(events.marking_added,
                         [this](DataItem& item, Marking& marking)
                         {
                             detail_.add_marking_span(item, marking);
                             outline_.add_marking_span(item, marking);
                         });
    connections_.connect(events.marking_removed,
                         [this](DataItem&, Marking& marking)
                         {
                             detail_.remove_marking_span(marking);
                             outline_.remove_marking_span(marking);
                         });
    connections_.connect(events.marking_label_updated,
                         [this](Marking& marking)
                         {
                             detail_.update_span_color(marking);
                             outline_.update_span_color(marking);
                         });

    outline_.set_on_interval_selected([this](double x0, double x1)
                                      { detail_.display_interval(x0, x1); });
    detail_.set_on_span_selected([this](double x0, double x1)
                                 { model_.new_marking_at_selection(x0, x1); });

    for (const auto& item : model_.items())
        attach(*item);
}

IntervalSync::~IntervalSync() = default;

void IntervalSync::attach(DataItem& item)
{
    IndexProjection projection(item.series().index_kind());
    if (detail_.traces().empty())
        detail_.set_projection(projection);
    if (outline_.traces().empty())
        outline_.set_projection(projection);

    detail_.add_item(item);
    outline_.add_item(item);
}

bool IntervalSync::move_interval(Direction direction)
{
    if (detail_.traces().empty())
    {
        TRACEMARK_LOG_DEBUG("sync", "Nothing shown, not moving");
        return false;
    }

    AxisRange shown = detail_.xlim();
    double    width = shown.width();
    if (direction == Direction::Left)
        return outline_.on_span_select(shown.min - width, shown.min);
    return outline_.on_span_select(shown.max, shown.max + width);
}

void IntervalSync::delete_markings_in_displayed_interval(bool only_visible)
{
    auto [x0, x1] = detail_.domain_xlim();
    model_.delete_markings_in_range(x0, x1, only_visible);
}

std::optional<std::pair<DataItem*, Marking*>> IntervalSync::resolve(const SpanRecord& span) const
{
    for (const auto& item : model_.items())
    {
        if (item.get() != span.item)
            continue;
        for (const auto& marking : item->markings())
        {
            if (marking->id() == span.marking_id)
                return std::make_pair(item.get(), marking.get());
        }
    }
    TRACEMARK_LOG_ERROR("sync", "Span {} has no marking in the model", span.id);
    return std::nullopt;
}

bool IntervalSync::relabel_span_at(double x)
{
    const SpanRecord* span = detail_.pick_span(x);
    if (!span)
        return false;
    auto target = resolve(*span);
    if (!target)
        return false;
    Status status = model_.relabel_marking(*target->second);
    if (status == Status::Ok)
    {
        TRACEMARK_LOG_INFO("sync",
                           "Changing '{}' marking to {}",
                           target->first->name(),
                           label_id(target->second->label()));
    }
    return true;
}

bool IntervalSync::remove_span_at(double x)
{
    const SpanRecord* span = detail_.pick_span(x);
    if (!span)
        return false;
    auto target = resolve(*span);
    if (!target)
        return false;
    model_.remove_marking(*target->first, *target->second);
    return true;
}

void IntervalSync::set_on_redraw_request(RedrawCallback cb)
{
    outline_.set_on_redraw_request(cb);
    detail_.set_on_redraw_request(std::move(cb));
}

bool IntervalSync::spans_consistent() const
{
    size_t active = 0;
    for (const SpanView* view : {static_cast<const SpanView*>(&outline_),
                                 static_cast<const SpanView*>(&detail_)})
    {
        if (!view->spans().consistent() || view->traces().size() != model_.item_count())
            return false;

        size_t markings = 0;
        for (const auto& item : model_.items())
        {
            const Trace* trace = view->trace_for(*item);
            if (!trace || trace->visible != item->visible())
                return false;
            if (view->spans().count_for(*item) != item->markings().size())
                return false;
            for (const auto& marking : item->markings())
            {
                const SpanRecord* span = view->spans().find_by_marking(marking->id());
                if (!span || span->item != item.get() || span->visible != item->visible())
                    return false;
            }
            markings += item->markings().size();
        }
        if (view->spans().size() != markings)
            return false;
        active = markings;
    }
    TRACEMARK_LOG_TRACE("sync", "{} spans consistent in both views", active);
    return true;
}

}   // namespace tracemark::sync
