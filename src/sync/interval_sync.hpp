#pragma once

#include <functional>
#include <optional>
#include <tracemark/config.hpp>
#include <tracemark/session_events.hpp>
#include <utility>

#include "sync/detail_view.hpp"
#include "sync/outline_view.hpp"

namespace tracemark
{
class SessionModel;
}

namespace tracemark::sync
{

enum class Direction
{
    Left,
    Right,
};

// Keeps the outline and detail views in step with a SessionModel and with each
// other. Model events reach the views in a fixed order (detail before outline);
// the outline selection drives the detail interval and detail selections become
// markings. The model must outlive this object.
class IntervalSync
{
   public:
    using RedrawCallback = std::function<void()>;

    explicit IntervalSync(SessionModel& model, const AppConfig& config = {});
    ~IntervalSync();

    IntervalSync(const IntervalSync&)            = delete;
    IntervalSync& operator=(const IntervalSync&) = delete;

    OutlineView&       outline() { return outline_; }
    const OutlineView& outline() const { return outline_; }
    DetailView&        detail() { return detail_; }
    const DetailView&  detail() const { return detail_; }

    // Axis-space drags forwarded to the views.
    bool select_outline(double x0, double x1) { return outline_.on_span_select(x0, x1); }
    bool select_detail(double x0, double x1) { return detail_.on_span_select(x0, x1); }

    // Shifts the detail interval by its own width and selects the result in the outline.
    bool move_interval(Direction direction);
    void maximize_interval() { outline_.maximize_interval(); }

    void delete_markings_in_displayed_interval(bool only_visible = true);

    // Span under axis position x in the detail view: relabel with the active label,
    // or remove the marking. Return false when nothing was under x.
    bool relabel_span_at(double x);
    bool remove_span_at(double x);

    void set_on_redraw_request(RedrawCallback cb);

    // Every active marking has exactly one span per view, with its item's visibility,
    // and no view holds a span or trace the model does not know.
    bool spans_consistent() const;

   private:
    void attach(DataItem& item);

    std::optional<std::pair<DataItem*, Marking*>> resolve(const SpanRecord& span) const;

    SessionModel& model_;
    AppConfig     config_;
    OutlineView   outline_;
    DetailView    detail_;
    ConnectionSet connections_;
};

}   // namespace tracemark::sync
