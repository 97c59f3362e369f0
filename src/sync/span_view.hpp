#pragma once

#include <functional>
#include <optional>
#include <string>
#include <tracemark/color.hpp>
#include <tracemark/config.hpp>
#include <tracemark/fwd.hpp>
#include <utility>
#include <vector>

#include "sync/index_projection.hpp"
#include "sync/span_registry.hpp"

namespace tracemark::sync
{

struct AxisRange
{
    double min = 0.0;
    double max = 1.0;

    double width() const { return max - min; }
    bool   operator==(const AxisRange& o) const { return min == o.min && max == o.max; }
};

// What a view draws for one item. Points are in axis space.
struct Trace
{
    const DataItem*     item = nullptr;
    Color               color;
    bool                visible = true;
    std::vector<double> x;
    std::vector<double> y;
};

// Shared part of the outline and detail views: one trace per item and one span per
// marking, kept in step with the model by IntervalSync. Spans follow the visibility
// of their item's trace.
class SpanView
{
   public:
    using RedrawCallback = std::function<void()>;

    SpanView(std::string name, const AppConfig& config);
    virtual ~SpanView() = default;

    SpanView(const SpanView&)            = delete;
    SpanView& operator=(const SpanView&) = delete;

    const std::string& name() const { return name_; }

    const IndexProjection& projection() const { return projection_; }
    void                   set_projection(IndexProjection projection) { projection_ = projection; }

    // ─── Items ───────────────────────────────────────────────────────────────

    // Adds the item's trace together with spans for the markings it already has.
    virtual void add_item(const DataItem& item) = 0;
    // Removes the item's spans, then its trace. No-op for unknown items.
    virtual void remove_item(const DataItem& item);

    void set_item_visible(const DataItem& item, bool visible);

    bool                      has_item(const DataItem& item) const;
    const Trace*              trace_for(const DataItem& item) const;
    const std::vector<Trace>& traces() const { return traces_; }

    // ─── Spans ───────────────────────────────────────────────────────────────

    void add_marking_span(const DataItem& item, const Marking& marking);
    void remove_marking_span(const Marking& marking);
    void update_span_color(const Marking& marking);

    const SpanRegistry& spans() const { return spans_; }
    Color               span_color(const Marking& marking) const;

    // ─── Selection and limits ────────────────────────────────────────────────

    // Drag selection in axis space. Zero-width selections are ignored; returns
    // whether the selection was acted on.
    virtual bool on_span_select(double x0, double x1) = 0;

    AxisRange xlim() const { return xlim_; }
    AxisRange ylim() const { return ylim_; }
    // xlim() mapped back to the index domain.
    std::pair<double, double> domain_xlim() const;

    void set_on_redraw_request(RedrawCallback cb) { on_redraw_ = std::move(cb); }

   protected:
    Trace& insert_trace(const DataItem& item, std::vector<double> x, std::vector<double> y);
    Trace*              mutable_trace(const DataItem& item);
    std::vector<Trace>& mutable_traces() { return traces_; }

    void set_xlim(double x0, double x1);
    void set_ylim(double y0, double y1);
    void request_redraw();

    AppConfig config_;

   private:
    std::string        name_;
    IndexProjection    projection_;
    std::vector<Trace> traces_;
    SpanRegistry       spans_;
    AxisRange          xlim_;
    AxisRange          ylim_;
    RedrawCallback     on_redraw_;
};

}   // namespace tracemark::sync
