#pragma once

#include <cstddef>
#include <cstdint>
#include <tracemark/color.hpp>
#include <unordered_map>
#include <vector>

namespace tracemark
{
class DataItem;
class Marking;
}   // namespace tracemark

namespace tracemark::sync
{

using SpanId = uint64_t;

// A marking as drawn by one view. x0/x1 are in axis space.
struct SpanRecord
{
    SpanId          id         = 0;
    const DataItem* item       = nullptr;
    uint64_t        marking_id = 0;
    double          x0         = 0.0;
    double          x1         = 0.0;
    Color           color;
    bool            visible = true;
};

// marking <-> span <-> item lookup for one view. Every span is reachable from its
// marking id and from its item, and from nothing else.
class SpanRegistry
{
   public:
    // Returns the existing span if the marking already has one.
    SpanId add(const DataItem& item,
               const Marking&  marking,
               double          x0,
               double          x1,
               Color           color,
               bool            visible);

    bool   remove_marking(uint64_t marking_id);
    size_t remove_item(const DataItem& item);
    void   clear();

    const SpanRecord* find(SpanId id) const;
    const SpanRecord* find_by_marking(uint64_t marking_id) const;

    // Spans of an item in creation order.
    std::vector<const SpanRecord*> spans_for(const DataItem& item) const;
    // All spans in creation order.
    std::vector<const SpanRecord*> all() const;

    bool   set_color(uint64_t marking_id, Color color);
    size_t set_item_visible(const DataItem& item, bool visible);

    size_t size() const { return spans_.size(); }
    size_t count_for(const DataItem& item) const;

    // True when the three lookups agree with each other.
    bool consistent() const;

   private:
    std::unordered_map<SpanId, SpanRecord>                   spans_;
    std::unordered_map<uint64_t, SpanId>                     by_marking_;
    std::unordered_map<const DataItem*, std::vector<SpanId>> by_item_;
    SpanId                                                   next_id_ = 1;
};

}   // namespace tracemark::sync
