#include "sync/span_registry.hpp"

#include <algorithm>
#include <tracemark/marking.hpp>

namespace tracemark::sync
{

SpanId SpanRegistry::add(const DataItem& item,
                         const Marking&  marking,
                         double          x0,
                         double          x1,
                         Color           color,
                         bool            visible)
{
    auto existing = by_marking_.find(marking.id());
    if (existing != by_marking_.end())
        return existing->second;

    SpanId     id = next_id_++;
    SpanRecord rec;
    rec.id         = id;
    rec.item       = &item;
    rec.marking_id = marking.id();
    rec.x0         = x0;
    rec.x1         = x1;
    rec.color      = color;
    rec.visible    = visible;

    spans_.emplace(id, rec);
    by_marking_.emplace(marking.id(), id);
    by_item_[&item].push_back(id);
    return id;
}

bool SpanRegistry::remove_marking(uint64_t marking_id)
{
    auto it = by_marking_.find(marking_id);
    if (it == by_marking_.end())
        return false;

    SpanId id = it->second;
    by_marking_.erase(it);

    auto span_it = spans_.find(id);
    if (span_it != spans_.end())
    {
        auto item_it = by_item_.find(span_it->second.item);
        if (item_it != by_item_.end())
        {
            auto& ids = item_it->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty())
                by_item_.erase(item_it);
        }
        spans_.erase(span_it);
    }
    return true;
}

size_t SpanRegistry::remove_item(const DataItem& item)
{
    auto it = by_item_.find(&item);
    if (it == by_item_.end())
        return 0;

    size_t removed = 0;
    for (SpanId id : it->second)
    {
        auto span_it = spans_.find(id);
        if (span_it == spans_.end())
            continue;
        by_marking_.erase(span_it->second.marking_id);
        spans_.erase(span_it);
        ++removed;
    }
    by_item_.erase(it);
    return removed;
}

void SpanRegistry::clear()
{
    spans_.clear();
    by_marking_.clear();
    by_item_.clear();
}

const SpanRecord* SpanRegistry::find(SpanId id) const
{
    auto it = spans_.find(id);
    return it != spans_.end() ? &it->second : nullptr;
}

const SpanRecord* SpanRegistry::find_by_marking(uint64_t marking_id) const
{
    auto it = by_marking_.find(marking_id);
    return it != by_marking_.end() ? find(it->second) : nullptr;
}

std::vector<const SpanRecord*> SpanRegistry::spans_for(const DataItem& item) const
{
    std::vector<const SpanRecord*> result;
    auto                           it = by_item_.find(&item);
    if (it == by_item_.end())
        return result;
    result.reserve(it->second.size());
    for (SpanId id : it->second)
    {
        if (const SpanRecord* rec = find(id))
            result.push_back(rec);
    }
    return result;
}

std::vector<const SpanRecord*> SpanRegistry::all() const
{
    std::vector<const SpanRecord*> result;
    result.reserve(spans_.size());
    for (const auto& [id, rec] : spans_)
        result.push_back(&rec);
    std::sort(result.begin(),
              result.end(),
              [](const SpanRecord* a, const SpanRecord* b) { return a->id < b->id; });
    return result;
}

bool SpanRegistry::set_color(uint64_t marking_id, Color color)
{
    auto it = by_marking_.find(marking_id);
    if (it == by_marking_.end())
        return false;
    spans_.at(it->second).color = color;
    return true;
}

size_t SpanRegistry::set_item_visible(const DataItem& item, bool visible)
{
    auto it = by_item_.find(&item);
    if (it == by_item_.end())
        return 0;
    for (SpanId id : it->second)
        spans_.at(id).visible = visible;
    return it->second.size();
}

size_t SpanRegistry::count_for(const DataItem& item) const
{
    auto it = by_item_.find(&item);
    return it != by_item_.end() ? it->second.size() : 0;
}

bool SpanRegistry::consistent() const
{
    if (by_marking_.size() != spans_.size())
        return false;

    size_t item_refs = 0;
    for (const auto& [item, ids] : by_item_)
    {
        for (SpanId id : ids)
        {
            auto it = spans_.find(id);
            if (it == spans_.end() || it->second.item != item)
                return false;
        }
        item_refs += ids.size();
    }
    if (item_refs != spans_.size())
        return false;

    for (const auto& [marking_id, id] : by_marking_)
    {
        auto it = spans_.find(id);
        if (it == spans_.end() || it->second.marking_id != marking_id)
            return false;
    }
    return true;
}

}   // namespace tracemark::sync
