#include <algorithm>
#include <tracemark/data_item.hpp>

namespace tracemark
{

DataItem::DataItem(Series series, std::string name, Metadata metadata, size_t display_slot)
    : series_(std::move(series)),
      name_(std::move(name)),
      metadata_(std::move(metadata)),
      display_slot_(display_slot)
{
}

bool DataItem::has_marking(const Marking& marking) const
{
    return std::any_of(markings_.begin(),
                       markings_.end(),
                       [&](const auto& m) { return m.get() == &marking; });
}

const Marking* DataItem::find_marking(uint64_t id) const
{
    for (const auto& m : markings_)
    {
        if (m->id() == id)
            return m.get();
    }
    return nullptr;
}

std::optional<std::pair<double, double>> DataItem::outer_marking_extent() const
{
    if (markings_.empty())
        return std::nullopt;

    double lo = markings_.front()->start();
    double hi = markings_.front()->end();
    for (const auto& m : markings_)
    {
        lo = std::min(lo, m->start());
        hi = std::max(hi, m->end());
    }
    return std::make_pair(lo, hi);
}

Marking& DataItem::append_marking(std::unique_ptr<Marking> marking)
{
    markings_.push_back(std::move(marking));
    return *markings_.back();
}

bool DataItem::retire_marking(const Marking& marking)
{
    auto it = std::find_if(markings_.begin(),
                           markings_.end(),
                           [&](const auto& m) { return m.get() == &marking; });
    if (it == markings_.end())
        return false;

    deleted_.push_back(std::move(*it));
    markings_.erase(it);
    return true;
}

size_t DataItem::forget_deleted(const std::vector<uint64_t>& ids)
{
    return std::erase_if(deleted_,
                         [&](const auto& m)
                         { return std::find(ids.begin(), ids.end(), m->id()) != ids.end(); });
}

}   // namespace tracemark
