#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tracemark/marking.hpp>
#include <tracemark/metadata.hpp>
#include <utility>
#include <vector>

namespace tracemark
{

class DataItem;

using ConnectionId = uint64_t;

// Typed listener list. Slots run synchronously in connection order; a slot may
// connect or disconnect others while the signal is being emitted.
template <typename... Args>
class Signal
{
   public:
    using Slot = std::function<void(Args...)>;

    ConnectionId connect(Slot slot)
    {
        ConnectionId id = next_id_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    bool disconnect(ConnectionId id)
    {
        return std::erase_if(slots_, [id](const auto& entry) { return entry.first == id; }) > 0;
    }

    void emit(Args... args) const
    {
        auto snapshot = slots_;
        for (const auto& [id, slot] : snapshot)
        {
            if (is_connected(id))
                slot(args...);
        }
    }

    bool is_connected(ConnectionId id) const
    {
        for (const auto& entry : slots_)
        {
            if (entry.first == id)
                return true;
        }
        return false;
    }

    size_t slot_count() const { return slots_.size(); }
    void   clear() { slots_.clear(); }

   private:
    std::vector<std::pair<ConnectionId, Slot>> slots_;
    ConnectionId                               next_id_ = 1;
};

// Collects connections so a listener can drop all of them at once.
class ConnectionSet
{
   public:
    ConnectionSet() = default;
    ~ConnectionSet() { disconnect_all(); }

    ConnectionSet(const ConnectionSet&)            = delete;
    ConnectionSet& operator=(const ConnectionSet&) = delete;

    template <typename... Args>
    void connect(Signal<Args...>& signal, typename Signal<Args...>::Slot slot)
    {
        ConnectionId id = signal.connect(std::move(slot));
        disconnectors_.push_back([&signal, id]() { signal.disconnect(id); });
    }

    void disconnect_all()
    {
        for (auto& d : disconnectors_)
            d();
        disconnectors_.clear();
    }

    size_t size() const { return disconnectors_.size(); }

   private:
    std::vector<std::function<void()>> disconnectors_;
};

// Markings of one item, detached from the item so listeners can keep them.
struct ItemMarkings
{
    const DataItem*            item = nullptr;   // Identity only
    Metadata                   metadata;
    std::vector<MarkingRecord> records;
    std::vector<uint64_t>      marking_ids;   // Parallel to records
};

// Output of SessionModel::save_snapshot.
struct MarkingSnapshot
{
    std::vector<ItemMarkings> changed;   // Active markings per item
    std::vector<ItemMarkings> deleted;   // Tombstones per item
};

struct SessionEvents
{
    Signal<DataItem&> item_added;
    Signal<DataItem&> item_removed;
    Signal<DataItem&> item_visibility_changed;

    Signal<DataItem&, Marking&> marking_added;
    Signal<DataItem&, Marking&> marking_removed;
    Signal<Marking&>            marking_label_updated;

    // metadata, start, end, tag
    Signal<const Metadata&, double, double, const std::string&> interval_tagged;

    Signal<const MarkingSnapshot&> save_requested;
    // metadata, first index, last index
    Signal<const Metadata&, double, double> load_requested;
};

}   // namespace tracemark
