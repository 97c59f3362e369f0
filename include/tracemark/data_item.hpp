#pragma once

#include <memory>
#include <optional>
#include <string>
#include <tracemark/color.hpp>
#include <tracemark/marking.hpp>
#include <tracemark/metadata.hpp>
#include <tracemark/series.hpp>
#include <utility>
#include <vector>

namespace tracemark
{

// One loaded series with its markings. Owned by SessionModel; everything else refers
// to items by address. All mutation goes through SessionModel.
class DataItem
{
   public:
    using MarkingList = std::vector<std::unique_ptr<Marking>>;

    DataItem(Series series, std::string name, Metadata metadata, size_t display_slot);

    DataItem(const DataItem&)            = delete;
    DataItem& operator=(const DataItem&) = delete;

    const Series&      series() const { return series_; }
    const std::string& name() const { return name_; }
    const Metadata&    metadata() const { return metadata_; }
    bool               visible() const { return visible_; }

    size_t display_slot() const { return display_slot_; }
    Color  color() const { return palette::item_color(display_slot_).color; }

    // Active markings in insertion order.
    const MarkingList& markings() const { return markings_; }
    // Removed markings not yet acknowledged as deleted from storage.
    const MarkingList& deleted_markings() const { return deleted_; }

    bool           has_marking(const Marking& marking) const;
    const Marking* find_marking(uint64_t id) const;

    // min(start) .. max(end) over the active markings.
    std::optional<std::pair<double, double>> outer_marking_extent() const;

   private:
    friend class SessionModel;

    Marking& append_marking(std::unique_ptr<Marking> marking);
    bool     retire_marking(const Marking& marking);
    size_t   forget_deleted(const std::vector<uint64_t>& ids);
    void     set_visible(bool visible) { visible_ = visible; }

    Series      series_;
    std::string name_;
    Metadata    metadata_;
    bool        visible_ = true;
    size_t      display_slot_ = 0;
    MarkingList markings_;
    MarkingList deleted_;
};

}   // namespace tracemark
