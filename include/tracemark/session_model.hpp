#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tracemark/color.hpp>
#include <tracemark/data_item.hpp>
#include <tracemark/label.hpp>
#include <tracemark/session_events.hpp>
#include <vector>

namespace tracemark
{

// Outcome of a validated model operation. Anything but Ok leaves the model unchanged.
enum class Status
{
    Ok,
    InvalidSeries,
    EmptySeries,
    IndexKindMismatch,
    UnknownLabel,
    NoActiveLabel,
    EmptyMetadata,
};

const char* status_to_string(Status status);

enum class Visibility
{
    Invert,
    Show,
    Hide,
};

// Owns the loaded items and every mutation on them. Each state change is announced
// on events(). Validation failures are logged and reported through Status; removing
// something that is not there is a logic error and throws std::logic_error.
class SessionModel
{
   public:
    explicit SessionModel(size_t palette_size = palette::item_cycle_size);
    ~SessionModel();

    SessionModel(const SessionModel&)            = delete;
    SessionModel& operator=(const SessionModel&) = delete;

    SessionEvents&       events() { return events_; }
    const SessionEvents& events() const { return events_; }

    // ─── Items ───────────────────────────────────────────────────────────────

    Status add_item(Series                     series,
                    std::optional<std::string> name     = std::nullopt,
                    Metadata                   metadata = {});
    void   remove_item(DataItem& item);
    void   remove_items(const std::vector<DataItem*>& items);

    const std::vector<std::unique_ptr<DataItem>>& items() const { return items_; }
    std::vector<DataItem*>                        visible_items() const;
    std::vector<DataItem*>                        targets(bool only_visible) const;
    DataItem*                                     find_item(std::string_view name) const;
    bool                                          contains(const DataItem* item) const;

    size_t                   item_count() const { return items_.size(); }
    uint64_t                 total_items_ever_added() const { return total_items_ever_added_; }
    std::optional<IndexKind> index_kind() const { return index_kind_; }
    size_t                   palette_size() const { return palette_size_; }

    void set_item_visible(DataItem& item, bool visible);
    void set_items_visible(Visibility how);

    std::vector<DataItem*> match_items_by_metadata(const Metadata& partial) const;
    void apply_on_visible(const std::function<void(const Series&, const Metadata&)>& fn) const;

    // ─── Labels ──────────────────────────────────────────────────────────────

    Status               set_active_label(std::string_view id);
    Status               set_active_label(Label label);
    void                 clear_active_label() { active_label_.reset(); }
    std::optional<Label> active_label() const { return active_label_; }

    // ─── Markings ────────────────────────────────────────────────────────────

    Marking& add_marking(DataItem&                  item,
                         double                     start,
                         double                     end,
                         Label                      label,
                         std::optional<std::string> note = std::nullopt);

    // Marks [start, end] with the active label on every targeted item.
    void new_marking_at_selection(double start, double end, bool only_visible = true);

    // Adds every record to every item whose metadata matches `partial`.
    Status new_markings_from_description(const std::vector<MarkingRecord>& records,
                                         const Metadata&                   partial);

    void   remove_marking(DataItem& item, Marking& marking);
    Status relabel_marking(Marking& marking);

    // Removes markings with x0 < start < x1 and x0 < end < x1.
    void delete_markings_in_range(double x0, double x1, bool only_visible = true);
    void delete_all_markings(bool only_visible = true);

    // ─── Tagging ─────────────────────────────────────────────────────────────

    void tag_full_extent(DataItem& item, const std::string& tag);
    void tag_between_outer_markings(DataItem& item, const std::string& tag);
    void tag_items(const std::string& tag, bool only_visible = true);
    void tag_items_between_outer_markings(const std::string& tag, bool only_visible = true);

    // ─── Persistence hand-off ────────────────────────────────────────────────

    // Collects active and deleted markings per targeted item and emits save_requested.
    // Tombstones stay until acknowledge_saved() is called with the snapshot.
    MarkingSnapshot save_snapshot(bool only_visible = true);

    // Drops the tombstones listed in snapshot.deleted. Returns how many were dropped.
    size_t acknowledge_saved(const MarkingSnapshot& snapshot);

    // Emits load_requested per targeted item. A metadata set that was already requested
    // is skipped unless `force` is set.
    void load_markings(bool only_visible = true, bool force = false);
    bool markings_loaded_for(const Metadata& metadata) const;

   private:
    std::string default_name(const Series& series, size_t slot);
    DataItem&   require_item(const DataItem& item) const;

    SessionEvents                          events_;
    std::vector<std::unique_ptr<DataItem>> items_;
    size_t                                 palette_size_;
    std::optional<Label>                   active_label_;
    std::optional<IndexKind>               index_kind_;
    uint64_t                               total_items_ever_added_ = 0;
    uint64_t                               next_marking_id_        = 1;
    std::set<std::string>                  issued_names_;
    std::set<std::string>                  loaded_metadata_;
};

}   // namespace tracemark
