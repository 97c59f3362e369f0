#include <algorithm>
#include <stdexcept>
#include <tracemark/logger.hpp>
#include <tracemark/session_model.hpp>

namespace tracemark
{

const char* status_to_string(Status status)
{
    switch (status)
    {
        case Status::Ok:
            return "ok";
        case Status::InvalidSeries:
            return "invalid series";
        case Status::EmptySeries:
            return "empty series";
        case Status::IndexKindMismatch:
            return "index kind mismatch";
        case Status::UnknownLabel:
            return "unknown label";
        case Status::NoActiveLabel:
            return "no active label";
        case Status::EmptyMetadata:
            return "empty metadata";
    }
    return "unknown";
}

SessionModel::SessionModel(size_t palette_size) : palette_size_(std::max<size_t>(palette_size, 1))
{
}

SessionModel::~SessionModel() = default;

// ─── Items ───────────────────────────────────────────────────────────────────

Status SessionModel::add_item(Series series, std::optional<std::string> name, Metadata metadata)
{
    if (!series.valid())
    {
        TRACEMARK_LOG_ERROR("model", "Cannot add series: {}", series.error());
        return Status::InvalidSeries;
    }
    if (series.empty())
    {
        TRACEMARK_LOG_ERROR("model",
                            "Series {} is empty, cannot add to view",
                            name.value_or(series.name().value_or("<unnamed>")));
        return Status::EmptySeries;
    }
    if (index_kind_ && *index_kind_ != series.index_kind())
    {
        TRACEMARK_LOG_WARN("model",
                           "Cannot add {}-indexed series when the session x-axis is {}",
                           index_kind_name(series.index_kind()),
                           index_kind_name(*index_kind_));
        return Status::IndexKindMismatch;
    }

    size_t slot = std::min(items_.size(), palette_size_);

    std::string item_name;
    if (name && !name->empty())
        item_name = *name;
    else if (series.name() && !series.name()->empty())
        item_name = *series.name();
    else
        item_name = default_name(series, slot);

    if (!index_kind_)
        index_kind_ = series.index_kind();

    items_.push_back(
        std::make_unique<DataItem>(std::move(series), std::move(item_name), std::move(metadata),
                                   slot));
    ++total_items_ever_added_;

    DataItem& item = *items_.back();
    TRACEMARK_LOG_INFO("model",
                       "Added '{}' ({} values, {} index)",
                       item.name(),
                       item.series().size(),
                       index_kind_name(item.series().index_kind()));
    events_.item_added.emit(item);
    return Status::Ok;
}

std::string SessionModel::default_name(const Series& series, size_t slot)
{
    const std::string base = std::string(palette::item_color(slot).name) + " - "
                             + std::to_string(series.size());

    auto taken = [this](const std::string& candidate)
    {
        return issued_names_.count(candidate) > 0 || find_item(candidate) != nullptr;
    };

    std::string candidate = base;
    for (int n = 2; taken(candidate); ++n)
        candidate = base + " (" + std::to_string(n) + ")";

    issued_names_.insert(candidate);
    TRACEMARK_LOG_WARN("model",
                       "Found no name for series, using color and number of values: \"{}\"",
                       candidate);
    return candidate;
}

void SessionModel::remove_item(DataItem& item)
{
    auto it = std::find_if(items_.begin(),
                           items_.end(),
                           [&](const auto& owned) { return owned.get() == &item; });
    if (it == items_.end())
        throw std::logic_error("remove_item: item is not part of this session");

    std::unique_ptr<DataItem> owned = std::move(*it);
    items_.erase(it);

    TRACEMARK_LOG_INFO("model", "Removed '{}'", owned->name());
    events_.item_removed.emit(*owned);
}

void SessionModel::remove_items(const std::vector<DataItem*>& items)
{
    for (DataItem* item : items)
    {
        if (!item)
            throw std::logic_error("remove_items: null item");
        remove_item(*item);
    }
}

std::vector<DataItem*> SessionModel::visible_items() const
{
    std::vector<DataItem*> out;
    for (const auto& item : items_)
    {
        if (item->visible())
            out.push_back(item.get());
    }
    return out;
}

std::vector<DataItem*> SessionModel::targets(bool only_visible) const
{
    if (only_visible)
        return visible_items();

    std::vector<DataItem*> out;
    out.reserve(items_.size());
    for (const auto& item : items_)
        out.push_back(item.get());
    return out;
}

DataItem* SessionModel::find_item(std::string_view name) const
{
    for (const auto& item : items_)
    {
        if (item->name() == name)
            return item.get();
    }
    return nullptr;
}

bool SessionModel::contains(const DataItem* item) const
{
    return std::any_of(items_.begin(),
                       items_.end(),
                       [item](const auto& owned) { return owned.get() == item; });
}

DataItem& SessionModel::require_item(const DataItem& item) const
{
    for (const auto& owned : items_)
    {
        if (owned.get() == &item)
            return *owned;
    }
    throw std::logic_error("item is not part of this session");
}

void SessionModel::set_item_visible(DataItem& item, bool visible)
{
    DataItem& owned = require_item(item);
    if (owned.visible() == visible)
        return;
    owned.set_visible(visible);
    events_.item_visibility_changed.emit(owned);
}

void SessionModel::set_items_visible(Visibility how)
{
    for (DataItem* item : targets(false))
    {
        switch (how)
        {
            case Visibility::Invert:
                set_item_visible(*item, !item->visible());
                break;
            case Visibility::Show:
                set_item_visible(*item, true);
                break;
            case Visibility::Hide:
                set_item_visible(*item, false);
                break;
        }
    }
}

std::vector<DataItem*> SessionModel::match_items_by_metadata(const Metadata& partial) const
{
    std::vector<DataItem*> out;
    for (const auto& item : items_)
    {
        if (!item->metadata().empty() && metadata_matches(partial, item->metadata()))
            out.push_back(item.get());
    }
    return out;
}

void SessionModel::apply_on_visible(
    const std::function<void(const Series&, const Metadata&)>& fn) const
{
    for (DataItem* item : visible_items())
        fn(item->series(), item->metadata());
}

// ─── Labels ──────────────────────────────────────────────────────────────────

Status SessionModel::set_active_label(std::string_view id)
{
    auto label = parse_label(id);
    if (!label)
    {
        TRACEMARK_LOG_ERROR("model", "Unknown label '{}'", id);
        return Status::UnknownLabel;
    }
    return set_active_label(*label);
}

Status SessionModel::set_active_label(Label label)
{
    active_label_ = label;
    TRACEMARK_LOG_DEBUG("model", "Active label is now {}", label_id(label));
    return Status::Ok;
}

// ─── Markings ────────────────────────────────────────────────────────────────

Marking& SessionModel::add_marking(DataItem&                  item,
                                   double                     start,
                                   double                     end,
                                   Label                      label,
                                   std::optional<std::string> note)
{
    Marking& marking = item.append_marking(
        std::make_unique<Marking>(next_marking_id_++, start, end, label, std::move(note)));
    TRACEMARK_LOG_INFO("model",
                       "Marked '{}' {} <==> {} ({}) {}",
                       item.name(),
                       start,
                       end,
                       end - start,
                       label_id(label));
    events_.marking_added.emit(item, marking);
    return marking;
}

void SessionModel::new_marking_at_selection(double start, double end, bool only_visible)
{
    if (!active_label_)
    {
        TRACEMARK_LOG_INFO("model", "No label mode selected. Select one and try again");
        return;
    }
    for (DataItem* item : targets(only_visible))
        add_marking(*item, start, end, *active_label_);
}

Status SessionModel::new_markings_from_description(const std::vector<MarkingRecord>& records,
                                                   const Metadata&                   partial)
{
    if (partial.empty())
    {
        TRACEMARK_LOG_ERROR("model",
                            "Won't add {} markings without item metadata to match against",
                            records.size());
        return Status::EmptyMetadata;
    }

    auto matching = match_items_by_metadata(partial);
    if (matching.empty())
    {
        TRACEMARK_LOG_DEBUG("model", "No item matches {}", metadata_to_string(partial));
    }
    for (DataItem* item : matching)
    {
        for (const auto& record : records)
            add_marking(*item, record.start, record.end, record.label, record.note);
    }
    return Status::Ok;
}

void SessionModel::remove_marking(DataItem& item, Marking& marking)
{
    DataItem& owned = require_item(item);
    if (!owned.has_marking(marking))
        throw std::logic_error("remove_marking: marking is not active on '" + owned.name() + "'");

    owned.retire_marking(marking);
    TRACEMARK_LOG_INFO("model",
                       "Removed '{}' {} <==> {} ({}) {} | note: {}",
                       owned.name(),
                       marking.start(),
                       marking.end(),
                       marking.width(),
                       label_id(marking.label()),
                       marking.note().value_or(""));
    events_.marking_removed.emit(owned, marking);
}

Status SessionModel::relabel_marking(Marking& marking)
{
    if (!active_label_)
    {
        TRACEMARK_LOG_ERROR("model", "Current label not set");
        return Status::NoActiveLabel;
    }
    marking.label_ = *active_label_;
    events_.marking_label_updated.emit(marking);
    return Status::Ok;
}

void SessionModel::delete_markings_in_range(double x0, double x1, bool only_visible)
{
    for (DataItem* item : targets(only_visible))
    {
        std::vector<Marking*> doomed;
        for (const auto& m : item->markings())
        {
            bool start_inside = x0 < m->start() && m->start() < x1;
            bool end_inside   = x0 < m->end() && m->end() < x1;
            if (start_inside && end_inside)
                doomed.push_back(m.get());
        }
        for (Marking* m : doomed)
            remove_marking(*item, *m);
    }
}

void SessionModel::delete_all_markings(bool only_visible)
{
    for (DataItem* item : targets(only_visible))
    {
        std::vector<Marking*> doomed;
        for (const auto& m : item->markings())
            doomed.push_back(m.get());
        for (Marking* m : doomed)
            remove_marking(*item, *m);
    }
}

// ─── Tagging ─────────────────────────────────────────────────────────────────

void SessionModel::tag_full_extent(DataItem& item, const std::string& tag)
{
    const Series& s = item.series();
    TRACEMARK_LOG_INFO("model", "Tagging '{}' as {}", item.name(), tag);
    events_.interval_tagged.emit(item.metadata(), s.first_index(), s.last_index(), tag);
}

void SessionModel::tag_between_outer_markings(DataItem& item, const std::string& tag)
{
    auto extent = item.outer_marking_extent();
    if (!extent)
        return;
    TRACEMARK_LOG_INFO("model",
                       "Tagging '{}' as {} between {} and {}",
                       item.name(),
                       tag,
                       extent->first,
                       extent->second);
    events_.interval_tagged.emit(item.metadata(), extent->first, extent->second, tag);
}

void SessionModel::tag_items(const std::string& tag, bool only_visible)
{
    for (DataItem* item : targets(only_visible))
        tag_full_extent(*item, tag);
}

void SessionModel::tag_items_between_outer_markings(const std::string& tag, bool only_visible)
{
    for (DataItem* item : targets(only_visible))
        tag_between_outer_markings(*item, tag);
}

// ─── Persistence hand-off ────────────────────────────────────────────────────

namespace
{

ItemMarkings collect(const DataItem& item, const DataItem::MarkingList& list)
{
    ItemMarkings entry;
    entry.item     = &item;
    entry.metadata = item.metadata();
    entry.records.reserve(list.size());
    entry.marking_ids.reserve(list.size());
    for (const auto& m : list)
    {
        entry.records.push_back(to_record(*m));
        entry.marking_ids.push_back(m->id());
    }
    return entry;
}

}   // namespace

MarkingSnapshot SessionModel::save_snapshot(bool only_visible)
{
    MarkingSnapshot snapshot;
    size_t          active = 0;
    size_t          tombstones = 0;
    for (DataItem* item : targets(only_visible))
    {
        snapshot.changed.push_back(collect(*item, item->markings()));
        snapshot.deleted.push_back(collect(*item, item->deleted_markings()));
        active += item->markings().size();
        tombstones += item->deleted_markings().size();
    }
    TRACEMARK_LOG_INFO("model",
                       "Saving {} markings and {} deletions for {} items",
                       active,
                       tombstones,
                       snapshot.changed.size());
    events_.save_requested.emit(snapshot);
    return snapshot;
}

size_t SessionModel::acknowledge_saved(const MarkingSnapshot& snapshot)
{
    size_t dropped = 0;
    for (const auto& entry : snapshot.deleted)
    {
        for (const auto& owned : items_)
        {
            if (owned.get() == entry.item)
            {
                dropped += owned->forget_deleted(entry.marking_ids);
                break;
            }
        }
    }
    TRACEMARK_LOG_DEBUG("model", "Dropped {} acknowledged tombstones", dropped);
    return dropped;
}

void SessionModel::load_markings(bool only_visible, bool force)
{
    for (DataItem* item : targets(only_visible))
    {
        if (item->metadata().empty())
        {
            TRACEMARK_LOG_DEBUG("model", "'{}' has no metadata, nothing to load", item->name());
            continue;
        }

        std::string key = metadata_to_string(item->metadata());
        if (!force && loaded_metadata_.count(key) > 0)
        {
            TRACEMARK_LOG_INFO("model",
                               "Markings have already been loaded once for {}. "
                               "Use force to load them on top of the previous ones",
                               key);
            continue;
        }
        loaded_metadata_.insert(key);

        const Series& s = item->series();
        events_.load_requested.emit(item->metadata(), s.first_index(), s.last_index());
    }
}

bool SessionModel::markings_loaded_for(const Metadata& metadata) const
{
    return loaded_metadata_.count(metadata_to_string(metadata)) > 0;
}

}   // namespace tracemark
