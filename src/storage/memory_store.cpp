#include "storage/memory_store.hpp"

#include <algorithm>

namespace tracemark::storage
{

MemoryMarkingStore::Entry& MemoryMarkingStore::entry_for(const Metadata& metadata)
{
    auto [it, inserted] = entries_.try_emplace(metadata_to_string(metadata));
    if (inserted)
        it->second.metadata = metadata;
    return it->second;
}

void MemoryMarkingStore::replace_entries(std::map<std::string, Entry> entries)
{
    entries_ = std::move(entries);
}

bool MemoryMarkingStore::upsert(const Metadata& metadata, const std::vector<MarkingRecord>& records)
{
    if (read_only_)
        return false;
    if (records.empty())
        return true;

    auto   backup = entries_;
    Entry& entry  = entry_for(metadata);
    for (const auto& record : records)
    {
        auto it = std::find_if(entry.markings.begin(),
                               entry.markings.end(),
                               [&record](const MarkingRecord& m)
                               { return m.start == record.start && m.end == record.end; });
        if (it != entry.markings.end())
            *it = record;
        else
            entry.markings.push_back(record);
    }

    if (!commit())
    {
        entries_ = std::move(backup);
        return false;
    }
    return true;
}

bool MemoryMarkingStore::remove(const Metadata& metadata, const std::vector<IndexRange>& ranges)
{
    if (read_only_)
        return false;

    auto it = entries_.find(metadata_to_string(metadata));
    if (it == entries_.end() || ranges.empty())
        return true;

    auto backup = entries_;
    std::erase_if(it->second.markings,
                  [&ranges](const MarkingRecord& m)
                  {
                      return std::any_of(ranges.begin(),
                                         ranges.end(),
                                         [&m](const IndexRange& r)
                                         { return m.start == r.first && m.end == r.second; });
                  });

    if (!commit())
    {
        entries_ = std::move(backup);
        return false;
    }
    return true;
}

bool MemoryMarkingStore::tag(const Metadata& metadata, const TaggedInterval& interval)
{
    if (read_only_)
        return false;

    auto   backup = entries_;
    Entry& entry  = entry_for(metadata);
    if (std::find(entry.tags.begin(), entry.tags.end(), interval) == entry.tags.end())
        entry.tags.push_back(interval);

    if (!commit())
    {
        entries_ = std::move(backup);
        return false;
    }
    return true;
}

std::vector<MarkingRecord> MemoryMarkingStore::fetch(const Metadata& metadata) const
{
    auto it = entries_.find(metadata_to_string(metadata));
    if (it == entries_.end())
        return {};
    return it->second.markings;
}

std::vector<TaggedInterval> MemoryMarkingStore::tags(const Metadata& metadata) const
{
    auto it = entries_.find(metadata_to_string(metadata));
    if (it == entries_.end())
        return {};
    return it->second.tags;
}

size_t MemoryMarkingStore::marking_count() const
{
    size_t n = 0;
    for (const auto& [key, entry] : entries_)
        n += entry.markings.size();
    return n;
}

}   // namespace tracemark::storage
