#pragma once

#include <map>
#include <string>

#include "storage/marking_store.hpp"

namespace tracemark::storage
{

// Keeps everything in process memory. Also the base of the file-backed store.
class MemoryMarkingStore : public MarkingStore
{
   public:
    struct Entry
    {
        Metadata                    metadata;
        std::vector<MarkingRecord>  markings;
        std::vector<TaggedInterval> tags;
    };

    bool upsert(const Metadata& metadata, const std::vector<MarkingRecord>& records) override;
    bool remove(const Metadata& metadata, const std::vector<IndexRange>& ranges) override;
    bool tag(const Metadata& metadata, const TaggedInterval& interval) override;

    std::vector<MarkingRecord>  fetch(const Metadata& metadata) const override;
    std::vector<TaggedInterval> tags(const Metadata& metadata) const override;

    size_t entry_count() const { return entries_.size(); }
    size_t marking_count() const;

    // Makes every mutator fail until cleared (exercises retry paths).
    void set_read_only(bool read_only) { read_only_ = read_only; }
    bool read_only() const { return read_only_; }

   protected:
    const std::map<std::string, Entry>& entries() const { return entries_; }
    void                                replace_entries(std::map<std::string, Entry> entries);

    // Called after a successful in-memory mutation. Returning false rolls it back.
    virtual bool commit() { return true; }

   private:
    Entry& entry_for(const Metadata& metadata);

    std::map<std::string, Entry> entries_;
    bool                         read_only_ = false;
};

}   // namespace tracemark::storage
