#pragma once

#include <string>
#include <tracemark/marking.hpp>
#include <tracemark/metadata.hpp>
#include <utility>
#include <vector>

namespace tracemark::storage
{

// [start, end] of a stored marking, the key deletes are made by.
using IndexRange = std::pair<double, double>;

struct TaggedInterval
{
    double      start = 0.0;
    double      end   = 0.0;
    std::string tag;

    bool operator==(const TaggedInterval& o) const
    {
        return start == o.start && end == o.end && tag == o.tag;
    }
};

// Where markings live between sessions. Entries are keyed by the full item metadata;
// within an entry a marking is identified by its (start, end) pair, so repeating an
// upsert or a delete has no further effect. Mutators return false when the change
// could not be stored; the store is then left as it was.
class MarkingStore
{
   public:
    virtual ~MarkingStore() = default;

    virtual bool upsert(const Metadata& metadata, const std::vector<MarkingRecord>& records) = 0;
    virtual bool remove(const Metadata& metadata, const std::vector<IndexRange>& ranges)     = 0;
    virtual bool tag(const Metadata& metadata, const TaggedInterval& interval)               = 0;

    virtual std::vector<MarkingRecord>  fetch(const Metadata& metadata) const = 0;
    virtual std::vector<TaggedInterval> tags(const Metadata& metadata) const  = 0;
};

}   // namespace tracemark::storage
