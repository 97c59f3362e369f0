#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tracemark/label.hpp>
#include <utility>

namespace tracemark
{

class SessionModel;

// Labeled interval [start, end) over the owning item's index domain.
// Only the label changes after creation, and only through SessionModel::relabel_marking.
class Marking
{
   public:
    Marking(uint64_t id, double start, double end, Label label, std::optional<std::string> note)
        : id_(id), start_(start), end_(end), label_(label), note_(std::move(note))
    {
    }

    Marking(const Marking&)            = delete;
    Marking& operator=(const Marking&) = delete;

    // Session-unique, never reused.
    uint64_t id() const { return id_; }

    double                            start() const { return start_; }
    double                            end() const { return end_; }
    double                            width() const { return end_ - start_; }
    Label                             label() const { return label_; }
    const std::optional<std::string>& note() const { return note_; }

   private:
    friend class SessionModel;

    uint64_t                   id_;
    double                     start_;
    double                     end_;
    Label                      label_;
    std::optional<std::string> note_;
};

// Detached description of a marking, as exchanged with storage and analysis helpers.
struct MarkingRecord
{
    double                     start = 0.0;
    double                     end   = 0.0;
    Label                      label = Label::Discard;
    std::optional<std::string> note;

    bool operator==(const MarkingRecord& o) const
    {
        return start == o.start && end == o.end && label == o.label && note == o.note;
    }
};

inline MarkingRecord to_record(const Marking& m)
{
    return MarkingRecord{m.start(), m.end(), m.label(), m.note()};
}

}   // namespace tracemark
