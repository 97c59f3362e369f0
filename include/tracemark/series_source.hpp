#pragma once

#include <optional>
#include <string>
#include <tracemark/metadata.hpp>
#include <tracemark/series.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace tracemark
{

class SessionModel;

// Anything the loader accepts: a bare numeric sequence, a Series, a record with an
// explicit name and metadata, a name -> source mapping, or a list of sources.
// Mappings and lists nest arbitrarily.
class SeriesSource
{
   public:
    struct Record
    {
        Series                     series;
        std::optional<std::string> name;
        Metadata                   metadata;
    };
    using Mapping = std::vector<std::pair<std::string, SeriesSource>>;
    using List    = std::vector<SeriesSource>;

    SeriesSource(std::vector<double> values) : node_(std::move(values)) {}
    SeriesSource(Series series) : node_(std::move(series)) {}
    SeriesSource(Record record) : node_(std::move(record)) {}

    static SeriesSource mapping(Mapping entries);
    static SeriesSource list(List entries);

    // One resolved (series, name, metadata) triple.
    struct Entry
    {
        Series                     series;
        std::optional<std::string> name;
        Metadata                   metadata;
    };

    // Depth-first flattening. A mapping key names its child unless the child sets its own.
    std::vector<Entry> flatten() const;

   private:
    struct MappingNode
    {
        Mapping entries;
    };
    struct ListNode
    {
        List entries;
    };

    explicit SeriesSource(MappingNode node) : node_(std::move(node)) {}
    explicit SeriesSource(ListNode node) : node_(std::move(node)) {}

    void flatten_into(std::vector<Entry>& out, const std::optional<std::string>& name) const;

    std::variant<std::vector<double>, Series, Record, MappingNode, ListNode> node_;
};

// Feeds every flattened entry to SessionModel::add_item. Returns how many were accepted.
size_t load_sources(SessionModel& model, const SeriesSource& source);

}   // namespace tracemark
