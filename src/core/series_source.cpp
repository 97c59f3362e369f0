#include <tracemark/logger.hpp>
#include <tracemark/series_source.hpp>
#include <tracemark/session_model.hpp>
#include <type_traits>

namespace tracemark
{

SeriesSource SeriesSource::mapping(Mapping entries)
{
    return SeriesSource(MappingNode{std::move(entries)});
}

SeriesSource SeriesSource::list(List entries)
{
    return SeriesSource(ListNode{std::move(entries)});
}

std::vector<SeriesSource::Entry> SeriesSource::flatten() const
{
    std::vector<Entry> out;
    flatten_into(out, std::nullopt);
    return out;
}

void SeriesSource::flatten_into(std::vector<Entry>&                out,
                                const std::optional<std::string>& name) const
{
    std::visit(
        [&](const auto& node)
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, std::vector<double>>)
            {
                // Empty sequences go through too; the model rejects and reports them.
                out.push_back({Series::from_values(node), name, {}});
            }
            else if constexpr (std::is_same_v<T, Series>)
            {
                out.push_back({node, name, {}});
            }
            else if constexpr (std::is_same_v<T, Record>)
            {
                out.push_back({node.series, node.name ? node.name : name, node.metadata});
            }
            else if constexpr (std::is_same_v<T, MappingNode>)
            {
                for (const auto& [key, child] : node.entries)
                    child.flatten_into(out, key);
            }
            else
            {
                if (node.entries.empty())
                    TRACEMARK_LOG_DEBUG("io", "Skipping empty source list");
                for (const auto& child : node.entries)
                    child.flatten_into(out, std::nullopt);
            }
        },
        node_);
}

size_t load_sources(SessionModel& model, const SeriesSource& source)
{
    size_t accepted = 0;
    for (auto& entry : source.flatten())
    {
        Status status = model.add_item(std::move(entry.series),
                                       std::move(entry.name),
                                       std::move(entry.metadata));
        if (status == Status::Ok)
        {
            ++accepted;
        }
    }
    return accepted;
}

}   // namespace tracemark
