#include "plugins/markings_io.hpp"

#include <tracemark/logger.hpp>
#include <tracemark/session_model.hpp>

#include "data/gaps.hpp"
#include "io/json_util.hpp"
#include "storage/json_file_store.hpp"
#include "storage/memory_store.hpp"

namespace tracemark
{

std::unique_ptr<storage::MarkingStore> make_marking_store(const AppConfig& config)
{
    if (config.markings_store_path.empty())
        return std::make_unique<storage::MemoryMarkingStore>();
    return std::make_unique<storage::JsonFileMarkingStore>(config.markings_store_path);
}

MarkingsIO::MarkingsIO(std::unique_ptr<storage::MarkingStore> store) : store_(std::move(store))
{
    if (!store_)
        store_ = std::make_unique<storage::MemoryMarkingStore>();
}

void MarkingsIO::bind(PluginHost& host)
{
    model_             = &host.model;
    default_gap_limit_ = host.config.default_gap_limit;

    SessionEvents& events = model_->events();
    connections_.connect(events.save_requested,
                         [this](const MarkingSnapshot& snapshot) { save(snapshot); });
    connections_.connect(events.load_requested,
                         [this](const Metadata& metadata, double start, double end)
                         { load(metadata, start, end); });
    connections_.connect(events.interval_tagged,
                         [this](const Metadata&    metadata,
                                double             start,
                                double             end,
                                const std::string& tag)
                         {
                             if (!store_->tag(metadata, {start, end, tag}))
                             {
                                 TRACEMARK_LOG_ERROR("io",
                                                     "Could not store tag {} for {}",
                                                     tag,
                                                     metadata_to_string(metadata));
                             }
                         });
}

void MarkingsIO::destroy()
{
    connections_.disconnect_all();
    model_ = nullptr;
}

bool MarkingsIO::save(const MarkingSnapshot& snapshot)
{
    bool ok = true;

    // Deletes go first: a tombstone and an active marking may share a range when a
    // marking was removed and redrawn, and the upsert must win.
    MarkingSnapshot done;
    for (const auto& entry : snapshot.deleted)
    {
        if (entry.records.empty())
            continue;
        if (metadata_is_total(entry.metadata))
        {
            TRACEMARK_LOG_INFO("io", "Skipping 'totals': {}", metadata_to_string(entry.metadata));
            done.deleted.push_back(entry);
            continue;
        }

        std::vector<storage::IndexRange> ranges;
        ranges.reserve(entry.records.size());
        for (const auto& record : entry.records)
            ranges.emplace_back(record.start, record.end);

        if (!store_->remove(entry.metadata, ranges))
        {
            TRACEMARK_LOG_ERROR("io",
                                "Could not delete {} markings for {}, will retry on next save",
                                ranges.size(),
                                metadata_to_string(entry.metadata));
            ok = false;
            continue;
        }
        TRACEMARK_LOG_INFO("io",
                           "Deleted {} markings for {}",
                           ranges.size(),
                           metadata_to_string(entry.metadata));
        done.deleted.push_back(entry);
    }

    for (const auto& entry : snapshot.changed)
    {
        if (entry.records.empty())
            continue;
        if (!store_->upsert(entry.metadata, entry.records))
        {
            TRACEMARK_LOG_ERROR("io",
                                "Could not store markings for {}",
                                metadata_to_string(entry.metadata));
            ok = false;
            continue;
        }
        TRACEMARK_LOG_INFO("io",
                           "Updated/inserted {} markings for {}",
                           entry.records.size(),
                           metadata_to_string(entry.metadata));
    }

    if (model_ && !done.deleted.empty())
        model_->acknowledge_saved(done);
    return ok;
}

size_t MarkingsIO::load(const Metadata& metadata, double start, double end)
{
    std::vector<MarkingRecord> in_range;
    for (auto& record : store_->fetch(metadata))
    {
        bool inside = start <= record.start && record.start <= end && start <= record.end
                      && record.end <= end;
        if (inside)
            in_range.push_back(std::move(record));
    }
    TRACEMARK_LOG_INFO("io",
                       "Loaded {} markings for {}",
                       in_range.size(),
                       metadata_to_string(metadata));

    if (!model_ || in_range.empty())
        return in_range.size();
    if (model_->new_markings_from_description(in_range, metadata) != Status::Ok)
        return 0;
    return in_range.size();
}

size_t MarkingsIO::auto_mark_gaps(const std::string& gap_limit, std::string_view label_text)
{
    auto label = parse_label(label_text);
    if (!label)
    {
        TRACEMARK_LOG_ERROR("io", "Bad label {}", label_text);
        return 0;
    }
    if (!model_)
        return 0;

    size_t found = 0;
    model_->apply_on_visible(
        [&](const Series& series, const Metadata& metadata)
        {
            auto threshold = data::parse_gap_threshold(gap_limit, series.index_kind());
            if (!threshold)
            {
                TRACEMARK_LOG_ERROR("io",
                                    "Bad gap limit '{}' for a {}-indexed series",
                                    gap_limit,
                                    index_kind_name(series.index_kind()));
                return;
            }
            auto gaps = data::detect_gaps(series, *threshold, *label);
            if (gaps.empty())
                return;
            if (model_->new_markings_from_description(gaps, metadata) == Status::Ok)
                found += gaps.size();
        });
    TRACEMARK_LOG_INFO("io", "Marked {} gaps wider than {}", found, gap_limit);
    return found;
}

std::vector<PluginAction> MarkingsIO::actions()
{
    return {
        {"auto_mark_gaps",
         "Auto-mark gaps",
         [this]() { auto_mark_gaps(default_gap_limit_, label_id(Label::Discard)); }},
    };
}

std::map<std::string, CliAction> MarkingsIO::cli_actions()
{
    return {
        {"auto_mark_gaps",
         [this](const std::string& json_args)
         {
             auto        args  = json::object_members(json_args);
             std::string gap   = json::read_string(args, "gap_limit", default_gap_limit_);
             std::string label =
                 json::read_string(args, "label", std::string(label_id(Label::Discard)));
             if (!parse_label(label))
             {
                 TRACEMARK_LOG_ERROR("io", "Bad label {}", label);
                 return false;
             }
             auto_mark_gaps(gap, label);
             return true;
         }},
    };
}

}   // namespace tracemark
