#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <tracemark/session_events.hpp>

#include "plugins/plugin.hpp"
#include "storage/marking_store.hpp"

namespace tracemark
{

// JSON file store when config.markings_store_path is set, in-memory store otherwise.
std::unique_ptr<storage::MarkingStore> make_marking_store(const AppConfig& config);

// Moves markings between the session and a MarkingStore: answers the model's save
// and load requests, records tagged intervals, and marks gaps in the visible series.
class MarkingsIO : public Plugin
{
   public:
    static constexpr const char* kName = "MarkingsIO";

    explicit MarkingsIO(std::unique_ptr<storage::MarkingStore> store);

    std::string name() const override { return kName; }
    void        bind(PluginHost& host) override;
    void        destroy() override;

    std::vector<PluginAction>        actions() override;
    std::map<std::string, CliAction> cli_actions() override;

    // Deletes the tombstoned markings, then upserts the changed ones, then tells the
    // model which tombstones are gone. Deletes for items with is_total metadata are
    // skipped and count as done. Returns false if any store call failed; the
    // tombstones involved stay in the model for the next save.
    bool save(const MarkingSnapshot& snapshot);

    // Fetches markings stored for `metadata` that lie within [start, end] and adds
    // them to the matching items. Returns how many records were handed over.
    size_t load(const Metadata& metadata, double start, double end);

    // Marks every gap wider than `gap_limit` in each visible series with `label`.
    // Returns the number of gaps found, or 0 when the label is unknown.
    size_t auto_mark_gaps(const std::string& gap_limit, std::string_view label);

    storage::MarkingStore& store() { return *store_; }

   private:
    std::unique_ptr<storage::MarkingStore> store_;
    SessionModel*                          model_ = nullptr;
    std::string                            default_gap_limit_;
    ConnectionSet                          connections_;
};

}   // namespace tracemark
