#include "ui/register_commands.hpp"

#include <string>
#include <tracemark/logger.hpp>
#include <tracemark/session_model.hpp>

#include "sync/interval_sync.hpp"
#include "ui/commands/command_registry.hpp"

namespace tracemark
{

bool register_session_commands(const CommandBindings& b)
{
    if (!b.registry || !b.model || !b.sync)
    {
        TRACEMARK_LOG_ERROR("app", "Session commands need a registry, a model and a sync");
        return false;
    }

    CommandRegistry&    registry = *b.registry;
    SessionModel&       model    = *b.model;
    sync::IntervalSync& sync     = *b.sync;
    const std::string   cleaned  = b.config.cleaned_tag;

    // ─── Labels ──────────────────────────────────────────────────────────────
    for (const auto& info : label_table)
    {
        Label label = info.label;
        registry.register_command(
            "label." + std::string(info.id),
            std::string(info.id),
            [&model, label]() { model.set_active_label(label); },
            std::string("Ctrl+") + info.shortcut,
            "Labels");
    }

    // ─── File ────────────────────────────────────────────────────────────────
    auto quit = b.quit;
    registry.register_command(
        "app.quit",
        "Exit",
        [quit]()
        {
            if (quit)
                quit();
        },
        "Ctrl+Q",
        "File");

    registry.register_command(
        "markings.remove_in_interval",
        "Remove markings in displayed interval",
        [&sync]() { sync.delete_markings_in_displayed_interval(true); },
        "Ctrl+R",
        "File");

    registry.register_command("markings.load",
                              "Load markings for visible series",
                              [&model]() { model.load_markings(true, false); },
                              "",
                              "File");

    registry.register_command("markings.load_force",
                              "Reload markings for visible series",
                              [&model]() { model.load_markings(true, true); },
                              "",
                              "File");

    registry.register_command("markings.save",
                              "Save markings for visible series",
                              [&model]() { model.save_snapshot(true); },
                              "",
                              "File");

    registry.register_command("markings.tag_cleaned",
                              "Save visible series as cleaned",
                              [&model, cleaned]() { model.tag_items(cleaned, true); },
                              "",
                              "File");

    registry.register_command("markings.tag_cleaned_between_outer",
                              "Save visible series as cleaned between outer markings",
                              [&model, cleaned]()
                              { model.tag_items_between_outer_markings(cleaned, true); },
                              "",
                              "File");

    // ─── View ────────────────────────────────────────────────────────────────
    registry.register_command("view.invert_visible",
                              "Invert visible",
                              [&model]() { model.set_items_visible(Visibility::Invert); },
                              "I",
                              "View");

    registry.register_command("view.hide_all",
                              "Hide all",
                              [&model]() { model.set_items_visible(Visibility::Hide); },
                              "H",
                              "View");

    registry.register_command("view.toggle_markers",
                              "Toggle vertex markers",
                              [&sync]() { sync.detail().toggle_markers(); },
                              "M",
                              "View");

    registry.register_command("view.toggle_steps",
                              "Toggle step drawstyle",
                              [&sync]() { sync.detail().toggle_steps(); },
                              "S",
                              "View");

    registry.register_command("view.move_left",
                              "Move left",
                              [&sync]() { sync.move_interval(sync::Direction::Left); },
                              "-",
                              "View");

    registry.register_command("view.move_right",
                              "Move right",
                              [&sync]() { sync.move_interval(sync::Direction::Right); },
                              "Space",
                              "View");

    registry.register_command("view.maximize",
                              "Maximize display interval",
                              [&sync]() { sync.maximize_interval(); },
                              "K",
                              "View");

    auto selected = b.selected_items;
    registry.register_command(
        "items.remove_selected",
        "Remove series",
        [&model, selected]()
        {
            if (!selected)
                return;
            auto items = selected();
            if (items.empty())
                return;
            model.remove_items(items);
        },
        "Delete",
        "View");

    TRACEMARK_LOG_DEBUG("app", "Registered {} commands", registry.count());
    return true;
}

}   // namespace tracemark
