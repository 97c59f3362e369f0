#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "sync/interval_sync.hpp"
#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"
#include "ui/register_commands.hpp"
#include <tracemark/session_model.hpp>

using namespace tracemark;

class RegisterCommandsTest : public ::testing::Test
{
   protected:
    SessionModel           model;
    sync::IntervalSync     sync{model};
    CommandRegistry        registry;
    std::vector<DataItem*> selection;
    int                    quits = 0;

    void SetUp() override
    {
        CommandBindings b;
        b.registry       = &registry;
        b.model          = &model;
        b.sync           = &sync;
        b.selected_items = [this]() { return selection; };
        b.quit           = [this]() { ++quits; };
        ASSERT_TRUE(register_session_commands(b));
    }

    DataItem& add(const std::string& name, size_t n = 600)
    {
        std::vector<double> values(n);
        for (size_t i = 0; i < n; ++i)
            values[i] = static_cast<double>(i);
        Metadata metadata{{"column", name}};
        EXPECT_EQ(model.add_item(Series::from_values(std::move(values)), name, metadata),
                  Status::Ok);
        return *model.items().back();
    }
};

TEST(RegisterCommands, MissingBindingsRegisterNothing)
{
    SessionModel    model;
    CommandRegistry registry;

    CommandBindings b;
    b.registry = &registry;
    b.model    = &model;
    EXPECT_FALSE(register_session_commands(b));
    EXPECT_EQ(registry.count(), 0u);
}

TEST_F(RegisterCommandsTest, RegistersAllSessionCommands)
{
    EXPECT_EQ(registry.count(), 22u);
    EXPECT_EQ(registry.categories(), (std::vector<std::string>{"File", "Labels", "View"}));
    EXPECT_EQ(registry.commands_in_category("Labels").size(), label_table.size());
}

TEST_F(RegisterCommandsTest, ShortcutTextMatchesDefaultBindings)
{
    ShortcutManager shortcuts;
    shortcuts.register_defaults();
    for (const auto& binding : shortcuts.all_bindings())
    {
        const Command* cmd = registry.find(binding.command_id);
        ASSERT_NE(cmd, nullptr) << binding.command_id;
        EXPECT_EQ(cmd->shortcut, binding.shortcut.to_string()) << binding.command_id;
    }
}

// ─── Labels and file ─────────────────────────────────────────────────────────

TEST_F(RegisterCommandsTest, LabelCommandsSetActiveLabel)
{
    EXPECT_FALSE(model.active_label().has_value());
    EXPECT_TRUE(registry.execute("label.linear-fill"));
    EXPECT_TRUE(model.active_label() == Label::LinearFill);
    EXPECT_TRUE(registry.execute("label.bfill"));
    EXPECT_TRUE(model.active_label() == Label::BFill);
}

TEST_F(RegisterCommandsTest, QuitCallsFrontEnd)
{
    registry.execute("app.quit");
    EXPECT_EQ(quits, 1);
}

TEST_F(RegisterCommandsTest, RemoveInDisplayedInterval)
{
    DataItem& item = add("a");
    model.add_marking(item, 10.0, 20.0, Label::Good);
    model.add_marking(item, 300.0, 310.0, Label::Good);

    registry.execute("markings.remove_in_interval");
    ASSERT_EQ(item.markings().size(), 1u);
    EXPECT_DOUBLE_EQ(item.markings()[0]->start(), 300.0);
}

TEST_F(RegisterCommandsTest, SaveLoadAndTagReachTheModelEvents)
{
    DataItem& item = add("a");
    model.add_marking(item, 10.0, 20.0, Label::Good);

    int                      saves = 0;
    int                      loads = 0;
    std::vector<std::string> tags;
    ConnectionSet            connections;
    connections.connect(model.events().save_requested, [&](const MarkingSnapshot&) { ++saves; });
    connections.connect(model.events().load_requested,
                        [&](const Metadata&, double, double) { ++loads; });
    connections.connect(model.events().interval_tagged,
                        [&](const Metadata&, double start, double end, const std::string& tag)
                        { tags.push_back(tag + " " + std::to_string(int(start)) + "-"
                                         + std::to_string(int(end))); });

    registry.execute("markings.save");
    EXPECT_EQ(saves, 1);

    registry.execute("markings.load");
    registry.execute("markings.load");
    EXPECT_EQ(loads, 1);
    registry.execute("markings.load_force");
    EXPECT_EQ(loads, 2);

    registry.execute("markings.tag_cleaned");
    registry.execute("markings.tag_cleaned_between_outer");
    EXPECT_EQ(tags, (std::vector<std::string>{"cleaned 0-599", "cleaned 10-20"}));
}

// ─── View ────────────────────────────────────────────────────────────────────

TEST_F(RegisterCommandsTest, NavigationCommands)
{
    add("a");
    ASSERT_EQ(sync.detail().xlim(), (sync::AxisRange{0.0, 100.0}));

    registry.execute("view.move_right");
    EXPECT_EQ(sync.detail().xlim(), (sync::AxisRange{100.0, 200.0}));
    registry.execute("view.move_left");
    EXPECT_EQ(sync.detail().xlim(), (sync::AxisRange{0.0, 100.0}));
    registry.execute("view.maximize");
    EXPECT_EQ(sync.detail().xlim(), (sync::AxisRange{0.0, 599.0}));
}

TEST_F(RegisterCommandsTest, VisibilityCommands)
{
    DataItem& a = add("a");
    DataItem& b = add("b");
    model.set_item_visible(b, false);

    registry.execute("view.invert_visible");
    EXPECT_FALSE(a.visible());
    EXPECT_TRUE(b.visible());

    registry.execute("view.hide_all");
    EXPECT_TRUE(model.visible_items().empty());
}

TEST_F(RegisterCommandsTest, DrawStyleToggles)
{
    registry.execute("view.toggle_steps");
    registry.execute("view.toggle_markers");
    registry.execute("view.toggle_markers");
    EXPECT_TRUE(sync.detail().steps());
    EXPECT_FALSE(sync.detail().markers());
}

TEST_F(RegisterCommandsTest, RemoveSelectedItems)
{
    DataItem& a = add("a");
    add("b");

    registry.execute("items.remove_selected");
    EXPECT_EQ(model.item_count(), 2u);

    selection = {&a};
    registry.execute("items.remove_selected");
    ASSERT_EQ(model.item_count(), 1u);
    EXPECT_EQ(model.items()[0]->name(), "b");
    EXPECT_TRUE(sync.spans_consistent());
}
