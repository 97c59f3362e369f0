#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "ui/commands/command_registry.hpp"

using namespace tracemark;

// ─── Registration ────────────────────────────────────────────────────────────

TEST(CommandRegistry, InitiallyEmpty)
{
    CommandRegistry reg;
    EXPECT_EQ(reg.count(), 0u);
    EXPECT_EQ(reg.find("view.maximize"), nullptr);
    EXPECT_TRUE(reg.all_commands().empty());
}

TEST(CommandRegistry, RegisterAndFind)
{
    CommandRegistry reg;
    reg.register_command("view.maximize", "Maximize interval", []() {}, "K", "View");

    const Command* cmd = reg.find("view.maximize");
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->label, "Maximize interval");
    EXPECT_EQ(cmd->shortcut, "K");
    EXPECT_EQ(cmd->category, "View");
    EXPECT_TRUE(cmd->enabled);
}

TEST(CommandRegistry, DefaultCategoryIsGeneral)
{
    CommandRegistry reg;
    reg.register_command("app.quit", "Quit", []() {});
    EXPECT_EQ(reg.find("app.quit")->category, "General");
}

TEST(CommandRegistry, ReRegisterOverwrites)
{
    CommandRegistry reg;
    int             which = 0;
    reg.register_command("markings.save", "Save", [&]() { which = 1; });
    reg.register_command("markings.save", "Save markings", [&]() { which = 2; });

    EXPECT_EQ(reg.count(), 1u);
    EXPECT_EQ(reg.find("markings.save")->label, "Save markings");
    reg.execute("markings.save");
    EXPECT_EQ(which, 2);
}

TEST(CommandRegistry, Unregister)
{
    CommandRegistry reg;
    reg.register_command("a", "A", []() {});
    reg.unregister_command("a");
    reg.unregister_command("never-registered");
    EXPECT_EQ(reg.count(), 0u);
    EXPECT_FALSE(reg.execute("a"));
}

// ─── Execution ───────────────────────────────────────────────────────────────

TEST(CommandRegistry, ExecuteRunsCallback)
{
    CommandRegistry reg;
    int             calls = 0;
    reg.register_command("view.move_left", "Move left", [&]() { ++calls; });

    EXPECT_TRUE(reg.execute("view.move_left"));
    EXPECT_TRUE(reg.execute("view.move_left"));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(reg.execution_count(), 2u);
}

TEST(CommandRegistry, ExecuteUnknownFails)
{
    CommandRegistry reg;
    EXPECT_FALSE(reg.execute("label.sparkly"));
    EXPECT_EQ(reg.execution_count(), 0u);
}

TEST(CommandRegistry, DisabledCommandDoesNotRun)
{
    CommandRegistry reg;
    int             calls = 0;
    reg.register_command("items.remove_selected", "Remove", [&]() { ++calls; });

    reg.set_enabled("items.remove_selected", false);
    EXPECT_FALSE(reg.execute("items.remove_selected"));
    EXPECT_FALSE(reg.find("items.remove_selected")->enabled);

    reg.set_enabled("items.remove_selected", true);
    EXPECT_TRUE(reg.execute("items.remove_selected"));
    EXPECT_EQ(calls, 1);
}

TEST(CommandRegistry, CommandWithoutCallbackFails)
{
    CommandRegistry reg;
    Command         cmd;
    cmd.id    = "empty";
    cmd.label = "Empty";
    reg.register_command(std::move(cmd));
    EXPECT_FALSE(reg.execute("empty"));
}

TEST(CommandRegistry, CallbackMayRegisterCommands)
{
    CommandRegistry reg;
    reg.register_command("outer",
                         "Outer",
                         [&]() { reg.register_command("inner", "Inner", []() {}); });
    EXPECT_TRUE(reg.execute("outer"));
    EXPECT_NE(reg.find("inner"), nullptr);
}

// ─── Listing ─────────────────────────────────────────────────────────────────

TEST(CommandRegistry, AllCommandsSortedByCategoryThenLabel)
{
    CommandRegistry reg;
    reg.register_command("view.steps", "Toggle steps", []() {}, "S", "View");
    reg.register_command("label.good", "Good", []() {}, "Ctrl+J", "Labels");
    reg.register_command("view.markers", "Toggle markers", []() {}, "M", "View");
    reg.register_command("label.bfill", "BFill", []() {}, "Ctrl+B", "Labels");

    auto all = reg.all_commands();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0]->id, "label.bfill");
    EXPECT_EQ(all[1]->id, "label.good");
    EXPECT_EQ(all[2]->id, "view.markers");
    EXPECT_EQ(all[3]->id, "view.steps");
}

TEST(CommandRegistry, CommandsInCategory)
{
    CommandRegistry reg;
    reg.register_command("MarkingsIO.auto_mark_gaps", "Auto-mark gaps", []() {}, "", "Plugins");
    reg.register_command("RandomGenerator.generate", "Generate", []() {}, "", "Plugins");
    reg.register_command("app.quit", "Quit", []() {}, "Ctrl+Q", "App");

    auto plugins = reg.commands_in_category("Plugins");
    ASSERT_EQ(plugins.size(), 2u);
    EXPECT_EQ(plugins[0]->label, "Auto-mark gaps");
    EXPECT_EQ(plugins[1]->label, "Generate");
    EXPECT_TRUE(reg.commands_in_category("Nothing").empty());
}

TEST(CommandRegistry, CategoriesAreUniqueAndSorted)
{
    CommandRegistry reg;
    reg.register_command("b", "B", []() {}, "", "View");
    reg.register_command("a", "A", []() {}, "", "Labels");
    reg.register_command("c", "C", []() {}, "", "View");

    EXPECT_EQ(reg.categories(), (std::vector<std::string>{"Labels", "View"}));
}
