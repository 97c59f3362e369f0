#include <gtest/gtest.h>
#include <string>

#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"

using namespace tracemark;

// ─── Shortcut string conversion ──────────────────────────────────────────────

TEST(Shortcut, ToString)
{
    EXPECT_EQ((Shortcut{keys::letter('k'), KeyMod::None}).to_string(), "K");
    EXPECT_EQ((Shortcut{keys::letter('r'), KeyMod::Control}).to_string(), "Ctrl+R");
    EXPECT_EQ((Shortcut{keys::Minus, KeyMod::None}).to_string(), "-");
    EXPECT_EQ((Shortcut{keys::Space, KeyMod::None}).to_string(), "Space");
    EXPECT_EQ((Shortcut{keys::Delete, KeyMod::Shift | KeyMod::Alt}).to_string(),
              "Shift+Alt+Delete");
    EXPECT_EQ((Shortcut{keys::F1 + 4, KeyMod::None}).to_string(), "F5");
}

TEST(Shortcut, FromString)
{
    EXPECT_EQ(Shortcut::from_string("Ctrl+J"), (Shortcut{keys::letter('j'), KeyMod::Control}));
    EXPECT_EQ(Shortcut::from_string("ctrl + shift + z"),
              (Shortcut{keys::Z, KeyMod::Control | KeyMod::Shift}));
    EXPECT_EQ(Shortcut::from_string("space"), (Shortcut{keys::Space, KeyMod::None}));
    EXPECT_EQ(Shortcut::from_string("-"), (Shortcut{keys::Minus, KeyMod::None}));
    EXPECT_EQ(Shortcut::from_string("Del"), (Shortcut{keys::Delete, KeyMod::None}));
    EXPECT_EQ(Shortcut::from_string("F12"), (Shortcut{keys::F12, KeyMod::None}));
}

TEST(Shortcut, FromStringRejectsGarbage)
{
    EXPECT_FALSE(Shortcut::from_string("").valid());
    EXPECT_FALSE(Shortcut::from_string("Hyper+K").valid());
    EXPECT_FALSE(Shortcut::from_string("Ctrl+").valid());
    EXPECT_FALSE(Shortcut::from_string("Ctrl+Banana").valid());
    EXPECT_EQ(Shortcut::from_string("Ctrl+Banana").mods, KeyMod::None);
}

TEST(Shortcut, StringRoundTrip)
{
    for (const char* text : {"Ctrl+B", "Ctrl+Shift+W", "K", "Space", "-", "Delete", "Escape"})
        EXPECT_EQ(Shortcut::from_string(text).to_string(), text);
}

// ─── Bindings ────────────────────────────────────────────────────────────────

TEST(ShortcutManager, BindAndLookup)
{
    ShortcutManager mgr;
    Shortcut        ctrl_r{keys::letter('r'), KeyMod::Control};
    mgr.bind(ctrl_r, "markings.remove_in_interval");

    EXPECT_EQ(mgr.command_for_shortcut(ctrl_r), "markings.remove_in_interval");
    EXPECT_EQ(mgr.shortcut_for_command("markings.remove_in_interval"), ctrl_r);
    EXPECT_EQ(mgr.command_for_shortcut({keys::letter('r'), KeyMod::None}), "");
    EXPECT_FALSE(mgr.shortcut_for_command("unknown").valid());
}

TEST(ShortcutManager, RebindReplaces)
{
    ShortcutManager mgr;
    Shortcut        k{keys::letter('k'), KeyMod::None};
    mgr.bind(k, "view.maximize");
    mgr.bind(k, "view.hide_all");
    EXPECT_EQ(mgr.count(), 1u);
    EXPECT_EQ(mgr.command_for_shortcut(k), "view.hide_all");
}

TEST(ShortcutManager, InvalidShortcutIsNotBound)
{
    ShortcutManager mgr;
    mgr.bind(Shortcut{}, "app.quit");
    EXPECT_EQ(mgr.count(), 0u);
}

TEST(ShortcutManager, Unbind)
{
    ShortcutManager mgr;
    Shortcut        i{keys::letter('i'), KeyMod::None};
    Shortcut        h{keys::letter('h'), KeyMod::None};
    mgr.bind(i, "view.invert_visible");
    mgr.bind(h, "view.hide_all");

    mgr.unbind(i);
    EXPECT_EQ(mgr.command_for_shortcut(i), "");
    mgr.unbind_command("view.hide_all");
    EXPECT_EQ(mgr.count(), 0u);
}

// ─── Key handling ────────────────────────────────────────────────────────────

class ShortcutKeysTest : public ::testing::Test
{
   protected:
    CommandRegistry registry;
    ShortcutManager mgr;
    std::string     last;

    void SetUp() override
    {
        mgr.set_command_registry(&registry);
        mgr.register_defaults();
        for (const auto& binding : mgr.all_bindings())
        {
            std::string id = binding.command_id;
            registry.register_command(id, id, [this, id]() { last = id; });
        }
    }

    static constexpr int kPress   = 1;
    static constexpr int kRelease = 0;
    static constexpr int kRepeat  = 2;
    static constexpr int kCtrl    = 0x02;
};

TEST_F(ShortcutKeysTest, DefaultBindings)
{
    EXPECT_EQ(mgr.count(), 17u);
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("Ctrl+W")), "label.linear-fill");
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("Ctrl+J")), "label.good");
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("Ctrl+Q")), "app.quit");
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("Space")), "view.move_right");
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("-")), "view.move_left");
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("Delete")), "items.remove_selected");
}

TEST_F(ShortcutKeysTest, PressRunsBoundCommand)
{
    EXPECT_TRUE(mgr.on_key(keys::letter('d'), kPress, kCtrl));
    EXPECT_EQ(last, "label.discard");

    EXPECT_TRUE(mgr.on_key(keys::letter('k'), kPress, 0));
    EXPECT_EQ(last, "view.maximize");
    EXPECT_EQ(registry.execution_count(), 2u);
}

TEST_F(ShortcutKeysTest, ReleaseAndRepeatAreIgnored)
{
    EXPECT_FALSE(mgr.on_key(keys::Space, kRelease, 0));
    EXPECT_FALSE(mgr.on_key(keys::Space, kRepeat, 0));
    EXPECT_TRUE(last.empty());
}

TEST_F(ShortcutKeysTest, ModifiersMustMatch)
{
    // Plain D is not bound; Ctrl+K is not bound.
    EXPECT_FALSE(mgr.on_key(keys::letter('d'), kPress, 0));
    EXPECT_FALSE(mgr.on_key(keys::letter('k'), kPress, kCtrl));
    // Lock-key bits above the modifier nibble are dropped.
    EXPECT_TRUE(mgr.on_key(keys::letter('z'), kPress, kCtrl | 0x10));
    EXPECT_EQ(last, "label.zero");
}

TEST_F(ShortcutKeysTest, DisabledCommandDoesNotRun)
{
    registry.set_enabled("view.toggle_steps", false);
    EXPECT_FALSE(mgr.on_key(keys::letter('s'), kPress, 0));
    EXPECT_TRUE(last.empty());
}

TEST(ShortcutManager, NoRegistryDoesNothing)
{
    ShortcutManager mgr;
    mgr.register_defaults();
    EXPECT_FALSE(mgr.on_key(keys::letter('k'), 1, 0));
}
