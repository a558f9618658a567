#include <gtest/gtest.h>
#include <string>

#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"

using namespace trigon;

// ─── Shortcut strings ────────────────────────────────────────────────────────

TEST(Shortcut, ToString)
{
    EXPECT_EQ((Shortcut{keys::KEY_L, KeyMod::None}).to_string(), "L");
    EXPECT_EQ((Shortcut{keys::KEY_R, KeyMod::Control}).to_string(), "Ctrl+R");
    EXPECT_EQ((Shortcut{keys::KEY_Z, KeyMod::Shift | KeyMod::Control}).to_string(), "Ctrl+Shift+Z");
    EXPECT_EQ((Shortcut{keys::KEY_0, KeyMod::Alt | KeyMod::Super}).to_string(), "Alt+Super+0");
}

TEST(Shortcut, ToStringNamedKeys)
{
    EXPECT_EQ((Shortcut{keys::KEY_SPACE, KeyMod::None}).to_string(), "Space");
    EXPECT_EQ((Shortcut{keys::KEY_UP, KeyMod::None}).to_string(), "Up");
    EXPECT_EQ((Shortcut{keys::KEY_ESCAPE, KeyMod::None}).to_string(), "Escape");
    EXPECT_EQ((Shortcut{keys::KEY_EQUAL, KeyMod::None}).to_string(), "=");
    EXPECT_EQ((Shortcut{keys::KEY_MINUS, KeyMod::None}).to_string(), "-");
    EXPECT_EQ((Shortcut{keys::KEY_F1 + 2, KeyMod::None}).to_string(), "F3");
    EXPECT_EQ((Shortcut{340, KeyMod::None}).to_string(), "Key340");
}

TEST(Shortcut, FromString)
{
    Shortcut sc = Shortcut::from_string("ctrl+shift+z");
    EXPECT_EQ(sc.key, keys::KEY_Z);
    EXPECT_TRUE(has_mod(sc.mods, KeyMod::Control));
    EXPECT_TRUE(has_mod(sc.mods, KeyMod::Shift));
    EXPECT_FALSE(has_mod(sc.mods, KeyMod::Alt));

    EXPECT_EQ(Shortcut::from_string("v"), (Shortcut{keys::KEY_V, KeyMod::None}));
    EXPECT_EQ(Shortcut::from_string(" Control + T "), (Shortcut{keys::KEY_T, KeyMod::Control}));
    EXPECT_EQ(Shortcut::from_string("Cmd+S"), (Shortcut{keys::KEY_S, KeyMod::Super}));
}

TEST(Shortcut, FromStringNamedKeysAndAliases)
{
    EXPECT_EQ(Shortcut::from_string("Escape").key, keys::KEY_ESCAPE);
    EXPECT_EQ(Shortcut::from_string("esc").key, keys::KEY_ESCAPE);
    EXPECT_EQ(Shortcut::from_string("Return").key, keys::KEY_ENTER);
    EXPECT_EQ(Shortcut::from_string("SPACE").key, keys::KEY_SPACE);
    EXPECT_EQ(Shortcut::from_string("Down").key, keys::KEY_DOWN);
    EXPECT_EQ(Shortcut::from_string("f1").key, keys::KEY_F1);
    EXPECT_EQ(Shortcut::from_string("F12").key, keys::KEY_F1 + 11);
    EXPECT_EQ(Shortcut::from_string("=").key, keys::KEY_EQUAL);
}

TEST(Shortcut, FromStringRejectsBadInput)
{
    EXPECT_FALSE(Shortcut::from_string("").valid());
    EXPECT_FALSE(Shortcut::from_string("Ctrl+").valid());
    EXPECT_FALSE(Shortcut::from_string("NotAKey").valid());
    EXPECT_FALSE(Shortcut::from_string("F13").valid());
    EXPECT_FALSE(Shortcut::from_string("F1x").valid());

    // An unknown modifier invalidates the whole shortcut
    Shortcut sc = Shortcut::from_string("Hyper+K");
    EXPECT_FALSE(sc.valid());
    EXPECT_EQ(sc.mods, KeyMod::None);
}

TEST(Shortcut, ParsesItsOwnOutput)
{
    Shortcut original{keys::KEY_DOWN, KeyMod::Control | KeyMod::Alt};
    EXPECT_EQ(Shortcut::from_string(original.to_string()), original);
}

// ─── Bindings ────────────────────────────────────────────────────────────────

TEST(ShortcutManager, BindAndLookUp)
{
    ShortcutManager mgr;
    EXPECT_TRUE(mgr.bindings().empty());

    mgr.bind({keys::KEY_V, KeyMod::None}, "view.toggle_values");
    EXPECT_EQ(mgr.command_for_shortcut({keys::KEY_V, KeyMod::None}), "view.toggle_values");
    EXPECT_EQ(mgr.command_for_shortcut({keys::KEY_V, KeyMod::Shift}), "");
    EXPECT_EQ(mgr.shortcut_for_command("view.toggle_values"),
              (Shortcut{keys::KEY_V, KeyMod::None}));
    EXPECT_FALSE(mgr.shortcut_for_command("view.toggle_labels").valid());
}

TEST(ShortcutManager, InvalidShortcutIsNotBound)
{
    ShortcutManager mgr;
    mgr.bind({0, KeyMod::Control}, "view.toggle_labels");
    EXPECT_TRUE(mgr.bindings().empty());
}

TEST(ShortcutManager, RebindingAShortcutReplacesItsCommand)
{
    ShortcutManager mgr;
    Shortcut        sc{keys::KEY_R, KeyMod::None};
    mgr.bind(sc, "anim.reset_theta");
    mgr.bind(sc, "anim.reset_rate");
    EXPECT_EQ(mgr.bindings().size(), 1u);
    EXPECT_EQ(mgr.command_for_shortcut(sc), "anim.reset_rate");
}

TEST(ShortcutManager, UnbindCommandDropsEveryShortcut)
{
    ShortcutManager mgr;
    mgr.bind({keys::KEY_EQUAL, KeyMod::None}, "view.radius_up");
    mgr.bind({keys::KEY_EQUAL, KeyMod::Shift}, "view.radius_up");
    mgr.bind({keys::KEY_MINUS, KeyMod::None}, "view.radius_down");

    mgr.unbind_command("view.radius_up");
    EXPECT_EQ(mgr.bindings().size(), 1u);
    EXPECT_EQ(mgr.command_for_shortcut({keys::KEY_MINUS, KeyMod::None}), "view.radius_down");
}

// ─── Key dispatch ────────────────────────────────────────────────────────────

class ShortcutDispatchTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        mgr_.set_command_registry(&reg_);
        reg_.register_command("plain", "Plain", [this]() { ++plain_; });
        reg_.register_command("ctrl", "Ctrl", [this]() { ++ctrl_; });
        mgr_.bind({keys::KEY_R, KeyMod::None}, "plain");
        mgr_.bind({keys::KEY_R, KeyMod::Control}, "ctrl");
    }

    CommandRegistry reg_;
    ShortcutManager mgr_;
    int             plain_ = 0;
    int             ctrl_  = 0;
};

TEST_F(ShortcutDispatchTest, PressRunsCommand)
{
    EXPECT_TRUE(mgr_.on_key(keys::KEY_R, keys::PRESS, 0));
    EXPECT_EQ(plain_, 1);
    EXPECT_EQ(ctrl_, 0);
}

TEST_F(ShortcutDispatchTest, ReleaseAndRepeatAreIgnored)
{
    EXPECT_FALSE(mgr_.on_key(keys::KEY_R, 0, 0));
    EXPECT_FALSE(mgr_.on_key(keys::KEY_R, 2, 0));
    EXPECT_EQ(plain_, 0);
}

TEST_F(ShortcutDispatchTest, ModifiersSelectTheBinding)
{
    EXPECT_TRUE(mgr_.on_key(keys::KEY_R, keys::PRESS, 0x02));
    EXPECT_EQ(ctrl_, 1);
    EXPECT_EQ(plain_, 0);

    // Caps Lock / Num Lock bits
    EXPECT_TRUE(mgr_.on_key(keys::KEY_R, keys::PRESS, 0x10 | 0x20));
    EXPECT_EQ(plain_, 1);
}

TEST_F(ShortcutDispatchTest, UnboundOrUnknownCommandReturnsFalse)
{
    EXPECT_FALSE(mgr_.on_key(keys::KEY_A, keys::PRESS, 0));

    mgr_.bind({keys::KEY_A, KeyMod::None}, "missing.command");
    EXPECT_FALSE(mgr_.on_key(keys::KEY_A, keys::PRESS, 0));
}

TEST(ShortcutManager, NoRegistryMeansNoDispatch)
{
    ShortcutManager mgr;
    mgr.bind({keys::KEY_L, KeyMod::None}, "view.toggle_labels");
    EXPECT_FALSE(mgr.on_key(keys::KEY_L, keys::PRESS, 0));
}

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(ShortcutManager, DefaultBindings)
{
    ShortcutManager mgr;
    mgr.register_defaults();

    EXPECT_EQ(mgr.bindings().size(), 12u);
    auto bound = [&mgr](int key) { return mgr.command_for_shortcut({key, KeyMod::None}); };
    EXPECT_EQ(bound(keys::KEY_SPACE), "anim.toggle_running");
    EXPECT_EQ(bound(keys::KEY_UP), "anim.rate_up");
    EXPECT_EQ(bound(keys::KEY_DOWN), "anim.rate_down");
    EXPECT_EQ(bound(keys::KEY_S), "anim.reset_rate");
    EXPECT_EQ(bound(keys::KEY_R), "anim.reset_theta");
    EXPECT_EQ(bound(keys::KEY_L), "view.toggle_labels");
    EXPECT_EQ(bound(keys::KEY_V), "view.toggle_values");
    EXPECT_EQ(bound(keys::KEY_T), "view.toggle_theta");
    EXPECT_EQ(bound(keys::KEY_EQUAL), "view.radius_up");
    EXPECT_EQ(bound(keys::KEY_MINUS), "view.radius_down");
    EXPECT_EQ(bound(keys::KEY_0), "view.reset_radius");
    EXPECT_EQ(bound(keys::KEY_ESCAPE), "app.quit");
}
