#include <gtest/gtest.h>
#include <string>
#include <trigon/scene.hpp>

#include "ui/commands/command_registry.hpp"

using namespace trigon;

class CommandRegistryTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        registry_.register_command("anim.toggle_running",
                                   "Pause / Resume",
                                   [this]() { scene_.toggle_running(); },
                                   "Space",
                                   "Animation");
        registry_.register_command("view.radius_up",
                                   "Grow Radius",
                                   [this]() { scene_.increment_radius(); },
                                   "=",
                                   "View");
    }

    SceneModel      scene_;
    CommandRegistry registry_;
};

TEST_F(CommandRegistryTest, FindReturnsAllFields)
{
    const Command* cmd = registry_.find("anim.toggle_running");
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->label, "Pause / Resume");
    EXPECT_EQ(cmd->category, "Animation");
    EXPECT_EQ(cmd->shortcut, "Space");
    EXPECT_TRUE(cmd->enabled);
    EXPECT_EQ(registry_.count(), 2u);
}

TEST_F(CommandRegistryTest, UnknownIdIsNull)
{
    EXPECT_EQ(registry_.find("anim.rewind"), nullptr);
    EXPECT_FALSE(registry_.execute("anim.rewind"));
}

TEST_F(CommandRegistryTest, ExecuteRunsCallbackEachTime)
{
    EXPECT_TRUE(registry_.execute("view.radius_up"));
    EXPECT_TRUE(registry_.execute("view.radius_up"));
    EXPECT_FLOAT_EQ(scene_.radius(), 240.0f);
}

TEST_F(CommandRegistryTest, DisabledCommandDoesNotRun)
{
    registry_.set_enabled("anim.toggle_running", false);
    EXPECT_FALSE(registry_.execute("anim.toggle_running"));
    EXPECT_TRUE(scene_.running());

    registry_.set_enabled("anim.toggle_running", true);
    EXPECT_TRUE(registry_.execute("anim.toggle_running"));
    EXPECT_FALSE(scene_.running());
}

TEST_F(CommandRegistryTest, MissingCallbackDoesNotRun)
{
    registry_.register_command("view.nothing", "Nothing", nullptr);
    EXPECT_FALSE(registry_.execute("view.nothing"));
    EXPECT_EQ(registry_.find("view.nothing")->category, "General");
}

TEST_F(CommandRegistryTest, ReregisterReplacesCommand)
{
    registry_.register_command("view.radius_up",
                               "Grow Radius Twice",
                               [this]()
                               {
                                   scene_.increment_radius();
                                   scene_.increment_radius();
                               });
    EXPECT_EQ(registry_.count(), 2u);
    registry_.execute("view.radius_up");
    EXPECT_FLOAT_EQ(scene_.radius(), 240.0f);
    EXPECT_EQ(registry_.find("view.radius_up")->label, "Grow Radius Twice");
}

TEST_F(CommandRegistryTest, CallbackMayExecuteAnotherCommand)
{
    registry_.register_command("view.radius_up_twice",
                               "Grow Twice",
                               [this]()
                               {
                                   registry_.execute("view.radius_up");
                                   registry_.execute("view.radius_up");
                               });
    EXPECT_TRUE(registry_.execute("view.radius_up_twice"));
    EXPECT_FLOAT_EQ(scene_.radius(), 240.0f);
}

TEST_F(CommandRegistryTest, SetShortcutText)
{
    registry_.set_shortcut_text("anim.toggle_running", "Ctrl+P");
    EXPECT_EQ(registry_.find("anim.toggle_running")->shortcut, "Ctrl+P");

    registry_.set_shortcut_text("anim.rewind", "Q");
    EXPECT_EQ(registry_.count(), 2u);
}

TEST(CommandRegistry, RegisterFullStruct)
{
    CommandRegistry reg;
    Command         cmd;
    cmd.id       = "function.toggle_sin";
    cmd.label    = "Show / Hide sin";
    cmd.category = "Functions";
    cmd.callback = []() {};
    reg.register_command(std::move(cmd));

    const Command* found = reg.find("function.toggle_sin");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->label, "Show / Hide sin");
    EXPECT_TRUE(found->shortcut.empty());
}
