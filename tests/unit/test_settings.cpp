#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>

#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"
#include "ui/settings.hpp"

using namespace trigon;

namespace fs = std::filesystem;

class SettingsFileTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
               / ("trigon_settings_test_"
                  + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(Settings, DefaultsMatchSceneDefaults)
{
    Settings    s;
    SceneConfig cfg = s.to_scene_config();
    SceneConfig def;
    EXPECT_FLOAT_EQ(cfg.default_rate, def.default_rate);
    EXPECT_FLOAT_EQ(cfg.rate_increment, def.rate_increment);
    EXPECT_FLOAT_EQ(cfg.default_radius, def.default_radius);
    EXPECT_FLOAT_EQ(cfg.min_radius, def.min_radius);
    EXPECT_FLOAT_EQ(cfg.fade.fade_intensity, def.fade.fade_intensity);
    EXPECT_FLOAT_EQ(cfg.fade.label_half_extent.x, 20.0f);
    EXPECT_FLOAT_EQ(cfg.fade.label_half_extent.y, 15.0f);
}

TEST(Settings, SerializeContainsFields)
{
    Settings s;
    s.font_path = "/usr/share/fonts/cmu.ttf";
    s.keybindings.push_back({"anim.toggle_running", "P"});

    std::string json = s.serialize();
    EXPECT_NE(json.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"rate\": 0.25"), std::string::npos);
    EXPECT_NE(json.find("\"font_path\": \"/usr/share/fonts/cmu.ttf\""), std::string::npos);
    EXPECT_NE(json.find("\"command\": \"anim.toggle_running\""), std::string::npos);
}

TEST(Settings, RoundTrip)
{
    Settings s;
    s.rate              = 0.5f;
    s.radius            = 250.0f;
    s.fade_intensity    = 0.6f;
    s.window_width      = 1024;
    s.target_fps        = 30.0f;
    s.font_path         = "C:\\fonts\\serif \"book\".ttf";
    s.italic_font_path  = "/fonts/italic.ttf";
    s.log_level         = "debug";
    s.keybindings       = {{"view.toggle_labels", "Ctrl+L"}, {"app.quit", ""}};

    Settings t;
    ASSERT_TRUE(t.deserialize(s.serialize()));
    EXPECT_FLOAT_EQ(t.rate, 0.5f);
    EXPECT_FLOAT_EQ(t.radius, 250.0f);
    EXPECT_FLOAT_EQ(t.fade_intensity, 0.6f);
    EXPECT_EQ(t.window_width, 1024);
    EXPECT_FLOAT_EQ(t.target_fps, 30.0f);
    EXPECT_EQ(t.font_path, s.font_path);
    EXPECT_EQ(t.italic_font_path, "/fonts/italic.ttf");
    EXPECT_EQ(t.log_level, "debug");
    ASSERT_EQ(t.keybindings.size(), 2u);
    EXPECT_EQ(t.keybindings[0].command_id, "view.toggle_labels");
    EXPECT_EQ(t.keybindings[0].shortcut_str, "Ctrl+L");
    EXPECT_EQ(t.keybindings[1].command_id, "app.quit");
    EXPECT_TRUE(t.keybindings[1].shortcut_str.empty());
}

TEST(Settings, PartialDocumentKeepsOtherDefaults)
{
    Settings s;
    ASSERT_TRUE(s.deserialize(R"({ "radius": 300 })"));
    EXPECT_FLOAT_EQ(s.radius, 300.0f);
    EXPECT_FLOAT_EQ(s.rate, 0.25f);
    EXPECT_FLOAT_EQ(s.min_radius, 40.0f);
}

TEST(Settings, InvalidValuesAreIgnored)
{
    Settings s;
    ASSERT_TRUE(s.deserialize(R"({
        "rate": -1,
        "rate_increment": 0,
        "fade_intensity": 2.5,
        "window_width": 10,
        "target_fps": -30,
        "log_level": "loud",
        "radius": 180
    })"));
    EXPECT_FLOAT_EQ(s.rate, 0.25f);
    EXPECT_FLOAT_EQ(s.rate_increment, 0.08f);
    EXPECT_FLOAT_EQ(s.fade_intensity, 0.8f);
    EXPECT_EQ(s.window_width, 800);
    EXPECT_FLOAT_EQ(s.target_fps, 0.0f);
    EXPECT_EQ(s.log_level, "info");
    EXPECT_FLOAT_EQ(s.radius, 180.0f);
}

TEST(Settings, RadiusRaisedToMinimum)
{
    Settings s;
    ASSERT_TRUE(s.deserialize(R"({ "radius": 50, "min_radius": 80 })"));
    EXPECT_FLOAT_EQ(s.radius, 80.0f);
    EXPECT_NO_THROW(SceneModel{s.to_scene_config()});
}

TEST(Settings, ValuesBeyondFloatRangeAreIgnored)
{
    Settings s;
    ASSERT_TRUE(s.deserialize(R"({ "version": 1, "rate": 1e39, "radius": 1e300, "label_half_width": 5e38 })"));
    EXPECT_FLOAT_EQ(s.rate, 0.25f);
    EXPECT_FLOAT_EQ(s.radius, 200.0f);
    EXPECT_FLOAT_EQ(s.label_half_width, 20.0f);

    SceneModel scene(s.to_scene_config());
    scene.update(1.0f / 60.0f);
    EXPECT_TRUE(std::isfinite(scene.theta()));
    EXPECT_GE(scene.theta(), 0.0f);
    EXPECT_LT(scene.theta(), 2.0f * std::numbers::pi_v<float>);
}

TEST(Settings, ValuesThatRoundToZeroAreIgnored)
{
    Settings s;
    ASSERT_TRUE(s.deserialize(R"({ "fade_in_seconds": 1e-50, "rate_increment": 1e-60 })"));
    EXPECT_FLOAT_EQ(s.fade_in_seconds, 0.3f);
    EXPECT_FLOAT_EQ(s.rate_increment, 0.08f);
    EXPECT_NO_THROW(SceneModel{s.to_scene_config()});
}

TEST(SceneConfig, NonFiniteValuesRejected)
{
    SceneConfig cfg;
    cfg.default_rate = std::numeric_limits<float>::infinity();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = SceneConfig{};
    cfg.default_radius = std::numeric_limits<float>::infinity();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = SceneConfig{};
    cfg.fade.fade_out_seconds = std::numeric_limits<float>::infinity();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = SceneConfig{};
    cfg.fade.label_half_extent.y = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(Settings, NewerVersionRejected)
{
    Settings s;
    EXPECT_FALSE(s.deserialize(R"({ "version": 2, "radius": 300 })"));
    EXPECT_FLOAT_EQ(s.radius, 200.0f);
}

TEST(Settings, EmptyDocumentRejected)
{
    Settings s;
    EXPECT_FALSE(s.deserialize(""));
}

TEST(Settings, KeybindingWithoutCommandIgnored)
{
    Settings s;
    ASSERT_TRUE(s.deserialize(R"({ "keybindings": [ { "shortcut": "K" }, { "command": "app.quit", "shortcut": "Q" } ] })"));
    ASSERT_EQ(s.keybindings.size(), 1u);
    EXPECT_EQ(s.keybindings[0].command_id, "app.quit");
}

// ─── Keybindings ─────────────────────────────────────────────────────────────

TEST(Settings, ApplyKeybindingsRebinds)
{
    ShortcutManager mgr;
    mgr.register_defaults();
    CommandRegistry reg;
    reg.register_command("anim.toggle_running", "Pause / Resume", []() {}, "Space", "Animation");

    Settings s;
    s.keybindings = {{"anim.toggle_running", "P"}};
    s.apply_keybindings(mgr, &reg);

    EXPECT_EQ(mgr.command_for_shortcut({keys::KEY_SPACE, KeyMod::None}), "");
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("P")), "anim.toggle_running");
    EXPECT_EQ(reg.find("anim.toggle_running")->shortcut, "P");
    EXPECT_EQ(mgr.bindings().size(), 12u);
}

TEST(Settings, ApplyKeybindingsEmptyShortcutUnbinds)
{
    ShortcutManager mgr;
    mgr.register_defaults();

    Settings s;
    s.keybindings = {{"app.quit", ""}};
    s.apply_keybindings(mgr);

    EXPECT_FALSE(mgr.shortcut_for_command("app.quit").valid());
    EXPECT_EQ(mgr.bindings().size(), 11u);
}

TEST(Settings, ApplyKeybindingsBadShortcutKeepsDefault)
{
    ShortcutManager mgr;
    mgr.register_defaults();

    Settings s;
    s.keybindings = {{"view.toggle_labels", "Ctrl+Nonsense"}};
    s.apply_keybindings(mgr);

    EXPECT_EQ(mgr.command_for_shortcut({keys::KEY_L, KeyMod::None}), "view.toggle_labels");
}

// ─── File I/O ────────────────────────────────────────────────────────────────

TEST_F(SettingsFileTest, SaveCreatesDirectoryAndLoads)
{
    std::string path = (dir_ / "nested" / "settings.json").string();

    Settings s;
    s.rate   = 0.9f;
    s.radius = 120.0f;
    ASSERT_TRUE(s.save(path));
    EXPECT_TRUE(fs::exists(path));

    Settings t;
    ASSERT_TRUE(t.load(path));
    EXPECT_FLOAT_EQ(t.rate, 0.9f);
    EXPECT_FLOAT_EQ(t.radius, 120.0f);
}

TEST_F(SettingsFileTest, LoadMissingFileReturnsFalse)
{
    Settings s;
    EXPECT_FALSE(s.load((dir_ / "missing.json").string()));
    EXPECT_FLOAT_EQ(s.radius, 200.0f);
}

TEST_F(SettingsFileTest, LoadEmptyFileReturnsFalse)
{
    fs::create_directories(dir_);
    std::string path = (dir_ / "empty.json").string();
    {
        std::ofstream f(path);
    }
    Settings s;
    EXPECT_FALSE(s.load(path));
}

TEST(Settings, DefaultPathEndsWithSettingsJson)
{
    std::string path = Settings::default_path();
    EXPECT_NE(path.find("settings.json"), std::string::npos);
}
