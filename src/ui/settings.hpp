#pragma once

#include <string>
#include <trigon/scene.hpp>
#include <vector>

namespace trigon
{

class CommandRegistry;
class ShortcutManager;

// User settings persisted as JSON (~/.config/trigon/settings.json).
// Unknown keys are ignored; bad values fall back to their defaults one field
// at a time.
struct Settings
{
    static constexpr int kVersion = 1;

    // A single keybinding override. An empty shortcut unbinds the command.
    struct KeyBinding
    {
        std::string command_id;
        std::string shortcut_str;
    };

    float rate             = 0.25f;
    float rate_increment   = 0.08f;
    float radius           = 200.0f;
    float radius_increment = 20.0f;
    float min_radius       = 40.0f;

    float fade_in_seconds   = 0.3f;
    float fade_out_seconds  = 0.3f;
    float fade_intensity    = 0.8f;
    float label_half_width  = 20.0f;
    float label_half_height = 15.0f;

    int   window_width  = 800;
    int   window_height = 800;
    float target_fps    = 0.0f;   // 0 = follow the display refresh

    std::string font_path;          // empty = ImGui default font
    std::string italic_font_path;   // empty = same as font_path
    std::string log_level = "info";

    std::vector<KeyBinding> keybindings;

    SceneConfig to_scene_config() const;
    FadeConfig  to_fade_config() const;

    std::string serialize() const;

    // False for an empty document or a newer version; fields are untouched then.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;

    // False if the file cannot be read or fails deserialize().
    bool load(const std::string& path);

    // Layer keybinding overrides on top of the manager's current bindings.
    // When a registry is given its shortcut text is kept in sync.
    void apply_keybindings(ShortcutManager& manager, CommandRegistry* registry = nullptr) const;

    static std::string default_path();
};

}   // namespace trigon
