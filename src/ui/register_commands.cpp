#include "register_commands.hpp"

#include <string>
#include <trigon/logger.hpp>
#include <trigon/scene.hpp>

#include "commands/command_registry.hpp"

namespace trigon
{

void register_commands(CommandRegistry& registry, SceneModel& scene, std::function<void()> quit)
{
    // ─── Animation ───────────────────────────────────────────────────────
    registry.register_command(
        "anim.toggle_running",
        "Pause / Resume",
        [&scene]()
        {
            scene.toggle_running();
            TRIGON_LOG_DEBUG("commands", "running={}", scene.running());
        },
        "Space",
        "Animation");

    registry.register_command(
        "anim.rate_up",
        "Increase Rate",
        [&scene]()
        {
            scene.increment_rate();
            TRIGON_LOG_DEBUG("commands", "rate={}", scene.rate());
        },
        "Up",
        "Animation");

    registry.register_command(
        "anim.rate_down",
        "Decrease Rate",
        [&scene]()
        {
            scene.decrement_rate();
            TRIGON_LOG_DEBUG("commands", "rate={}", scene.rate());
        },
        "Down",
        "Animation");

    registry.register_command(
        "anim.reset_rate", "Reset Rate", [&scene]() { scene.reset_rate(); }, "S", "Animation");

    registry.register_command(
        "anim.reset_theta", "Reset Angle", [&scene]() { scene.reset_theta(); }, "R", "Animation");

    // ─── View ────────────────────────────────────────────────────────────
    registry.register_command(
        "view.toggle_labels", "Toggle Labels", [&scene]() { scene.toggle_labels(); }, "L", "View");

    registry.register_command(
        "view.toggle_values", "Toggle Values", [&scene]() { scene.toggle_values(); }, "V", "View");

    registry.register_command(
        "view.toggle_theta", "Toggle Angle Arc", [&scene]() { scene.toggle_theta(); }, "T", "View");

    registry.register_command(
        "view.radius_up",
        "Grow Circle",
        [&scene]()
        {
            scene.increment_radius();
            TRIGON_LOG_DEBUG("commands", "radius={}", scene.radius());
        },
        "=",
        "View");

    registry.register_command(
        "view.radius_down",
        "Shrink Circle",
        [&scene]()
        {
            scene.decrement_radius();
            TRIGON_LOG_DEBUG("commands", "radius={}", scene.radius());
        },
        "-",
        "View");

    registry.register_command(
        "view.reset_radius", "Reset Circle Size", [&scene]() { scene.reset_radius(); }, "0", "View");

    // ─── Functions ───────────────────────────────────────────────────────
    // Unbound by default; the readout rows toggle them with the mouse.
    for (TrigFunction fn : kAllTrigFunctions)
    {
        std::string id(label_id(label_for(fn)));
        registry.register_command("function.toggle_" + id,
                                  "Toggle " + id,
                                  [&scene, fn]() { scene.toggle_function(fn); },
                                  "",
                                  "Functions");
    }

    // ─── App ─────────────────────────────────────────────────────────────
    registry.register_command("app.quit", "Quit", std::move(quit), "Escape", "App");

    TRIGON_LOG_DEBUG("commands", "Registered {} commands", registry.count());
}

}   // namespace trigon
