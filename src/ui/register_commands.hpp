#pragma once

#include <functional>

namespace trigon
{

class CommandRegistry;
class SceneModel;

// Registers every scene command (animation, view, per-function visibility)
// plus "app.quit". The scene must outlive the registry's use of the commands.
void register_commands(CommandRegistry&      registry,
                       SceneModel&           scene,
                       std::function<void()> quit);

}   // namespace trigon
