#pragma once

#include <functional>
#include <string>
#include <unordered_map>

namespace trigon
{

// A named action on the scene. Keys reach it through ShortcutManager.
struct Command
{
    std::string           id;         // e.g. "anim.toggle_running"
    std::string           label;      // e.g. "Pause / Resume"
    std::string           category;   // "Animation", "View", "Functions" or "App"
    std::string           shortcut;   // Display text of the bound key, e.g. "Space"
    std::function<void()> callback;
    bool                  enabled = true;
};

// Id -> command table used by the window loop. Not thread-safe; all calls come
// from the thread that polls input.
class CommandRegistry
{
   public:
    CommandRegistry() = default;

    CommandRegistry(const CommandRegistry&)            = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // Replaces a command with the same id.
    void register_command(Command cmd);

    void register_command(const std::string&    id,
                          const std::string&    label,
                          std::function<void()> callback,
                          const std::string&    shortcut = "",
                          const std::string&    category = "General");

    // False when the id is unknown, disabled or has no callback.
    bool execute(const std::string& id);

    // Returns nullptr if not found.
    const Command* find(const std::string& id) const;

    size_t count() const { return commands_.size(); }

    void set_enabled(const std::string& id, bool enabled);

    // Replaces the display text after a rebind. Unknown ids are ignored.
    void set_shortcut_text(const std::string& id, const std::string& shortcut);

   private:
    Command* lookup(const std::string& id);

    std::unordered_map<std::string, Command> commands_;
};

}   // namespace trigon
