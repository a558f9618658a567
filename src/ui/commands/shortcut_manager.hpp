#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace trigon
{

class CommandRegistry;

// Modifier bits, laid out as GLFW reports them.
enum class KeyMod : uint8_t
{
    None    = 0,
    Shift   = 0x01,
    Control = 0x02,
    Alt     = 0x04,
    Super   = 0x08,
};

inline KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}

// GLFW key codes for the keys trigon names. Letters and digits are their ASCII codes.
namespace keys
{
constexpr int KEY_SPACE     = 32;
constexpr int KEY_MINUS     = 45;
constexpr int KEY_0         = 48;
constexpr int KEY_9         = 57;
constexpr int KEY_EQUAL     = 61;
constexpr int KEY_A         = 65;
constexpr int KEY_L         = 76;
constexpr int KEY_R         = 82;
constexpr int KEY_S         = 83;
constexpr int KEY_T         = 84;
constexpr int KEY_V         = 86;
constexpr int KEY_Z         = 90;
constexpr int KEY_ESCAPE    = 256;
constexpr int KEY_ENTER     = 257;
constexpr int KEY_TAB       = 258;
constexpr int KEY_BACKSPACE = 259;
constexpr int KEY_DELETE    = 261;
constexpr int KEY_RIGHT     = 262;
constexpr int KEY_LEFT      = 263;
constexpr int KEY_DOWN      = 264;
constexpr int KEY_UP        = 265;
constexpr int KEY_F1        = 290;
constexpr int KEY_F12       = 301;

constexpr int PRESS = 1;   // GLFW_PRESS
}   // namespace keys

struct Shortcut
{
    int    key  = 0;   // GLFW key code; 0 = none
    KeyMod mods = KeyMod::None;

    bool valid() const { return key != 0; }

    bool operator==(const Shortcut& o) const { return key == o.key && mods == o.mods; }

    // "Ctrl+Shift+Z", modifiers in that order
    std::string to_string() const;

    // Case-insensitive, tolerates spaces around '+'. Invalid on an unknown key or modifier.
    static Shortcut from_string(const std::string& str);
};

struct ShortcutHash
{
    size_t operator()(const Shortcut& s) const
    {
        return std::hash<int>()((s.key << 4) | static_cast<int>(s.mods));
    }
};

// Key presses -> command ids, executed through a CommandRegistry.
class ShortcutManager
{
   public:
    using BindingMap = std::unordered_map<Shortcut, std::string, ShortcutHash>;

    ShortcutManager() = default;

    ShortcutManager(const ShortcutManager&)            = delete;
    ShortcutManager& operator=(const ShortcutManager&) = delete;

    void set_command_registry(CommandRegistry* registry) { registry_ = registry; }

    // A shortcut maps to one command; binding it again replaces the command.
    // A command may have several shortcuts.
    void bind(Shortcut shortcut, const std::string& command_id);
    void unbind_command(const std::string& command_id);

    // Empty string if unbound.
    std::string command_for_shortcut(const Shortcut& shortcut) const;

    // Invalid shortcut if unbound.
    Shortcut shortcut_for_command(const std::string& command_id) const;

    const BindingMap& bindings() const { return bindings_; }

    // GLFW key callback arguments. Only presses dispatch; lock-key bits are ignored.
    // True if a command ran.
    bool on_key(int key, int action, int mods);

    // Space, Up, Down, S, R, L, V, T, =, -, 0, Escape
    void register_defaults();

   private:
    CommandRegistry* registry_ = nullptr;
    BindingMap       bindings_;
};

}   // namespace trigon
