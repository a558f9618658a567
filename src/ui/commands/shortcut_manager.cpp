#include "shortcut_manager.hpp"

#include <cctype>
#include <cstdlib>
#include <string_view>
#include <trigon/logger.hpp>

#include "command_registry.hpp"

namespace trigon
{

namespace
{

struct NamedKey
{
    int         key;
    const char* name;
};

// First entry per key is the spelling to_string() produces; later ones are aliases.
constexpr NamedKey kNamedKeys[] = {
    {keys::KEY_SPACE, "Space"},
    {keys::KEY_ESCAPE, "Escape"},
    {keys::KEY_ENTER, "Enter"},
    {keys::KEY_TAB, "Tab"},
    {keys::KEY_BACKSPACE, "Backspace"},
    {keys::KEY_DELETE, "Delete"},
    {keys::KEY_RIGHT, "Right"},
    {keys::KEY_LEFT, "Left"},
    {keys::KEY_DOWN, "Down"},
    {keys::KEY_UP, "Up"},
    {keys::KEY_MINUS, "-"},
    {keys::KEY_EQUAL, "="},
    {keys::KEY_ESCAPE, "Esc"},
    {keys::KEY_ENTER, "Return"},
    {keys::KEY_DELETE, "Del"},
};

struct NamedMod
{
    KeyMod      mod;
    const char* name;
};

constexpr NamedMod kNamedMods[] = {
    {KeyMod::Control, "Ctrl"},
    {KeyMod::Shift, "Shift"},
    {KeyMod::Alt, "Alt"},
    {KeyMod::Super, "Super"},
    {KeyMod::Control, "Control"},
    {KeyMod::Super, "Cmd"},
    {KeyMod::Super, "Meta"},
};

struct DefaultBinding
{
    int         key;
    const char* command_id;
};

constexpr DefaultBinding kDefaults[] = {
    {keys::KEY_SPACE, "anim.toggle_running"},
    {keys::KEY_UP, "anim.rate_up"},
    {keys::KEY_DOWN, "anim.rate_down"},
    {keys::KEY_S, "anim.reset_rate"},
    {keys::KEY_R, "anim.reset_theta"},
    {keys::KEY_L, "view.toggle_labels"},
    {keys::KEY_V, "view.toggle_values"},
    {keys::KEY_T, "view.toggle_theta"},
    {keys::KEY_EQUAL, "view.radius_up"},
    {keys::KEY_MINUS, "view.radius_down"},
    {keys::KEY_0, "view.reset_radius"},
    {keys::KEY_ESCAPE, "app.quit"},
};

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

std::string key_name(int key)
{
    if ((key >= keys::KEY_A && key <= keys::KEY_Z) || (key >= keys::KEY_0 && key <= keys::KEY_9))
        return std::string(1, static_cast<char>(key));
    if (key >= keys::KEY_F1 && key <= keys::KEY_F12)
        return "F" + std::to_string(key - keys::KEY_F1 + 1);
    for (const auto& nk : kNamedKeys)
    {
        if (nk.key == key)
            return nk.name;
    }
    return "Key" + std::to_string(key);
}

int parse_key(std::string_view name)
{
    if (name.size() == 1)
    {
        int c = std::toupper(static_cast<unsigned char>(name[0]));
        if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
            return c;
    }
    for (const auto& nk : kNamedKeys)
    {
        if (iequals(name, nk.name))
            return nk.key;
    }
    if (name.size() >= 2 && (name[0] == 'F' || name[0] == 'f'))
    {
        std::string digits(name.substr(1));
        char*       end = nullptr;
        long        n   = std::strtol(digits.c_str(), &end, 10);
        if (*end == '\0' && n >= 1 && n <= 12)
            return keys::KEY_F1 + static_cast<int>(n) - 1;
    }
    return 0;
}

}   // namespace

// ─── Shortcut ────────────────────────────────────────────────────────────────

std::string Shortcut::to_string() const
{
    std::string out;
    // The first four entries are the canonical names, in display order
    for (size_t i = 0; i < 4; ++i)
    {
        if (has_mod(mods, kNamedMods[i].mod))
        {
            out += kNamedMods[i].name;
            out += '+';
        }
    }
    return out + key_name(key);
}

Shortcut Shortcut::from_string(const std::string& str)
{
    Shortcut         sc;
    std::string_view rest = str;
    for (;;)
    {
        size_t           plus = rest.find('+');
        std::string_view part = trim(rest.substr(0, plus));

        if (plus == std::string_view::npos)
        {
            // Last part is the key; empty after a trailing '+'
            sc.key = parse_key(part);
            break;
        }

        bool known = false;
        for (const auto& nm : kNamedMods)
        {
            if (iequals(part, nm.name))
            {
                sc.mods = sc.mods | nm.mod;
                known   = true;
                break;
            }
        }
        if (!known)
            return {};
        rest.remove_prefix(plus + 1);
    }

    if (!sc.valid())
        return {};
    return sc;
}

// ─── ShortcutManager ─────────────────────────────────────────────────────────

void ShortcutManager::bind(Shortcut shortcut, const std::string& command_id)
{
    if (!shortcut.valid())
        return;
    bindings_[shortcut] = command_id;
}

void ShortcutManager::unbind_command(const std::string& command_id)
{
    std::erase_if(bindings_, [&](const auto& entry) { return entry.second == command_id; });
}

std::string ShortcutManager::command_for_shortcut(const Shortcut& shortcut) const
{
    auto it = bindings_.find(shortcut);
    return it != bindings_.end() ? it->second : std::string();
}

Shortcut ShortcutManager::shortcut_for_command(const std::string& command_id) const
{
    for (const auto& [sc, id] : bindings_)
    {
        if (id == command_id)
            return sc;
    }
    return {};
}

bool ShortcutManager::on_key(int key, int action, int mods)
{
    if (action != keys::PRESS || !registry_)
        return false;

    Shortcut sc{key, static_cast<KeyMod>(mods & 0x0F)};
    auto     it = bindings_.find(sc);
    if (it == bindings_.end())
        return false;

    // Copy: the command may rebind keys
    std::string command_id = it->second;
    TRIGON_LOG_TRACE("commands", "{} -> {}", sc.to_string(), command_id);
    return registry_->execute(command_id);
}

void ShortcutManager::register_defaults()
{
    for (const auto& d : kDefaults)
        bind({d.key, KeyMod::None}, d.command_id);
    TRIGON_LOG_DEBUG("commands", "Registered {} default shortcuts", bindings_.size());
}

}   // namespace trigon
