#include "settings.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <trigon/logger.hpp>

#include "commands/command_registry.hpp"
#include "commands/shortcut_manager.hpp"

namespace trigon
{

SceneConfig Settings::to_scene_config() const
{
    SceneConfig cfg;
    cfg.default_rate     = rate;
    cfg.rate_increment   = rate_increment;
    cfg.default_radius   = radius;
    cfg.radius_increment = radius_increment;
    cfg.min_radius       = min_radius;
    cfg.fade             = to_fade_config();
    return cfg;
}

FadeConfig Settings::to_fade_config() const
{
    FadeConfig cfg;
    cfg.fade_in_seconds   = fade_in_seconds;
    cfg.fade_out_seconds  = fade_out_seconds;
    cfg.fade_intensity    = fade_intensity;
    cfg.label_half_extent = {label_half_width, label_half_height};
    return cfg;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string Settings::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << kVersion << ",\n";
    os << "  \"rate\": " << rate << ",\n";
    os << "  \"rate_increment\": " << rate_increment << ",\n";
    os << "  \"radius\": " << radius << ",\n";
    os << "  \"radius_increment\": " << radius_increment << ",\n";
    os << "  \"min_radius\": " << min_radius << ",\n";
    os << "  \"fade_in_seconds\": " << fade_in_seconds << ",\n";
    os << "  \"fade_out_seconds\": " << fade_out_seconds << ",\n";
    os << "  \"fade_intensity\": " << fade_intensity << ",\n";
    os << "  \"label_half_width\": " << label_half_width << ",\n";
    os << "  \"label_half_height\": " << label_half_height << ",\n";
    os << "  \"window_width\": " << window_width << ",\n";
    os << "  \"window_height\": " << window_height << ",\n";
    os << "  \"target_fps\": " << target_fps << ",\n";
    os << "  \"font_path\": \"" << escape_json(font_path) << "\",\n";
    os << "  \"italic_font_path\": \"" << escape_json(italic_font_path) << "\",\n";
    os << "  \"log_level\": \"" << escape_json(log_level) << "\",\n";
    os << "  \"keybindings\": [\n";
    for (size_t i = 0; i < keybindings.size(); ++i)
    {
        const auto& kb = keybindings[i];
        os << "    {\n";
        os << "      \"command\": \"" << escape_json(kb.command_id) << "\",\n";
        os << "      \"shortcut\": \"" << escape_json(kb.shortcut_str) << "\"\n";
        os << "    }";
        if (i + 1 < keybindings.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for our flat format. Keys are matched with their quotes,
// so "radius" never hits "min_radius".
static size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return json.find_first_not_of(" \t\n\r", pos + 1);
}

static bool read_json_string(const std::string& json, const std::string& key, std::string& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return false;

    std::string value;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
        {
            out = std::move(value);
            return true;
        }
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            switch (e)
            {
                case 'n':
                    value += '\n';
                    break;
                case 't':
                    value += '\t';
                    break;
                default:
                    value += e;
                    break;
            }
            continue;
        }
        value += c;
    }
    return false;   // unterminated
}

// Returns false when the key is absent. `ok` reports whether a present value parsed.
static bool read_json_number(const std::string& json, const std::string& key, double& out, bool& ok)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return false;

    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    ok                = end != begin && std::isfinite(v);
    if (ok)
        out = v;
    return true;
}

static std::vector<std::string> parse_array_objects(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;
    auto                     pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return objects;

    int    depth     = 0;
    size_t obj_start = 0;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        if (json[i] == '{')
        {
            if (depth == 0)
                obj_start = i;
            ++depth;
        }
        else if (json[i] == '}')
        {
            --depth;
            if (depth == 0)
            {
                objects.push_back(json.substr(obj_start, i - obj_start + 1));
            }
        }
        else if (json[i] == ']' && depth == 0)
        {
            break;
        }
    }
    return objects;
}

namespace
{

template <typename T, typename Pred>
void read_field(const std::string& json, const char* key, T& field, Pred valid)
{
    double v  = 0.0;
    bool   ok = false;
    if (!read_json_number(json, key, v, ok))
        return;
    // The range check comes first: casting a double outside T's range is undefined.
    // The predicate then runs again on the narrowed value, which may have
    // rounded to zero.
    if (!ok || std::abs(v) > static_cast<double>(std::numeric_limits<T>::max()) || !valid(v)
        || !valid(static_cast<double>(static_cast<T>(v))))
    {
        TRIGON_LOG_WARN("settings", "Ignoring invalid value for '{}'", key);
        return;
    }
    field = static_cast<T>(v);
}

bool positive(double v)
{
    return v > 0.0;
}

bool non_negative(double v)
{
    return v >= 0.0;
}

}   // namespace

bool Settings::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    double ver    = 0.0;
    bool   ver_ok = false;
    if (read_json_number(json, "version", ver, ver_ok) && ver_ok && ver > kVersion)
    {
        TRIGON_LOG_WARN("settings", "Settings version {} is newer than {}", ver, kVersion);
        return false;
    }

    read_field(json, "rate", rate, non_negative);
    read_field(json, "rate_increment", rate_increment, positive);
    read_field(json, "radius", radius, positive);
    read_field(json, "radius_increment", radius_increment, positive);
    read_field(json, "min_radius", min_radius, positive);
    read_field(json, "fade_in_seconds", fade_in_seconds, positive);
    read_field(json, "fade_out_seconds", fade_out_seconds, positive);
    read_field(json, "fade_intensity", fade_intensity, [](double v) { return v >= 0.0 && v <= 1.0; });
    read_field(json, "label_half_width", label_half_width, non_negative);
    read_field(json, "label_half_height", label_half_height, non_negative);
    read_field(json, "window_width", window_width, [](double v) { return v >= 64.0 && v <= 16384.0; });
    read_field(json, "window_height", window_height, [](double v) { return v >= 64.0 && v <= 16384.0; });
    read_field(json, "target_fps", target_fps, non_negative);

    if (radius < min_radius)
    {
        TRIGON_LOG_WARN("settings", "radius {} is below min_radius {}, raising it", radius, min_radius);
        radius = min_radius;
    }

    read_json_string(json, "font_path", font_path);
    read_json_string(json, "italic_font_path", italic_font_path);

    std::string level;
    if (read_json_string(json, "log_level", level))
    {
        if (Logger::level_from_string(level))
            log_level = level;
        else
            TRIGON_LOG_WARN("settings", "Unknown log_level '{}'", level);
    }

    auto objects = parse_array_objects(json, "keybindings");
    if (!objects.empty())
        keybindings.clear();
    for (const auto& obj : objects)
    {
        KeyBinding kb;
        read_json_string(obj, "command", kb.command_id);
        read_json_string(obj, "shortcut", kb.shortcut_str);
        if (kb.command_id.empty())
        {
            TRIGON_LOG_WARN("settings", "Ignoring keybinding without a command");
            continue;
        }
        keybindings.push_back(std::move(kb));
    }
    return true;
}

// ─── Keybindings ─────────────────────────────────────────────────────────────

void Settings::apply_keybindings(ShortcutManager& manager, CommandRegistry* registry) const
{
    for (const auto& kb : keybindings)
    {
        Shortcut sc;
        if (!kb.shortcut_str.empty())
        {
            sc = Shortcut::from_string(kb.shortcut_str);
            if (!sc.valid())
            {
                TRIGON_LOG_WARN("settings",
                                "Bad shortcut '{}' for '{}'",
                                kb.shortcut_str,
                                kb.command_id);
                continue;
            }
        }

        manager.unbind_command(kb.command_id);
        if (sc.valid())
            manager.bind(sc, kb.command_id);
        if (registry)
            registry->set_shortcut_text(kb.command_id, sc.valid() ? sc.to_string() : "");

        TRIGON_LOG_DEBUG("settings",
                         "{} bound to '{}'",
                         kb.command_id,
                         sc.valid() ? sc.to_string() : std::string("nothing"));
    }
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool Settings::save(const std::string& path) const
{
    auto            dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            TRIGON_LOG_WARN("settings", "Cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        TRIGON_LOG_ERROR("settings", "Cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool Settings::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TRIGON_LOG_INFO("settings", "No settings at {}, using defaults", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        TRIGON_LOG_WARN("settings", "Could not read {}", path);
        return false;
    }
    TRIGON_LOG_INFO("settings", "Loaded {}", path);
    return true;
}

std::string Settings::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "settings.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "trigon";
    return (dir / "settings.json").string();
}

}   // namespace trigon
