#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <trigon/app.hpp>
#include <trigon/export.hpp>
#include <trigon/logger.hpp>
#include <trigon/scene.hpp>

#include "../ui/settings.hpp"

using namespace trigon;

namespace
{

struct Options
{
    std::string                config_path;
    std::optional<std::string> log_level;
    std::string                log_file;
    std::string                export_svg;
    float                      theta = 0.0f;
    bool                       help  = false;
};

void print_usage(const char* argv0)
{
    std::printf(
        "Usage: %s [options]\n"
        "\n"
        "Animated unit-circle diagram of sin, cos, tan, cot, sec and csc.\n"
        "\n"
        "Options:\n"
        "  --config PATH      settings file (default: %s)\n"
        "  --log-level LEVEL  trace, debug, info, warn, error or critical\n"
        "  --log-file PATH    also write the log to PATH\n"
        "  --export-svg PATH  write one frame to an SVG file and exit\n"
        "  --theta RAD        angle of the exported frame (default 0)\n"
        "  --help             show this message\n"
        "\n"
        "Keys: Space pause, Up/Down rate, S reset rate, R reset angle,\n"
        "      L labels, V values, T angle arc, =/-/0 radius, Escape quit.\n"
        "      Click a value row to hide or show that function.\n",
        argv0,
        Settings::default_path().c_str());
}

// Returns false and logs on a malformed command line.
bool parse_args(int argc, char** argv, Options& opts)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) -> bool
        {
            if (i + 1 >= argc)
            {
                TRIGON_LOG_ERROR("app", "Missing value for {}", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else if (arg == "--config")
        {
            if (!next_value(opts.config_path))
                return false;
        }
        else if (arg == "--log-level")
        {
            if (!next_value(value))
                return false;
            opts.log_level = value;
        }
        else if (arg == "--log-file")
        {
            if (!next_value(opts.log_file))
                return false;
        }
        else if (arg == "--export-svg")
        {
            if (!next_value(opts.export_svg))
                return false;
        }
        else if (arg == "--theta")
        {
            if (!next_value(value))
                return false;
            char*  end    = nullptr;
            double parsed = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed))
            {
                TRIGON_LOG_ERROR("app", "Invalid --theta value: {}", value);
                return false;
            }
            opts.theta = static_cast<float>(parsed);
        }
        else
        {
            TRIGON_LOG_ERROR("app", "Unknown option: {}", arg);
            return false;
        }
    }
    return true;
}

bool apply_log_level(const std::string& name)
{
    auto level = Logger::level_from_string(name);
    if (!level)
    {
        TRIGON_LOG_ERROR("app", "Unknown log level: {}", name);
        return false;
    }
    Logger::instance().set_level(*level);
    return true;
}

}   // namespace

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    Options opts;
    if (!parse_args(argc, argv, opts))
    {
        print_usage(argv[0]);
        return 2;
    }
    if (opts.help)
    {
        print_usage(argv[0]);
        return 0;
    }

    if (opts.log_level && !apply_log_level(*opts.log_level))
        return 2;
    if (!opts.log_file.empty())
        Logger::instance().add_sink(sinks::file_sink(opts.log_file));

    Settings settings;
    std::string config_path = opts.config_path.empty() ? Settings::default_path() : opts.config_path;
    if (!settings.load(config_path) && !opts.config_path.empty())
    {
        TRIGON_LOG_ERROR("app", "Could not load settings from {}", config_path);
        return 1;
    }

    // The command line wins over the settings file
    if (!opts.log_level && !apply_log_level(settings.log_level))
        return 1;

    try
    {
        if (!opts.export_svg.empty())
        {
            SceneModel scene(settings.to_scene_config());
            scene.prepare_still(opts.theta);
            bool ok = SvgExporter::write_svg(opts.export_svg,
                                             scene,
                                             static_cast<uint32_t>(settings.window_width),
                                             static_cast<uint32_t>(settings.window_height));
            return ok ? 0 : 1;
        }

        App app(settings);
        return app.run();
    }
    catch (const std::exception& e)
    {
        TRIGON_LOG_CRITICAL("app", "Startup failed: {}", e.what());
        return 1;
    }
}
