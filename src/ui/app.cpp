#include <trigon/app.hpp>
#include <trigon/logger.hpp>

#include "../anim/frame_scheduler.hpp"
#include "settings.hpp"

#if defined(TRIGON_USE_GLFW) && defined(TRIGON_USE_IMGUI)
    #include <imgui.h>

    #include "../render/scene_painter.hpp"
    #include "../render/vulkan/vk_backend.hpp"
    #include "commands/command_registry.hpp"
    #include "commands/shortcut_manager.hpp"
    #include "glfw_adapter.hpp"
    #include "imgui_canvas.hpp"
    #include "imgui_integration.hpp"
    #include "register_commands.hpp"

    #include <utility>
#endif

namespace trigon
{

App::App(const Settings& settings)
    : settings_(std::make_unique<Settings>(settings)), scene_(settings.to_scene_config())
{
}

App::~App() = default;

#if defined(TRIGON_USE_GLFW) && defined(TRIGON_USE_IMGUI)

int App::run()
{
    const Settings& settings = *settings_;

    GlfwAdapter glfw;
    if (!glfw.init(static_cast<uint32_t>(settings.window_width),
                   static_cast<uint32_t>(settings.window_height),
                   "Trigon"))
    {
        return 1;
    }

    VulkanBackend backend;
    if (!backend.init() || !backend.create_surface(glfw.window()))
    {
        TRIGON_LOG_CRITICAL("app", "Vulkan initialization failed");
        return 1;
    }

    uint32_t fb_width = 0, fb_height = 0;
    glfw.framebuffer_size(fb_width, fb_height);
    if (!backend.create_swapchain(fb_width, fb_height))
    {
        TRIGON_LOG_CRITICAL("app", "Could not create the swapchain");
        return 1;
    }

    // ─── Commands and shortcuts ──────────────────────────────────────────

    CommandRegistry registry;
    ShortcutManager shortcuts;
    register_commands(registry, scene_, [&glfw]() { glfw.request_close(); });
    shortcuts.set_command_registry(&registry);
    shortcuts.register_defaults();
    settings.apply_keybindings(shortcuts, &registry);

    ImGuiIntegration imgui;
    bool             framebuffer_resized = false;

    WindowEvents events;
    events.on_key = [&](int key, int action, int mods)
    {
        if (imgui.wants_capture_keyboard())
            return;
        shortcuts.on_key(key, action, mods);
    };
    events.on_resize = [&](int /*width*/, int /*height*/) { framebuffer_resized = true; };
    glfw.set_events(std::move(events));

    ImGuiIntegration::FontPaths fonts;
    fonts.regular = settings.font_path;
    fonts.italic  = settings.italic_font_path.empty() ? settings.font_path : settings.italic_font_path;
    if (!imgui.init(backend, glfw.window(), fonts))
    {
        TRIGON_LOG_CRITICAL("app", "ImGui initialization failed");
        return 1;
    }

    // FIFO present paces the loop unless a lower target_fps is set
    FrameScheduler scheduler(settings.target_fps, FrameScheduler::mode_for(settings.target_fps));
    ScenePainter   painter;

    TRIGON_LOG_INFO("app", "Entering main loop");

    int exit_code = 0;
    while (!glfw.should_close())
    {
        scheduler.begin_frame();
        glfw.poll_events();

        glfw.framebuffer_size(fb_width, fb_height);
        if (fb_width == 0 || fb_height == 0)
        {
            // Minimized
            glfw.wait_events();
            continue;
        }

        if (framebuffer_resized || backend.swapchain_needs_recreation())
        {
            framebuffer_resized = false;
            if (backend.recreate_swapchain(fb_width, fb_height))
            {
                imgui.on_swapchain_recreated(backend);
            }
        }

        Vec2          extent = glfw.window_extent();
        ViewTransform view;
        view.width  = extent.x;
        view.height = extent.y;

        bool primary_down = glfw.primary_button_down() && !imgui.wants_capture_mouse();
        Vec2 pointer      = view.to_diagram(glfw.cursor());

        scene_.update(scheduler.dt(), pointer, primary_down);

        if (!backend.begin_frame())
        {
            if (backend.is_device_lost())
            {
                TRIGON_LOG_CRITICAL("app", "GPU device lost, exiting");
                exit_code = 1;
                break;
            }
            framebuffer_resized = true;
            continue;
        }

        imgui.new_frame();
        ImGuiCanvas canvas(ImGui::GetBackgroundDrawList(),
                           view,
                           imgui.regular_font(),
                           imgui.italic_font());
        painter.paint(scene_, canvas);

        backend.begin_render_pass(painter.style().background);
        imgui.render(backend);
        backend.end_render_pass();
        backend.end_frame();

        scheduler.end_frame();
    }

    auto stats = scheduler.frame_stats();
    TRIGON_LOG_INFO("app",
                    "Exiting after {} frames (avg {} ms, max {} ms)",
                    scheduler.frame_number(),
                    stats.avg_frame_time_ms,
                    stats.max_frame_time_ms);

    backend.wait_idle();
    imgui.shutdown();
    return exit_code;
}

#else

int App::run()
{
    TRIGON_LOG_ERROR("app", "Built without GLFW/ImGui support; only --export-svg is available");
    return 1;
}

#endif

}   // namespace trigon
