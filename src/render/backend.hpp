#pragma once

#include <cstdint>
#include <trigon/color.hpp>

namespace trigon
{

// Abstract GPU backend. The viewer records one render pass per frame; the
// drawing itself goes through ImGui's renderer backend.
class Backend
{
   public:
    virtual ~Backend() = default;

    virtual bool init() = 0;
    virtual void shutdown() = 0;
    virtual void wait_idle() = 0;

    virtual bool create_surface(void* native_window) = 0;
    virtual bool create_swapchain(uint32_t width, uint32_t height) = 0;
    virtual bool recreate_swapchain(uint32_t width, uint32_t height) = 0;

    // False when the swapchain must be recreated before rendering.
    virtual bool begin_frame() = 0;
    virtual void end_frame() = 0;

    virtual void begin_render_pass(const Color& clear_color = colors::black) = 0;
    virtual void end_render_pass() = 0;

    virtual uint32_t swapchain_width() const = 0;
    virtual uint32_t swapchain_height() const = 0;
};

}   // namespace trigon
