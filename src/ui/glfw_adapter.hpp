#pragma once

#ifdef TRIGON_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>
    #include <trigon/geometry.hpp>

struct GLFWwindow;

namespace trigon
{

// Events pushed by GLFW. Pointer state is polled instead, once per frame.
struct WindowEvents
{
    std::function<void(int key, int action, int mods)> on_key;
    std::function<void(int width, int height)>         on_resize;
};

// Owns the GLFW library and one window without a client API; Vulkan draws into it.
class GlfwAdapter
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    // Install before ImGui so its callbacks chain to ours
    void set_events(WindowEvents events);

    void poll_events();
    void wait_events();   // Blocks; used while minimized

    bool should_close() const;
    void request_close();

    GLFWwindow* window() const { return window_; }

    // Pixels
    void framebuffer_size(uint32_t& width, uint32_t& height) const;

    // Screen coordinates, the space cursor positions are reported in
    Vec2 window_extent() const;
    Vec2 cursor() const;
    bool primary_button_down() const;

   private:
    static GlfwAdapter* from(GLFWwindow* window);

    GLFWwindow*  window_ = nullptr;
    WindowEvents events_;
};

}   // namespace trigon

#endif   // TRIGON_USE_GLFW
