#ifdef TRIGON_USE_GLFW

    #include "glfw_adapter.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <trigon/logger.hpp>
    #include <utility>

namespace trigon
{

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    glfwSetErrorCallback([](int code, const char* description)
                         { TRIGON_LOG_ERROR("glfw", "GLFW error {}: {}", code, description); });

    if (!glfwInit())
    {
        TRIGON_LOG_ERROR("glfw", "glfwInit failed");
        return false;
    }
    if (!glfwVulkanSupported())
    {
        TRIGON_LOG_ERROR("glfw", "No Vulkan loader found");
        glfwTerminate();
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window_ = glfwCreateWindow(static_cast<int>(width), static_cast<int>(height), title.c_str(),
                               nullptr, nullptr);
    if (!window_)
    {
        TRIGON_LOG_ERROR("glfw", "Cannot open a {}x{} window", width, height);
        glfwTerminate();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_,
                       [](GLFWwindow* w, int key, int /*scancode*/, int action, int mods)
                       {
                           GlfwAdapter* self = from(w);
                           if (self && self->events_.on_key)
                               self->events_.on_key(key, action, mods);
                       });
    glfwSetFramebufferSizeCallback(window_,
                                   [](GLFWwindow* w, int fb_width, int fb_height)
                                   {
                                       GlfwAdapter* self = from(w);
                                       if (self && self->events_.on_resize)
                                           self->events_.on_resize(fb_width, fb_height);
                                   });

    TRIGON_LOG_DEBUG("glfw", "Opened {}x{} window '{}'", width, height, title);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (!window_)
        return;
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void GlfwAdapter::set_events(WindowEvents events)
{
    events_ = std::move(events);
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

void GlfwAdapter::wait_events()
{
    glfwWaitEvents();
}

bool GlfwAdapter::should_close() const
{
    return !window_ || glfwWindowShouldClose(window_);
}

void GlfwAdapter::request_close()
{
    if (window_)
        glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    int w = 0, h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, &h);
    width  = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
}

Vec2 GlfwAdapter::window_extent() const
{
    int w = 0, h = 0;
    if (window_)
        glfwGetWindowSize(window_, &w, &h);
    return {static_cast<float>(w), static_cast<float>(h)};
}

Vec2 GlfwAdapter::cursor() const
{
    double x = 0.0, y = 0.0;
    if (window_)
        glfwGetCursorPos(window_, &x, &y);
    return {static_cast<float>(x), static_cast<float>(y)};
}

bool GlfwAdapter::primary_button_down() const
{
    return window_ && glfwGetMouseButton(window_, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;
}

GlfwAdapter* GlfwAdapter::from(GLFWwindow* window)
{
    return static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
}

}   // namespace trigon

#endif   // TRIGON_USE_GLFW
