#pragma once

#ifdef TRIGON_USE_IMGUI

    #include <string>

struct GLFWwindow;
struct ImFont;
struct ImGuiContext;

namespace trigon
{

class VulkanBackend;

// Owns the ImGui context and its GLFW + Vulkan backends. The diagram is drawn
// into the background draw list between new_frame() and render().
class ImGuiIntegration
{
   public:
    struct FontPaths
    {
        std::string regular;   // empty = ImGui default font
        std::string italic;    // empty = same as regular
    };

    ImGuiIntegration() = default;
    ~ImGuiIntegration();

    ImGuiIntegration(const ImGuiIntegration&)            = delete;
    ImGuiIntegration& operator=(const ImGuiIntegration&) = delete;

    // Must run after the GLFW input callbacks are installed so ImGui chains them.
    bool init(VulkanBackend& backend, GLFWwindow* window, const FontPaths& fonts);
    void shutdown();

    void new_frame();
    void render(VulkanBackend& backend);

    void on_swapchain_recreated(VulkanBackend& backend);

    bool wants_capture_mouse() const;
    bool wants_capture_keyboard() const;

    ImFont* regular_font() const { return font_regular_; }
    ImFont* italic_font() const { return font_italic_; }

    // Glyphs are rasterized at this size and scaled when drawn.
    static constexpr float kFontRasterSize = 36.0f;

   private:
    void load_fonts(const FontPaths& fonts);

    bool          initialized_   = false;
    ImGuiContext* imgui_context_ = nullptr;
    ImFont*       font_regular_  = nullptr;
    ImFont*       font_italic_   = nullptr;
};

}   // namespace trigon

#endif   // TRIGON_USE_IMGUI
