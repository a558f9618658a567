#ifdef TRIGON_USE_IMGUI

    #include "imgui_integration.hpp"

    #include <filesystem>
    #include <imgui.h>
    #include <imgui_impl_glfw.h>
    #include <imgui_impl_vulkan.h>
    #include <system_error>
    #include <trigon/logger.hpp>

    #include "../render/vulkan/vk_backend.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>

namespace trigon
{

static void check_vk_result(VkResult result)
{
    if (result != VK_SUCCESS)
    {
        TRIGON_LOG_ERROR("imgui", "Vulkan call in ImGui backend failed: {}", static_cast<int>(result));
    }
}

static ImGui_ImplVulkan_InitInfo make_init_info(VulkanBackend& backend)
{
    ImGui_ImplVulkan_InitInfo ii{};
    ii.Instance        = backend.instance();
    ii.PhysicalDevice  = backend.physical_device();
    ii.Device          = backend.device();
    ii.QueueFamily     = backend.graphics_queue_family();
    ii.Queue           = backend.graphics_queue();
    ii.DescriptorPool  = backend.descriptor_pool();
    ii.MinImageCount   = backend.min_image_count();
    ii.ImageCount      = backend.image_count();
    ii.RenderPass      = backend.render_pass();
    ii.MSAASamples     = VK_SAMPLE_COUNT_1_BIT;
    ii.CheckVkResultFn = check_vk_result;
    return ii;
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

ImGuiIntegration::~ImGuiIntegration()
{
    shutdown();
}

bool ImGuiIntegration::init(VulkanBackend& backend, GLFWwindow* window, const FontPaths& fonts)
{
    if (initialized_)
        return true;
    if (!window)
        return false;

    IMGUI_CHECKVERSION();
    imgui_context_ = ImGui::CreateContext();
    ImGui::SetCurrentContext(imgui_context_);

    ImGuiIO& io    = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    load_fonts(fonts);

    if (!ImGui_ImplGlfw_InitForVulkan(window, true))
    {
        TRIGON_LOG_ERROR("imgui", "GLFW backend init failed");
        ImGui::DestroyContext(imgui_context_);
        imgui_context_ = nullptr;
        return false;
    }

    ImGui_ImplVulkan_InitInfo ii = make_init_info(backend);
    if (!ImGui_ImplVulkan_Init(&ii))
    {
        TRIGON_LOG_ERROR("imgui", "Vulkan backend init failed");
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext(imgui_context_);
        imgui_context_ = nullptr;
        return false;
    }
    ImGui_ImplVulkan_CreateFontsTexture();

    initialized_ = true;
    TRIGON_LOG_INFO("imgui", "ImGui {} initialized", IMGUI_VERSION);
    return true;
}

void ImGuiIntegration::shutdown()
{
    if (!initialized_)
        return;

    ImGui::SetCurrentContext(imgui_context_);
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext(imgui_context_);
    imgui_context_ = nullptr;
    font_regular_  = nullptr;
    font_italic_   = nullptr;
    initialized_   = false;
}

void ImGuiIntegration::on_swapchain_recreated(VulkanBackend& backend)
{
    if (!initialized_)
        return;
    ImGui_ImplVulkan_SetMinImageCount(backend.min_image_count());
}

void ImGuiIntegration::new_frame()
{
    if (!initialized_)
        return;
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void ImGuiIntegration::render(VulkanBackend& backend)
{
    if (!initialized_)
        return;
    ImGui::Render();
    auto* dd = ImGui::GetDrawData();
    if (dd)
        ImGui_ImplVulkan_RenderDrawData(dd, backend.current_command_buffer());
}

bool ImGuiIntegration::wants_capture_mouse() const
{
    return initialized_ && ImGui::GetIO().WantCaptureMouse;
}

bool ImGuiIntegration::wants_capture_keyboard() const
{
    return initialized_ && ImGui::GetIO().WantCaptureKeyboard;
}

// ─── Fonts ──────────────────────────────────────────────────────────────────

static ImFont* load_font_file(const std::string& path)
{
    if (path.empty())
        return nullptr;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        TRIGON_LOG_WARN("imgui", "Font not found: {}", path);
        return nullptr;
    }

    // Latin-1 for the degree sign plus Greek for theta
    ImGuiIO& io   = ImGui::GetIO();
    ImFont*  font = io.Fonts->AddFontFromFileTTF(path.c_str(),
                                                ImGuiIntegration::kFontRasterSize,
                                                nullptr,
                                                io.Fonts->GetGlyphRangesGreek());
    if (!font)
    {
        TRIGON_LOG_WARN("imgui", "Failed to load font: {}", path);
    }
    return font;
}

void ImGuiIntegration::load_fonts(const FontPaths& fonts)
{
    ImGuiIO& io = ImGui::GetIO();

    font_regular_ = load_font_file(fonts.regular);
    font_italic_  = load_font_file(fonts.italic);

    if (!font_regular_)
    {
        ImFontConfig cfg;
        cfg.SizePixels = kFontRasterSize;
        font_regular_  = io.Fonts->AddFontDefault(&cfg);
        TRIGON_LOG_INFO("imgui", "Using the built-in ImGui font");
    }
    if (!font_italic_)
    {
        font_italic_ = font_regular_;
    }

    io.FontDefault = font_regular_;
}

}   // namespace trigon

#endif   // TRIGON_USE_IMGUI
