#pragma once

#include <vector>

#include "../backend.hpp"
#include "vk_device.hpp"
#include "vk_swapchain.hpp"

namespace trigon
{

// Single-window Vulkan backend. Owns the device, swapchain, command buffers
// and the descriptor pool the ImGui renderer allocates from.
class VulkanBackend : public Backend
{
   public:
    VulkanBackend() = default;
    ~VulkanBackend() override;

    VulkanBackend(const VulkanBackend&)            = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    // Backend interface
    bool init() override;
    void shutdown() override;
    void wait_idle() override;

    bool create_surface(void* native_window) override;
    bool create_swapchain(uint32_t width, uint32_t height) override;
    bool recreate_swapchain(uint32_t width, uint32_t height) override;

    bool begin_frame() override;
    void end_frame() override;

    void begin_render_pass(const Color& clear_color) override;
    void end_render_pass() override;

    uint32_t swapchain_width() const override { return swapchain_.extent.width; }
    uint32_t swapchain_height() const override { return swapchain_.extent.height; }

    // Set when present reports OUT_OF_DATE or SUBOPTIMAL
    bool swapchain_needs_recreation() const { return swapchain_dirty_; }

    bool is_device_lost() const { return device_lost_; }

    // Vulkan-specific accessors
    VkDevice         device() const { return ctx_.device; }
    VkPhysicalDevice physical_device() const { return ctx_.physical_device; }
    VkInstance       instance() const { return ctx_.instance; }
    VkQueue          graphics_queue() const { return ctx_.graphics_queue; }
    uint32_t graphics_queue_family() const { return ctx_.queue_families.graphics.value_or(0); }
    VkRenderPass     render_pass() const { return swapchain_.render_pass; }
    VkDescriptorPool descriptor_pool() const { return descriptor_pool_; }
    uint32_t image_count() const { return static_cast<uint32_t>(swapchain_.images.size()); }
    uint32_t min_image_count() const { return 2; }
    VkCommandBuffer current_command_buffer() const { return current_cmd_; }

   private:
    void create_command_pool();
    void create_command_buffers();
    void create_sync_objects();
    void destroy_sync_objects();
    void create_descriptor_pool();

    vk::DeviceContext    ctx_;
    VkSurfaceKHR         surface_ = VK_NULL_HANDLE;
    vk::SwapchainContext swapchain_;

    VkCommandPool                command_pool_ = VK_NULL_HANDLE;
    std::vector<VkCommandBuffer> command_buffers_;
    VkCommandBuffer              current_cmd_         = VK_NULL_HANDLE;
    uint32_t                     current_image_index_ = 0;

    // One set per swapchain image
    std::vector<VkSemaphore> image_available_semaphores_;
    std::vector<VkSemaphore> render_finished_semaphores_;
    std::vector<VkFence>     in_flight_fences_;
    uint32_t                 current_flight_frame_ = 0;

    VkDescriptorPool descriptor_pool_ = VK_NULL_HANDLE;

    bool swapchain_dirty_ = false;
    bool device_lost_     = false;
};

}   // namespace trigon
