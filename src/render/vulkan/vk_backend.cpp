#include "vk_backend.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <stdexcept>
#include <string>
#include <trigon/logger.hpp>

namespace trigon
{

VulkanBackend::~VulkanBackend()
{
    shutdown();
}

bool VulkanBackend::init()
{
    TRIGON_LOG_INFO("vulkan", "Initializing Vulkan backend");

    try
    {
#ifdef NDEBUG
        bool enable_validation = false;
#else
        bool enable_validation = true;
#endif
        TRIGON_LOG_DEBUG("vulkan", "Validation layers: {}", enable_validation);

        ctx_.instance = vk::create_instance(enable_validation);

        if (enable_validation)
        {
            ctx_.debug_messenger = vk::create_debug_messenger(ctx_.instance);
        }

        // The surface does not exist yet; present support is resolved in create_surface()
        ctx_.physical_device = vk::pick_physical_device(ctx_.instance);
        ctx_.queue_families  = vk::find_queue_families(ctx_.physical_device);
        vkGetPhysicalDeviceProperties(ctx_.physical_device, &ctx_.properties);

        ctx_.device =
            vk::create_logical_device(ctx_.physical_device, ctx_.queue_families, enable_validation);
        vkGetDeviceQueue(ctx_.device, ctx_.queue_families.graphics.value(), 0, &ctx_.graphics_queue);
        ctx_.present_queue = ctx_.graphics_queue;

        create_command_pool();
        create_descriptor_pool();

        TRIGON_LOG_INFO("vulkan", "Vulkan backend initialized");
        return true;
    }
    catch (const std::exception& e)
    {
        TRIGON_LOG_ERROR("vulkan", "Backend init failed: {}", e.what());
        return false;
    }
}

void VulkanBackend::shutdown()
{
    if (ctx_.device == VK_NULL_HANDLE)
        return;

    vkDeviceWaitIdle(ctx_.device);

    destroy_sync_objects();

    if (descriptor_pool_ != VK_NULL_HANDLE)
        vkDestroyDescriptorPool(ctx_.device, descriptor_pool_, nullptr);
    descriptor_pool_ = VK_NULL_HANDLE;

    if (command_pool_ != VK_NULL_HANDLE)
        vkDestroyCommandPool(ctx_.device, command_pool_, nullptr);
    command_pool_ = VK_NULL_HANDLE;
    command_buffers_.clear();

    vk::destroy_swapchain(ctx_.device, swapchain_);
    if (surface_ != VK_NULL_HANDLE)
    {
        vkDestroySurfaceKHR(ctx_.instance, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }

    vkDestroyDevice(ctx_.device, nullptr);

    if (ctx_.debug_messenger != VK_NULL_HANDLE)
        vk::destroy_debug_messenger(ctx_.instance, ctx_.debug_messenger);

    vkDestroyInstance(ctx_.instance, nullptr);

    ctx_ = {};
    TRIGON_LOG_DEBUG("vulkan", "Vulkan backend shut down");
}

void VulkanBackend::wait_idle()
{
    if (ctx_.device != VK_NULL_HANDLE)
        vkDeviceWaitIdle(ctx_.device);
}

bool VulkanBackend::create_surface(void* native_window)
{
    if (!native_window || ctx_.instance == VK_NULL_HANDLE)
        return false;

    auto*    glfw_window = static_cast<GLFWwindow*>(native_window);
    VkResult result      = glfwCreateWindowSurface(ctx_.instance, glfw_window, nullptr, &surface_);
    if (result != VK_SUCCESS)
    {
        TRIGON_LOG_ERROR("vulkan",
                         "Failed to create Vulkan surface (VkResult={})",
                         static_cast<int>(result));
        return false;
    }

    // The device only has the graphics queue; present must go through it
    VkBool32 present_support = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(ctx_.physical_device,
                                         ctx_.queue_families.graphics.value(),
                                         surface_,
                                         &present_support);
    if (!present_support)
    {
        TRIGON_LOG_ERROR("vulkan", "Graphics queue family cannot present to this surface");
        return false;
    }
    ctx_.queue_families.present = ctx_.queue_families.graphics;
    ctx_.present_queue          = ctx_.graphics_queue;
    return true;
}

bool VulkanBackend::create_swapchain(uint32_t width, uint32_t height)
{
    if (surface_ == VK_NULL_HANDLE)
        return false;

    try
    {
        swapchain_ = vk::create_swapchain(ctx_.device,
                                          ctx_.physical_device,
                                          surface_,
                                          width,
                                          height,
                                          ctx_.queue_families.graphics.value(),
                                          ctx_.queue_families.present.value());
        create_command_buffers();
        create_sync_objects();
        TRIGON_LOG_INFO("vulkan",
                        "Swapchain created: {}x{}, {} images",
                        swapchain_.extent.width,
                        swapchain_.extent.height,
                        swapchain_.images.size());
        return true;
    }
    catch (const std::exception& e)
    {
        TRIGON_LOG_ERROR("vulkan", "Swapchain creation failed: {}", e.what());
        return false;
    }
}

bool VulkanBackend::recreate_swapchain(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0)
        return false;

    TRIGON_LOG_DEBUG("vulkan", "recreate_swapchain: {}x{}", width, height);

    // Waiting on the in-flight fences is enough; the device stays busy otherwise
    if (!in_flight_fences_.empty())
    {
        vkWaitForFences(ctx_.device,
                        static_cast<uint32_t>(in_flight_fences_.size()),
                        in_flight_fences_.data(),
                        VK_TRUE,
                        UINT64_MAX);
    }

    auto old_context = swapchain_;

    try
    {
        swapchain_ = vk::create_swapchain(ctx_.device,
                                          ctx_.physical_device,
                                          surface_,
                                          width,
                                          height,
                                          ctx_.queue_families.graphics.value(),
                                          ctx_.queue_families.present.value(),
                                          old_context.swapchain,
                                          old_context.render_pass);

        vk::destroy_swapchain(ctx_.device, old_context, /*skip_render_pass=*/true);

        if (swapchain_.images.size() != old_context.images.size())
        {
            TRIGON_LOG_DEBUG("vulkan",
                             "Image count changed {} -> {}",
                             old_context.images.size(),
                             swapchain_.images.size());
            destroy_sync_objects();
            create_command_buffers();
            create_sync_objects();
        }
        current_flight_frame_ = 0;
        swapchain_dirty_      = false;
        return true;
    }
    catch (const std::exception& e)
    {
        TRIGON_LOG_ERROR("vulkan", "Swapchain recreation failed: {}", e.what());
        return false;
    }
}

bool VulkanBackend::begin_frame()
{
    if (in_flight_fences_.empty() || device_lost_)
        return false;

    VkResult fence_status = vkWaitForFences(ctx_.device,
                                            1,
                                            &in_flight_fences_[current_flight_frame_],
                                            VK_TRUE,
                                            UINT64_MAX);
    if (fence_status == VK_ERROR_DEVICE_LOST)
    {
        device_lost_ = true;
        TRIGON_LOG_CRITICAL("vulkan", "Device lost while waiting for frame fence");
        return false;
    }

    // Acquire before resetting the fence so an OUT_OF_DATE return leaves it signaled
    VkResult result = vkAcquireNextImageKHR(ctx_.device,
                                            swapchain_.swapchain,
                                            UINT64_MAX,
                                            image_available_semaphores_[current_flight_frame_],
                                            VK_NULL_HANDLE,
                                            &current_image_index_);

    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        swapchain_dirty_ = true;
        return false;
    }
    if (result == VK_SUBOPTIMAL_KHR)
    {
        swapchain_dirty_ = true;
    }
    else if (result != VK_SUCCESS)
    {
        TRIGON_LOG_ERROR("vulkan", "vkAcquireNextImageKHR failed: {}", static_cast<int>(result));
        return false;
    }

    vkResetFences(ctx_.device, 1, &in_flight_fences_[current_flight_frame_]);

    current_cmd_ = command_buffers_[current_flight_frame_];
    vkResetCommandBuffer(current_cmd_, 0);

    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vkBeginCommandBuffer(current_cmd_, &begin_info);

    return true;
}

void VulkanBackend::end_frame()
{
    vkEndCommandBuffer(current_cmd_);

    // image_available follows the flight frame used for acquire; render_finished
    // follows the image so it is only reused once that image comes back.
    VkSemaphore          wait_semaphores[]   = {image_available_semaphores_[current_flight_frame_]};
    VkSemaphore          signal_semaphores[] = {render_finished_semaphores_[current_image_index_]};
    VkPipelineStageFlags wait_stages[]       = {VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT};

    VkSubmitInfo submit{};
    submit.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount   = 1;
    submit.pWaitSemaphores      = wait_semaphores;
    submit.pWaitDstStageMask    = wait_stages;
    submit.commandBufferCount   = 1;
    submit.pCommandBuffers      = &current_cmd_;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores    = signal_semaphores;

    VkResult submit_result =
        vkQueueSubmit(ctx_.graphics_queue, 1, &submit, in_flight_fences_[current_flight_frame_]);
    if (submit_result == VK_ERROR_DEVICE_LOST)
    {
        device_lost_ = true;
        TRIGON_LOG_CRITICAL("vulkan", "Device lost on queue submit");
        return;
    }
    if (submit_result != VK_SUCCESS)
    {
        TRIGON_LOG_ERROR("vulkan", "vkQueueSubmit failed: {}", static_cast<int>(submit_result));
    }

    VkPresentInfoKHR present{};
    present.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores    = signal_semaphores;
    present.swapchainCount     = 1;
    present.pSwapchains        = &swapchain_.swapchain;
    present.pImageIndices      = &current_image_index_;

    VkResult result = vkQueuePresentKHR(ctx_.present_queue, &present);

    current_flight_frame_ =
        (current_flight_frame_ + 1) % static_cast<uint32_t>(in_flight_fences_.size());

    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
    {
        swapchain_dirty_ = true;
        TRIGON_LOG_DEBUG("vulkan", "end_frame: present asks for a new swapchain");
    }
    else if (result != VK_SUCCESS)
    {
        TRIGON_LOG_ERROR("vulkan", "end_frame: present failed with result {}", static_cast<int>(result));
    }
}

void VulkanBackend::begin_render_pass(const Color& clear_color)
{
    VkClearValue clear_value{};
    clear_value.color = {{clear_color.r, clear_color.g, clear_color.b, clear_color.a}};

    VkRenderPassBeginInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    info.renderPass      = swapchain_.render_pass;
    info.framebuffer     = swapchain_.framebuffers[current_image_index_];
    info.renderArea      = {{0, 0}, swapchain_.extent};
    info.clearValueCount = 1;
    info.pClearValues    = &clear_value;

    vkCmdBeginRenderPass(current_cmd_, &info, VK_SUBPASS_CONTENTS_INLINE);
}

void VulkanBackend::end_render_pass()
{
    vkCmdEndRenderPass(current_cmd_);
}

// ─── Private helpers ─────────────────────────────────────────────────────────

void VulkanBackend::create_command_pool()
{
    VkCommandPoolCreateInfo info{};
    info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    info.queueFamilyIndex = ctx_.queue_families.graphics.value();

    if (vkCreateCommandPool(ctx_.device, &info, nullptr, &command_pool_) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to create command pool");
    }
}

void VulkanBackend::create_command_buffers()
{
    // Free the previous set on recreation
    if (!command_buffers_.empty())
    {
        vkFreeCommandBuffers(ctx_.device,
                             command_pool_,
                             static_cast<uint32_t>(command_buffers_.size()),
                             command_buffers_.data());
    }

    uint32_t count = static_cast<uint32_t>(swapchain_.images.size());
    command_buffers_.resize(count);

    VkCommandBufferAllocateInfo info{};
    info.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    info.commandPool        = command_pool_;
    info.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    info.commandBufferCount = count;

    if (vkAllocateCommandBuffers(ctx_.device, &info, command_buffers_.data()) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to allocate command buffers");
    }
}

void VulkanBackend::create_sync_objects()
{
    uint32_t count = static_cast<uint32_t>(swapchain_.images.size());
    image_available_semaphores_.resize(count);
    render_finished_semaphores_.resize(count);
    in_flight_fences_.resize(count);

    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (uint32_t i = 0; i < count; ++i)
    {
        if (vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &image_available_semaphores_[i])
                != VK_SUCCESS
            || vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &render_finished_semaphores_[i])
                   != VK_SUCCESS
            || vkCreateFence(ctx_.device, &fence_info, nullptr, &in_flight_fences_[i])
                   != VK_SUCCESS)
        {
            throw std::runtime_error("Failed to create sync objects");
        }
    }
}

void VulkanBackend::destroy_sync_objects()
{
    for (auto sem : image_available_semaphores_)
        vkDestroySemaphore(ctx_.device, sem, nullptr);
    for (auto sem : render_finished_semaphores_)
        vkDestroySemaphore(ctx_.device, sem, nullptr);
    for (auto fence : in_flight_fences_)
        vkDestroyFence(ctx_.device, fence, nullptr);
    image_available_semaphores_.clear();
    render_finished_semaphores_.clear();
    in_flight_fences_.clear();
}

void VulkanBackend::create_descriptor_pool()
{
    // ImGui needs one combined image sampler per font atlas
    VkDescriptorPoolSize pool_sizes[] = {
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16},
    };

    VkDescriptorPoolCreateInfo info{};
    info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    info.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    info.maxSets       = 16;
    info.poolSizeCount = 1;
    info.pPoolSizes    = pool_sizes;

    if (vkCreateDescriptorPool(ctx_.device, &info, nullptr, &descriptor_pool_) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to create descriptor pool");
    }
}

}   // namespace trigon
