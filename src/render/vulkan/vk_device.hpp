#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

namespace trigon::vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool is_complete() const { return graphics.has_value(); }
    bool has_present() const { return present.has_value(); }
};

struct DeviceContext
{
    VkInstance               instance        = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger = VK_NULL_HANDLE;
    VkPhysicalDevice         physical_device = VK_NULL_HANDLE;
    VkDevice                 device          = VK_NULL_HANDLE;
    VkQueue                  graphics_queue  = VK_NULL_HANDLE;
    VkQueue                  present_queue   = VK_NULL_HANDLE;
    QueueFamilyIndices       queue_families;

    VkPhysicalDeviceProperties properties{};
};

// All creation helpers throw std::runtime_error on failure.

VkInstance create_instance(bool enable_validation);

// Routes validation messages to the logger. Returns VK_NULL_HANDLE if unavailable.
VkDebugUtilsMessengerEXT create_debug_messenger(VkInstance instance);
void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger);

VkPhysicalDevice pick_physical_device(VkInstance instance, VkSurfaceKHR surface = VK_NULL_HANDLE);

QueueFamilyIndices find_queue_families(VkPhysicalDevice device,
                                       VkSurfaceKHR     surface = VK_NULL_HANDLE);

// Enables VK_KHR_swapchain.
VkDevice create_logical_device(VkPhysicalDevice          physical_device,
                               const QueueFamilyIndices& indices,
                               bool                      enable_validation);

bool check_validation_layer_support();

}   // namespace trigon::vk
