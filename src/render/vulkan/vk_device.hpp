#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

namespace tracemark::vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool is_complete() const { return graphics.has_value() && present.has_value(); }
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
};

// Instance with the extensions GLFW needs for window surfaces.
VkInstance create_instance(bool enable_validation);

VkDebugUtilsMessengerEXT create_debug_messenger(VkInstance instance);
void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger);

// Highest rated device that can draw to and present on `surface`.
VkPhysicalDevice pick_physical_device(VkInstance instance, VkSurfaceKHR surface);

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface);

VkDevice create_logical_device(VkPhysicalDevice          physical_device,
                               const QueueFamilyIndices& indices,
                               bool                      enable_validation);

bool check_validation_layer_support();

}   // namespace tracemark::vk
