#include "render/vulkan/vk_device.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cstring>
#include <set>
#include <stdexcept>
#include <tracemark/logger.hpp>

namespace tracemark::vk
{

static const std::vector<const char*> validation_layers = {"VK_LAYER_KHRONOS_validation"};

static VKAPI_ATTR VkBool32 VKAPI_CALL
debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT      severity,
               VkDebugUtilsMessageTypeFlagsEXT             /*type*/,
               const VkDebugUtilsMessengerCallbackDataEXT* callback_data,
               void* /*user_data*/)
{
    if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
        TRACEMARK_LOG_ERROR("vulkan", "{}", callback_data->pMessage);
    else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        TRACEMARK_LOG_WARN("vulkan", "{}", callback_data->pMessage);
    return VK_FALSE;
}

bool check_validation_layer_support()
{
    uint32_t layer_count = 0;
    vkEnumerateInstanceLayerProperties(&layer_count, nullptr);
    std::vector<VkLayerProperties> available(layer_count);
    vkEnumerateInstanceLayerProperties(&layer_count, available.data());

    for (const char* name : validation_layers)
    {
        bool found = std::any_of(available.begin(),
                                 available.end(),
                                 [name](const VkLayerProperties& layer)
                                 { return std::strcmp(name, layer.layerName) == 0; });
        if (!found)
            return false;
    }
    return true;
}

VkInstance create_instance(bool enable_validation)
{
    VkApplicationInfo app_info{};
    app_info.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName   = "tracemark";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName        = "tracemark";
    app_info.engineVersion      = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion         = VK_API_VERSION_1_2;

    uint32_t     glfw_ext_count = 0;
    const char** glfw_exts      = glfwGetRequiredInstanceExtensions(&glfw_ext_count);
    if (!glfw_exts)
        throw std::runtime_error("GLFW reports no Vulkan surface extensions");
    std::vector<const char*> extensions(glfw_exts, glfw_exts + glfw_ext_count);

    bool validation = enable_validation && check_validation_layer_support();
    if (enable_validation && !validation)
        TRACEMARK_LOG_WARN("vulkan", "Validation layers requested but not available");
    if (validation)
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

    VkInstanceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo        = &app_info;
    create_info.enabledExtensionCount   = static_cast<uint32_t>(extensions.size());
    create_info.ppEnabledExtensionNames = extensions.data();
    if (validation)
    {
        create_info.enabledLayerCount   = static_cast<uint32_t>(validation_layers.size());
        create_info.ppEnabledLayerNames = validation_layers.data();
    }

    VkInstance instance = VK_NULL_HANDLE;
    if (vkCreateInstance(&create_info, nullptr, &instance) != VK_SUCCESS)
        throw std::runtime_error("Failed to create Vulkan instance");
    return instance;
}

VkDebugUtilsMessengerEXT create_debug_messenger(VkInstance instance)
{
    auto func = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT"));
    if (!func)
        return VK_NULL_HANDLE;

    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT
                           | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT
                       | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    info.pfnUserCallback = debug_callback;

    VkDebugUtilsMessengerEXT messenger = VK_NULL_HANDLE;
    if (func(instance, &info, nullptr, &messenger) != VK_SUCCESS)
    {
        TRACEMARK_LOG_WARN("vulkan", "Debug messenger could not be created");
        return VK_NULL_HANDLE;
    }
    return messenger;
}

void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger)
{
    if (messenger == VK_NULL_HANDLE)
        return;
    auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT"));
    if (func)
        func(instance, messenger, nullptr);
}

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    QueueFamilyIndices indices;

    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    for (uint32_t i = 0; i < count; ++i)
    {
        bool graphics = (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;

        VkBool32 present = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &present);

        // Prefer one family that does both
        if (graphics && present)
        {
            indices.graphics = i;
            indices.present  = i;
            break;
        }
        if (graphics && !indices.graphics)
            indices.graphics = i;
        if (present && !indices.present)
            indices.present = i;
    }
    return indices;
}

static int rate_device(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    if (!find_queue_families(device, surface).is_complete())
        return -1;

    uint32_t ext_count = 0;
    vkEnumerateDeviceExtensionProperties(device, nullptr, &ext_count, nullptr);
    std::vector<VkExtensionProperties> exts(ext_count);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &ext_count, exts.data());
    bool has_swapchain = std::any_of(exts.begin(),
                                     exts.end(),
                                     [](const VkExtensionProperties& e) {
                                         return std::strcmp(e.extensionName,
                                                            VK_KHR_SWAPCHAIN_EXTENSION_NAME)
                                                == 0;
                                     });
    if (!has_swapchain)
        return -1;

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(device, &props);

    int score = 0;
    if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
        score += 1000;
    else if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)
        score += 100;
    return score;
}

VkPhysicalDevice pick_physical_device(VkInstance instance, VkSurfaceKHR surface)
{
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance, &count, nullptr);
    if (count == 0)
        throw std::runtime_error("No Vulkan-capable GPU found");

    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance, &count, devices.data());

    VkPhysicalDevice best       = VK_NULL_HANDLE;
    int              best_score = -1;
    for (auto dev : devices)
    {
        int score = rate_device(dev, surface);
        if (score > best_score)
        {
            best_score = score;
            best       = dev;
        }
    }
    if (best == VK_NULL_HANDLE)
        throw std::runtime_error("No GPU can present to the window surface");

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(best, &props);
    TRACEMARK_LOG_INFO("vulkan", "Using GPU: {}", props.deviceName);
    return best;
}

VkDevice create_logical_device(VkPhysicalDevice          physical_device,
                               const QueueFamilyIndices& indices,
                               bool                      enable_validation)
{
    std::set<uint32_t> unique_families = {indices.graphics.value(), indices.present.value()};

    float                                priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queue_infos;
    for (uint32_t family : unique_families)
    {
        VkDeviceQueueCreateInfo qi{};
        qi.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qi.queueFamilyIndex = family;
        qi.queueCount       = 1;
        qi.pQueuePriorities = &priority;
        queue_infos.push_back(qi);
    }

    VkPhysicalDeviceFeatures features{};
    const char*              extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    VkDeviceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    create_info.queueCreateInfoCount    = static_cast<uint32_t>(queue_infos.size());
    create_info.pQueueCreateInfos       = queue_infos.data();
    create_info.pEnabledFeatures        = &features;
    create_info.enabledExtensionCount   = 1;
    create_info.ppEnabledExtensionNames = extensions;

    if (enable_validation && check_validation_layer_support())
    {
        create_info.enabledLayerCount   = static_cast<uint32_t>(validation_layers.size());
        create_info.ppEnabledLayerNames = validation_layers.data();
    }

    VkDevice device = VK_NULL_HANDLE;
    if (vkCreateDevice(physical_device, &create_info, nullptr, &device) != VK_SUCCESS)
        throw std::runtime_error("Failed to create Vulkan logical device");
    return device;
}

}   // namespace tracemark::vk
