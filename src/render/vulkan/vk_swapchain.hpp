#pragma once

#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

namespace tracemark::vk
{

// Swapchain images with a single colour attachment render pass; the UI draws
// everything in one subpass, so there is no depth buffer.
struct SwapchainContext
{
    VkSwapchainKHR             swapchain       = VK_NULL_HANDLE;
    VkFormat                   image_format    = VK_FORMAT_B8G8R8A8_UNORM;
    VkExtent2D                 extent          = {0, 0};
    uint32_t                   min_image_count = 2;
    std::vector<VkImage>       images;
    std::vector<VkImageView>   image_views;
    VkRenderPass               render_pass = VK_NULL_HANDLE;
    std::vector<VkFramebuffer> framebuffers;
};

struct SwapchainSupportDetails
{
    VkSurfaceCapabilitiesKHR        capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR>   present_modes;
};

SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface);

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats);
VkExtent2D         choose_extent(const VkSurfaceCapabilitiesKHR& capabilities,
                                 uint32_t                        width,
                                 uint32_t                        height);

VkRenderPass create_render_pass(VkDevice device, VkFormat color_format);

// Passing the previous render pass keeps it (and everything built against it) alive
// across resizes.
SwapchainContext create_swapchain(VkDevice         device,
                                  VkPhysicalDevice physical_device,
                                  VkSurfaceKHR     surface,
                                  uint32_t         width,
                                  uint32_t         height,
                                  uint32_t         graphics_family,
                                  uint32_t         present_family,
                                  VkSwapchainKHR   old_swapchain     = VK_NULL_HANDLE,
                                  VkRenderPass     reuse_render_pass = VK_NULL_HANDLE);

void destroy_swapchain(VkDevice device, SwapchainContext& ctx, bool keep_render_pass = false);

}   // namespace tracemark::vk
