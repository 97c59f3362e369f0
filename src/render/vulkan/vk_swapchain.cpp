#include "render/vulkan/vk_swapchain.hpp"

#include <algorithm>
#include <stdexcept>

namespace tracemark::vk
{

SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    SwapchainSupportDetails details;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface, &details.capabilities);

    uint32_t format_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &format_count, nullptr);
    details.formats.resize(format_count);
    if (format_count > 0)
        vkGetPhysicalDeviceSurfaceFormatsKHR(device,
                                             surface,
                                             &format_count,
                                             details.formats.data());

    uint32_t mode_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &mode_count, nullptr);
    details.present_modes.resize(mode_count);
    if (mode_count > 0)
        vkGetPhysicalDeviceSurfacePresentModesKHR(device,
                                                  surface,
                                                  &mode_count,
                                                  details.present_modes.data());
    return details;
}

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats)
{
    // ImGui colours are authored in sRGB already, so a UNORM target avoids double
    // gamma correction.
    for (const auto& f : formats)
    {
        if ((f.format == VK_FORMAT_B8G8R8A8_UNORM || f.format == VK_FORMAT_R8G8B8A8_UNORM)
            && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
            return f;
    }
    return formats[0];
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& capabilities,
                         uint32_t                        width,
                         uint32_t                        height)
{
    if (capabilities.currentExtent.width != UINT32_MAX)
        return capabilities.currentExtent;

    VkExtent2D extent = {width, height};
    extent.width      = std::clamp(extent.width,
                              capabilities.minImageExtent.width,
                              capabilities.maxImageExtent.width);
    extent.height     = std::clamp(extent.height,
                               capabilities.minImageExtent.height,
                               capabilities.maxImageExtent.height);
    return extent;
}

VkRenderPass create_render_pass(VkDevice device, VkFormat color_format)
{
    VkAttachmentDescription color_attachment{};
    color_attachment.format         = color_format;
    color_attachment.samples        = VK_SAMPLE_COUNT_1_BIT;
    color_attachment.loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color_attachment.storeOp        = VK_ATTACHMENT_STORE_OP_STORE;
    color_attachment.stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color_attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color_attachment.initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    color_attachment.finalLayout    = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference color_ref{};
    color_ref.attachment = 0;
    color_ref.layout     = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint    = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments    = &color_ref;

    VkSubpassDependency dependency{};
    dependency.srcSubpass    = VK_SUBPASS_EXTERNAL;
    dependency.dstSubpass    = 0;
    dependency.srcStageMask  = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.srcAccessMask = 0;
    dependency.dstStageMask  = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    info.attachmentCount = 1;
    info.pAttachments    = &color_attachment;
    info.subpassCount    = 1;
    info.pSubpasses      = &subpass;
    info.dependencyCount = 1;
    info.pDependencies   = &dependency;

    VkRenderPass render_pass = VK_NULL_HANDLE;
    if (vkCreateRenderPass(device, &info, nullptr, &render_pass) != VK_SUCCESS)
        throw std::runtime_error("Failed to create render pass");
    return render_pass;
}

SwapchainContext create_swapchain(VkDevice         device,
                                  VkPhysicalDevice physical_device,
                                  VkSurfaceKHR     surface,
                                  uint32_t         width,
                                  uint32_t         height,
                                  uint32_t         graphics_family,
                                  uint32_t         present_family,
                                  VkSwapchainKHR   old_swapchain,
                                  VkRenderPass     reuse_render_pass)
{
    auto support = query_swapchain_support(physical_device, surface);
    if (support.formats.empty())
        throw std::runtime_error("Surface reports no formats");

    auto format = choose_surface_format(support.formats);
    auto extent = choose_extent(support.capabilities, width, height);

    uint32_t image_count = support.capabilities.minImageCount + 1;
    if (support.capabilities.maxImageCount > 0 && image_count > support.capabilities.maxImageCount)
        image_count = support.capabilities.maxImageCount;

    VkSwapchainCreateInfoKHR create_info{};
    create_info.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    create_info.surface          = surface;
    create_info.minImageCount    = image_count;
    create_info.imageFormat      = format.format;
    create_info.imageColorSpace  = format.colorSpace;
    create_info.imageExtent      = extent;
    create_info.imageArrayLayers = 1;
    create_info.imageUsage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    create_info.preTransform     = support.capabilities.currentTransform;
    create_info.compositeAlpha   = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    // FIFO is always available and keeps an idle inspector from spinning.
    create_info.presentMode  = VK_PRESENT_MODE_FIFO_KHR;
    create_info.clipped      = VK_TRUE;
    create_info.oldSwapchain = old_swapchain;

    uint32_t family_indices[] = {graphics_family, present_family};
    if (graphics_family != present_family)
    {
        create_info.imageSharingMode      = VK_SHARING_MODE_CONCURRENT;
        create_info.queueFamilyIndexCount = 2;
        create_info.pQueueFamilyIndices   = family_indices;
    }
    else
    {
        create_info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    SwapchainContext ctx;
    ctx.image_format    = format.format;
    ctx.extent          = extent;
    ctx.min_image_count = std::max<uint32_t>(2, support.capabilities.minImageCount);

    if (vkCreateSwapchainKHR(device, &create_info, nullptr, &ctx.swapchain) != VK_SUCCESS)
        throw std::runtime_error("Failed to create swapchain");

    vkGetSwapchainImagesKHR(device, ctx.swapchain, &image_count, nullptr);
    ctx.images.resize(image_count);
    vkGetSwapchainImagesKHR(device, ctx.swapchain, &image_count, ctx.images.data());

    ctx.image_views.resize(image_count);
    for (uint32_t i = 0; i < image_count; ++i)
    {
        VkImageViewCreateInfo view_info{};
        view_info.sType                           = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        view_info.image                           = ctx.images[i];
        view_info.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
        view_info.format                          = ctx.image_format;
        view_info.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
        view_info.subresourceRange.levelCount     = 1;
        view_info.subresourceRange.layerCount     = 1;

        if (vkCreateImageView(device, &view_info, nullptr, &ctx.image_views[i]) != VK_SUCCESS)
            throw std::runtime_error("Failed to create swapchain image view");
    }

    ctx.render_pass = reuse_render_pass != VK_NULL_HANDLE
                          ? reuse_render_pass
                          : create_render_pass(device, ctx.image_format);

    ctx.framebuffers.resize(image_count);
    for (uint32_t i = 0; i < image_count; ++i)
    {
        VkFramebufferCreateInfo fb_info{};
        fb_info.sType           = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        fb_info.renderPass      = ctx.render_pass;
        fb_info.attachmentCount = 1;
        fb_info.pAttachments    = &ctx.image_views[i];
        fb_info.width           = extent.width;
        fb_info.height          = extent.height;
        fb_info.layers          = 1;

        if (vkCreateFramebuffer(device, &fb_info, nullptr, &ctx.framebuffers[i]) != VK_SUCCESS)
            throw std::runtime_error("Failed to create framebuffer");
    }

    return ctx;
}

void destroy_swapchain(VkDevice device, SwapchainContext& ctx, bool keep_render_pass)
{
    for (auto fb : ctx.framebuffers)
        vkDestroyFramebuffer(device, fb, nullptr);
    ctx.framebuffers.clear();

    if (!keep_render_pass && ctx.render_pass != VK_NULL_HANDLE)
    {
        vkDestroyRenderPass(device, ctx.render_pass, nullptr);
        ctx.render_pass = VK_NULL_HANDLE;
    }

    for (auto view : ctx.image_views)
        vkDestroyImageView(device, view, nullptr);
    ctx.image_views.clear();
    ctx.images.clear();

    if (ctx.swapchain != VK_NULL_HANDLE)
    {
        vkDestroySwapchainKHR(device, ctx.swapchain, nullptr);
        ctx.swapchain = VK_NULL_HANDLE;
    }
}

}   // namespace tracemark::vk
