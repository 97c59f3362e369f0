#include "render/vulkan/vk_backend.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <stdexcept>
#include <tracemark/logger.hpp>

namespace tracemark
{

VulkanBackend::~VulkanBackend()
{
    shutdown();
}

void VulkanBackend::init(GLFWwindow* window, bool enable_validation)
{
    if (!window)
        throw std::runtime_error("VulkanBackend::init needs a window");

    ctx_.instance = vk::create_instance(enable_validation);
    if (enable_validation)
        ctx_.debug_messenger = vk::create_debug_messenger(ctx_.instance);

    if (glfwCreateWindowSurface(ctx_.instance, window, nullptr, &surface_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create Vulkan window surface");

    ctx_.physical_device = vk::pick_physical_device(ctx_.instance, surface_);
    ctx_.queue_families  = vk::find_queue_families(ctx_.physical_device, surface_);
    ctx_.device =
        vk::create_logical_device(ctx_.physical_device, ctx_.queue_families, enable_validation);
    vkGetDeviceQueue(ctx_.device, ctx_.queue_families.graphics.value(), 0, &ctx_.graphics_queue);
    vkGetDeviceQueue(ctx_.device, ctx_.queue_families.present.value(), 0, &ctx_.present_queue);

    create_command_pool();
    create_descriptor_pool();

    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    swapchain_ = vk::create_swapchain(ctx_.device,
                                      ctx_.physical_device,
                                      surface_,
                                      static_cast<uint32_t>(w),
                                      static_cast<uint32_t>(h),
                                      ctx_.queue_families.graphics.value(),
                                      ctx_.queue_families.present.value());
    create_command_buffers();
    create_sync_objects();

    TRACEMARK_LOG_DEBUG("vulkan",
                        "Swapchain {}x{} with {} images",
                        swapchain_.extent.width,
                        swapchain_.extent.height,
                        swapchain_.images.size());
}

void VulkanBackend::wait_idle()
{
    if (ctx_.device != VK_NULL_HANDLE)
        vkDeviceWaitIdle(ctx_.device);
}

void VulkanBackend::shutdown()
{
    if (ctx_.instance == VK_NULL_HANDLE)
        return;

    wait_idle();
    if (ctx_.device != VK_NULL_HANDLE)
    {
        destroy_sync_objects();
        vk::destroy_swapchain(ctx_.device, swapchain_);
        if (descriptor_pool_ != VK_NULL_HANDLE)
            vkDestroyDescriptorPool(ctx_.device, descriptor_pool_, nullptr);
        if (command_pool_ != VK_NULL_HANDLE)
            vkDestroyCommandPool(ctx_.device, command_pool_, nullptr);
        descriptor_pool_ = VK_NULL_HANDLE;
        command_pool_    = VK_NULL_HANDLE;
        command_buffers_.clear();
        vkDestroyDevice(ctx_.device, nullptr);
    }
    if (surface_ != VK_NULL_HANDLE)
        vkDestroySurfaceKHR(ctx_.instance, surface_, nullptr);
    vk::destroy_debug_messenger(ctx_.instance, ctx_.debug_messenger);
    vkDestroyInstance(ctx_.instance, nullptr);

    surface_ = VK_NULL_HANDLE;
    ctx_     = vk::DeviceContext{};
}

bool VulkanBackend::recreate_swapchain(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0)
        return false;

    wait_idle();
    VkSwapchainKHR old      = swapchain_.swapchain;
    VkRenderPass   old_pass = swapchain_.render_pass;

    vk::SwapchainContext next;
    try
    {
        next = vk::create_swapchain(ctx_.device,
                                    ctx_.physical_device,
                                    surface_,
                                    width,
                                    height,
                                    ctx_.queue_families.graphics.value(),
                                    ctx_.queue_families.present.value(),
                                    old,
                                    old_pass);
    }
    catch (const std::exception& e)
    {
        TRACEMARK_LOG_ERROR("vulkan", "Swapchain recreation failed: {}", e.what());
        return false;
    }

    vk::destroy_swapchain(ctx_.device, swapchain_, true);
    swapchain_ = std::move(next);

    destroy_sync_objects();
    create_command_buffers();
    create_sync_objects();
    swapchain_dirty_ = false;

    TRACEMARK_LOG_DEBUG("vulkan",
                        "Swapchain recreated at {}x{}",
                        swapchain_.extent.width,
                        swapchain_.extent.height);
    return true;
}

bool VulkanBackend::begin_frame()
{
    VkResult fence_status = vkWaitForFences(ctx_.device,
                                            1,
                                            &in_flight_[current_flight_frame_],
                                            VK_TRUE,
                                            UINT64_MAX);
    if (fence_status == VK_ERROR_DEVICE_LOST)
        throw std::runtime_error("Vulkan device lost");

    VkResult result = vkAcquireNextImageKHR(ctx_.device,
                                            swapchain_.swapchain,
                                            UINT64_MAX,
                                            image_available_[current_flight_frame_],
                                            VK_NULL_HANDLE,
                                            &current_image_index_);
    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        swapchain_dirty_ = true;
        return false;
    }
    if (result == VK_SUBOPTIMAL_KHR)
        swapchain_dirty_ = true;

    vkResetFences(ctx_.device, 1, &in_flight_[current_flight_frame_]);

    current_cmd_ = command_buffers_[current_flight_frame_];
    vkResetCommandBuffer(current_cmd_, 0);

    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vkBeginCommandBuffer(current_cmd_, &begin_info);
    return true;
}

void VulkanBackend::begin_render_pass(const Color& clear_color)
{
    VkClearValue clear{};
    clear.color = {{clear_color.r, clear_color.g, clear_color.b, clear_color.a}};

    VkRenderPassBeginInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    info.renderPass      = swapchain_.render_pass;
    info.framebuffer     = swapchain_.framebuffers[current_image_index_];
    info.renderArea      = {{0, 0}, swapchain_.extent};
    info.clearValueCount = 1;
    info.pClearValues    = &clear;
    vkCmdBeginRenderPass(current_cmd_, &info, VK_SUBPASS_CONTENTS_INLINE);
}

void VulkanBackend::end_render_pass()
{
    vkCmdEndRenderPass(current_cmd_);
}

void VulkanBackend::end_frame()
{
    vkEndCommandBuffer(current_cmd_);

    // image_available follows the flight frame used for acquire; render_finished is
    // tied to the swapchain image so it is only reused once that image comes back.
    VkSemaphore          wait_semaphores[]   = {image_available_[current_flight_frame_]};
    VkSemaphore          signal_semaphores[] = {render_finished_[current_image_index_]};
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

    if (vkQueueSubmit(ctx_.graphics_queue, 1, &submit, in_flight_[current_flight_frame_])
        != VK_SUCCESS)
        throw std::runtime_error("Failed to submit frame");

    VkPresentInfoKHR present{};
    present.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores    = signal_semaphores;
    present.swapchainCount     = 1;
    present.pSwapchains        = &swapchain_.swapchain;
    present.pImageIndices      = &current_image_index_;

    VkResult result = vkQueuePresentKHR(ctx_.present_queue, &present);
    current_flight_frame_ =
        (current_flight_frame_ + 1) % static_cast<uint32_t>(in_flight_.size());

    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
        swapchain_dirty_ = true;
    else if (result != VK_SUCCESS)
        TRACEMARK_LOG_ERROR("vulkan", "Present failed with result {}", static_cast<int>(result));
}

// ─── Resource helpers ────────────────────────────────────────────────────────

void VulkanBackend::create_command_pool()
{
    VkCommandPoolCreateInfo info{};
    info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    info.queueFamilyIndex = ctx_.queue_families.graphics.value();

    if (vkCreateCommandPool(ctx_.device, &info, nullptr, &command_pool_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create command pool");
}

void VulkanBackend::create_command_buffers()
{
    if (!command_buffers_.empty())
    {
        vkFreeCommandBuffers(ctx_.device,
                             command_pool_,
                             static_cast<uint32_t>(command_buffers_.size()),
                             command_buffers_.data());
    }

    command_buffers_.resize(swapchain_.images.size());

    VkCommandBufferAllocateInfo info{};
    info.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    info.commandPool        = command_pool_;
    info.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    info.commandBufferCount = static_cast<uint32_t>(command_buffers_.size());

    if (vkAllocateCommandBuffers(ctx_.device, &info, command_buffers_.data()) != VK_SUCCESS)
        throw std::runtime_error("Failed to allocate command buffers");
}

void VulkanBackend::create_sync_objects()
{
    size_t count = swapchain_.images.size();
    image_available_.resize(count);
    render_finished_.resize(count);
    in_flight_.resize(count);
    current_flight_frame_ = 0;

    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (size_t i = 0; i < count; ++i)
    {
        if (vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &image_available_[i]) != VK_SUCCESS
            || vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &render_finished_[i])
                   != VK_SUCCESS
            || vkCreateFence(ctx_.device, &fence_info, nullptr, &in_flight_[i]) != VK_SUCCESS)
        {
            throw std::runtime_error("Failed to create sync objects");
        }
    }
}

void VulkanBackend::destroy_sync_objects()
{
    for (auto s : image_available_)
        vkDestroySemaphore(ctx_.device, s, nullptr);
    for (auto s : render_finished_)
        vkDestroySemaphore(ctx_.device, s, nullptr);
    for (auto f : in_flight_)
        vkDestroyFence(ctx_.device, f, nullptr);
    image_available_.clear();
    render_finished_.clear();
    in_flight_.clear();
}

void VulkanBackend::create_descriptor_pool()
{
    // Font atlas plus a little headroom for user textures.
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
        throw std::runtime_error("Failed to create descriptor pool");
}

}   // namespace tracemark
