#pragma once

#include <cstdint>
#include <tracemark/color.hpp>
#include <vector>

#include "render/vulkan/vk_device.hpp"
#include "render/vulkan/vk_swapchain.hpp"

struct GLFWwindow;

namespace tracemark
{

// Window-bound Vulkan context for the UI layer: device, swapchain, one command
// buffer and sync set per swapchain image, and a descriptor pool for the ImGui
// backend. All drawing happens through ImGui inside one render pass per frame.
class VulkanBackend
{
   public:
    VulkanBackend() = default;
    ~VulkanBackend();

    VulkanBackend(const VulkanBackend&)            = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    // Throws std::runtime_error if no usable device or surface can be created.
    void init(GLFWwindow* window, bool enable_validation = false);
    void shutdown();
    void wait_idle();

    bool recreate_swapchain(uint32_t width, uint32_t height);
    bool swapchain_dirty() const { return swapchain_dirty_; }

    // False when the swapchain is out of date; recreate and skip the frame.
    bool begin_frame();
    void begin_render_pass(const Color& clear_color);
    void end_render_pass();
    void end_frame();

    // ─── ImGui backend accessors ─────────────────────────────────────────────

    VkInstance       instance() const { return ctx_.instance; }
    VkPhysicalDevice physical_device() const { return ctx_.physical_device; }
    VkDevice         device() const { return ctx_.device; }
    uint32_t         graphics_queue_family() const { return ctx_.queue_families.graphics.value(); }
    VkQueue          graphics_queue() const { return ctx_.graphics_queue; }
    VkDescriptorPool descriptor_pool() const { return descriptor_pool_; }
    uint32_t         min_image_count() const { return swapchain_.min_image_count; }
    uint32_t         image_count() const { return static_cast<uint32_t>(swapchain_.images.size()); }
    VkRenderPass     render_pass() const { return swapchain_.render_pass; }
    VkCommandBuffer  current_command_buffer() const { return current_cmd_; }

   private:
    void create_command_pool();
    void create_command_buffers();
    void create_sync_objects();
    void destroy_sync_objects();
    void create_descriptor_pool();

    vk::DeviceContext     ctx_;
    VkSurfaceKHR          surface_ = VK_NULL_HANDLE;
    vk::SwapchainContext  swapchain_;
    VkCommandPool         command_pool_    = VK_NULL_HANDLE;
    VkDescriptorPool      descriptor_pool_ = VK_NULL_HANDLE;

    std::vector<VkCommandBuffer> command_buffers_;
    std::vector<VkSemaphore>     image_available_;
    std::vector<VkSemaphore>     render_finished_;
    std::vector<VkFence>         in_flight_;

    VkCommandBuffer current_cmd_          = VK_NULL_HANDLE;
    uint32_t        current_image_index_  = 0;
    uint32_t        current_flight_frame_ = 0;
    bool            swapchain_dirty_      = false;
};

}   // namespace tracemark
