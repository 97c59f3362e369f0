#pragma once

#ifdef TRACEMARK_USE_IMGUI

    #include <cstdint>

struct GLFWwindow;
struct ImGuiContext;

namespace tracemark
{

class VulkanBackend;

// Dear ImGui context bound to the GLFW window and the Vulkan render pass.
class ImGuiIntegration
{
   public:
    ImGuiIntegration() = default;
    ~ImGuiIntegration();

    ImGuiIntegration(const ImGuiIntegration&)            = delete;
    ImGuiIntegration& operator=(const ImGuiIntegration&) = delete;

    bool init(VulkanBackend& backend, GLFWwindow* window);
    void shutdown();

    void new_frame();
    // Records the frame's draw data into the backend's current command buffer.
    void render(VulkanBackend& backend);

    void on_swapchain_recreated(VulkanBackend& backend);

    bool wants_capture_keyboard() const;

   private:
    void init_vulkan_backend(VulkanBackend& backend);

    ImGuiContext* context_            = nullptr;
    uint64_t      cached_render_pass_ = 0;
    bool          initialized_        = false;
};

}   // namespace tracemark

#endif   // TRACEMARK_USE_IMGUI
