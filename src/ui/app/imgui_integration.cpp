#ifdef TRACEMARK_USE_IMGUI

    #include "ui/app/imgui_integration.hpp"

    #include <imgui.h>
    #include <imgui_impl_glfw.h>
    #include <imgui_impl_vulkan.h>
    #include <tracemark/logger.hpp>

    #include "render/vulkan/vk_backend.hpp"

namespace tracemark
{

ImGuiIntegration::~ImGuiIntegration()
{
    shutdown();
}

bool ImGuiIntegration::init(VulkanBackend& backend, GLFWwindow* window)
{
    if (initialized_)
        return true;
    if (!window)
        return false;

    IMGUI_CHECKVERSION();
    context_ = ImGui::CreateContext();
    ImGui::SetCurrentContext(context_);

    ImGuiIO& io    = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsLight();
    ImGuiStyle& style    = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding  = 3.0f;
    style.ItemSpacing    = ImVec2(6.0f, 4.0f);

    ImGui_ImplGlfw_InitForVulkan(window, true);
    init_vulkan_backend(backend);

    initialized_ = true;
    return true;
}

void ImGuiIntegration::init_vulkan_backend(VulkanBackend& backend)
{
    ImGui_ImplVulkan_InitInfo ii{};
    ii.Instance       = backend.instance();
    ii.PhysicalDevice = backend.physical_device();
    ii.Device         = backend.device();
    ii.QueueFamily    = backend.graphics_queue_family();
    ii.Queue          = backend.graphics_queue();
    ii.DescriptorPool = backend.descriptor_pool();
    ii.MinImageCount  = backend.min_image_count();
    ii.ImageCount     = backend.image_count();
    ii.RenderPass     = backend.render_pass();
    ii.MSAASamples    = VK_SAMPLE_COUNT_1_BIT;

    ImGui_ImplVulkan_Init(&ii);
    ImGui_ImplVulkan_CreateFontsTexture();
    cached_render_pass_ = reinterpret_cast<uint64_t>(ii.RenderPass);
}

void ImGuiIntegration::shutdown()
{
    if (!initialized_)
        return;

    ImGui::SetCurrentContext(context_);
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext(context_);
    context_     = nullptr;
    initialized_ = false;
}

void ImGuiIntegration::new_frame()
{
    if (!initialized_)
        return;
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void ImGuiIntegration::render(VulkanBackend& backend)
{
    if (!initialized_)
        return;
    ImGui::Render();
    if (auto* dd = ImGui::GetDrawData())
        ImGui_ImplVulkan_RenderDrawData(dd, backend.current_command_buffer());
}

void ImGuiIntegration::on_swapchain_recreated(VulkanBackend& backend)
{
    if (!initialized_)
        return;

    ImGui_ImplVulkan_SetMinImageCount(backend.min_image_count());

    // The render pass is reused across resizes; re-init only if it changed anyway.
    auto current = reinterpret_cast<uint64_t>(backend.render_pass());
    if (current != cached_render_pass_)
    {
        TRACEMARK_LOG_WARN("imgui", "Render pass changed, reinitializing the Vulkan backend");
        ImGui_ImplVulkan_Shutdown();
        init_vulkan_backend(backend);
    }
}

bool ImGuiIntegration::wants_capture_keyboard() const
{
    return initialized_ && ImGui::GetIO().WantCaptureKeyboard;
}

}   // namespace tracemark

#endif   // TRACEMARK_USE_IMGUI
