#ifdef TRACEMARK_USE_GLFW

    #include "ui/app/glfw_adapter.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <tracemark/logger.hpp>

namespace tracemark
{

namespace
{

void error_callback(int code, const char* description)
{
    TRACEMARK_LOG_ERROR("app", "GLFW error {}: {}", code, description);
}

GlfwAdapter* adapter_for(GLFWwindow* window)
{
    return static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
}

}   // namespace

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    glfwSetErrorCallback(error_callback);
    if (!glfwInit())
    {
        TRACEMARK_LOG_ERROR("app", "Failed to initialize GLFW");
        return false;
    }
    initialized_ = true;

    if (!glfwVulkanSupported())
    {
        TRACEMARK_LOG_ERROR("app", "GLFW: Vulkan not supported");
        shutdown();
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(static_cast<int>(width),
                               static_cast<int>(height),
                               title.c_str(),
                               nullptr,
                               nullptr);
    if (!window_)
    {
        TRACEMARK_LOG_ERROR("app", "Failed to create GLFW window");
        shutdown();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, framebuffer_size_callback);
    glfwSetKeyCallback(window_, key_callback);
    glfwSetDropCallback(window_, drop_callback);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (initialized_)
    {
        glfwTerminate();
        initialized_ = false;
    }
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

void GlfwAdapter::wait_events(double timeout_s)
{
    glfwWaitEventsTimeout(timeout_s);
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GlfwAdapter::request_close()
{
    if (window_)
        glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    int w = 0, h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, &h);
    width  = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
}

void GlfwAdapter::set_title(const std::string& title)
{
    if (window_)
        glfwSetWindowTitle(window_, title.c_str());
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwAdapter::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_resize)
        adapter->callbacks_.on_resize(width, height);
}

void GlfwAdapter::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_key)
        adapter->callbacks_.on_key(key, action, mods);
}

void GlfwAdapter::drop_callback(GLFWwindow* window, int count, const char** paths)
{
    auto* adapter = adapter_for(window);
    if (!adapter || !adapter->callbacks_.on_drop)
        return;
    std::vector<std::string> dropped(paths, paths + count);
    adapter->callbacks_.on_drop(dropped);
}

}   // namespace tracemark

#endif   // TRACEMARK_USE_GLFW
