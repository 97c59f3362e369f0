#pragma once

#ifdef TRACEMARK_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>
    #include <vector>

struct GLFWwindow;

namespace tracemark
{

struct InputCallbacks
{
    std::function<void(int width, int height)>              on_resize;
    std::function<void(int key, int action, int mods)>      on_key;
    std::function<void(const std::vector<std::string>& paths)> on_drop;
};

// Owns the GLFW library and the main window. The window carries no client API;
// Vulkan renders into it.
class GlfwAdapter
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    void poll_events();
    // Blocks until an event arrives or `timeout_s` passes.
    void wait_events(double timeout_s);

    bool should_close() const;
    void request_close();

    GLFWwindow* window() const { return window_; }
    void        framebuffer_size(uint32_t& width, uint32_t& height) const;
    void        set_title(const std::string& title);

    void set_callbacks(const InputCallbacks& callbacks) { callbacks_ = callbacks; }

   private:
    GLFWwindow*    window_      = nullptr;
    bool           initialized_ = false;
    InputCallbacks callbacks_;

    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void drop_callback(GLFWwindow* window, int count, const char** paths);
};

}   // namespace tracemark

#endif   // TRACEMARK_USE_GLFW
