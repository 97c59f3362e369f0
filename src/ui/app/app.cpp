#include "ui/app/app.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <tracemark/logger.hpp>

#include "data/csv_loader.hpp"
#include "render/vulkan/vk_backend.hpp"
#include "ui/app/glfw_adapter.hpp"
#include "ui/app/imgui_integration.hpp"
#include "ui/app/session_panels.hpp"
#include "ui/register_commands.hpp"

namespace tracemark
{

namespace
{

constexpr uint32_t kInitialWidth  = 1400;
constexpr uint32_t kInitialHeight = 900;
constexpr double   kIdleWait      = 0.25;   // Seconds between frames with no input
const Color        kClearColor{0.94f, 0.94f, 0.94f, 1.0f};

}   // namespace

// ─── App ─────────────────────────────────────────────────────────────────────

App::App(const AppConfig& config)
    : config_(config),
      sync_(model_, config_),
      plugins_(model_, config_),
      redraw_(std::chrono::milliseconds(config_.redraw_delay_ms))
{
    shortcuts_.set_command_registry(&commands_);
    shortcuts_.register_defaults();

    CommandBindings bindings;
    bindings.registry       = &commands_;
    bindings.model          = &model_;
    bindings.sync           = &sync_;
    bindings.config         = config_;
    bindings.selected_items = [this]()
    { return panels_ ? panels_->selected_items() : std::vector<DataItem*>{}; };
    bindings.quit = [this]() { quit(); };
    if (!register_session_commands(bindings))
        throw std::runtime_error("Session commands could not be registered");

    plugins_.set_command_registry(&commands_);
    size_t enabled = plugins_.enable_configured();
    TRACEMARK_LOG_DEBUG("app", "{} plugins enabled, {} commands", enabled, commands_.count());

    sync_.set_on_redraw_request([this]() { redraw_.request(); });
    redraw_.set_callback([this]() { needs_redraw_ = true; });
}

App::~App()
{
    if (backend_)
        backend_->wait_idle();
    panels_.reset();
    imgui_.reset();
    backend_.reset();
    glfw_.reset();
}

size_t App::load_paths(const std::vector<std::string>& paths)
{
    size_t added = load_csv_paths(model_, paths);
    TRACEMARK_LOG_INFO("app", "Loaded {} items from {} paths", added, paths.size());
    return added;
}

void App::quit()
{
    quit_requested_ = true;
    if (glfw_)
        glfw_->request_close();
}

void App::on_key(int key, int action, int mods)
{
    if (imgui_ && imgui_->wants_capture_keyboard())
        return;
    shortcuts_.on_key(key, action, mods);
}

void App::update_title()
{
    if (!glfw_)
        return;
    std::string title = "tracemark";
    if (auto active = model_.active_label())
        title += " [" + std::string(label_id(*active)) + "]";
    title += " - " + std::to_string(model_.item_count()) + " items";
    glfw_->set_title(title);
}

int App::run()
{
    glfw_ = std::make_unique<GlfwAdapter>();
    if (!glfw_->init(kInitialWidth, kInitialHeight, "tracemark"))
        return 1;

    backend_ = std::make_unique<VulkanBackend>();
    try
    {
        backend_->init(glfw_->window());
    }
    catch (const std::runtime_error& e)
    {
        TRACEMARK_LOG_CRITICAL("app", "Vulkan start-up failed: {}", e.what());
        return 1;
    }

    imgui_ = std::make_unique<ImGuiIntegration>();
    if (!imgui_->init(*backend_, glfw_->window()))
    {
        TRACEMARK_LOG_CRITICAL("app", "ImGui start-up failed");
        return 1;
    }
    panels_ = std::make_unique<SessionPanels>(model_, sync_, commands_, shortcuts_, config_);

    InputCallbacks callbacks;
    callbacks.on_key    = [this](int key, int action, int mods) { on_key(key, action, mods); };
    callbacks.on_resize = [this](int, int) { resize_pending_ = true; };
    callbacks.on_drop   = [this](const std::vector<std::string>& paths)
    { panels_->set_status("Loaded " + std::to_string(load_paths(paths)) + " items"); };
    glfw_->set_callbacks(callbacks);

    TRACEMARK_LOG_INFO("app", "Window open with {} items", model_.item_count());

    while (!quit_requested_ && !glfw_->should_close())
    {
        double wait = kIdleWait;
        if (auto deadline = redraw_.deadline())
        {
            auto left = std::chrono::duration<double>(*deadline - RedrawDebouncer::Clock::now());
            wait      = std::clamp(left.count(), 0.0, kIdleWait);
        }
        glfw_->wait_events(wait);

        if (redraw_.poll() || needs_redraw_)
        {
            update_title();
            needs_redraw_ = false;
        }

        if (resize_pending_ || backend_->swapchain_dirty())
        {
            uint32_t w = 0, h = 0;
            glfw_->framebuffer_size(w, h);
            if (w == 0 || h == 0)
                continue;   // Minimized
            if (backend_->recreate_swapchain(w, h))
            {
                imgui_->on_swapchain_recreated(*backend_);
                resize_pending_ = false;
            }
        }

        draw_frame();
    }

    backend_->wait_idle();
    TRACEMARK_LOG_INFO("app", "Window closed");
    return 0;
}

void App::draw_frame()
{
    if (!backend_->begin_frame())
        return;

    imgui_->new_frame();
    panels_->draw();

    backend_->begin_render_pass(kClearColor);
    imgui_->render(*backend_);
    backend_->end_render_pass();
    backend_->end_frame();
}

}   // namespace tracemark
