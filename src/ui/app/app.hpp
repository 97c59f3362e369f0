#pragma once

#include <memory>
#include <string>
#include <tracemark/config.hpp>
#include <tracemark/session_model.hpp>
#include <vector>

#include "anim/redraw_debouncer.hpp"
#include "plugins/plugin_manager.hpp"
#include "sync/interval_sync.hpp"
#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"

namespace tracemark
{

class GlfwAdapter;
class ImGuiIntegration;
class SessionPanels;
class VulkanBackend;

// The desktop inspector: one window with the outline and detail plots over a
// session model. Construction wires the model, views, commands and plugins;
// run() opens the window and blocks until it is closed.
class App
{
   public:
    explicit App(const AppConfig& config);
    ~App();

    App(const App&)            = delete;
    App& operator=(const App&) = delete;

    SessionModel&       model() { return model_; }
    sync::IntervalSync& sync() { return sync_; }
    PluginManager&      plugins() { return plugins_; }
    CommandRegistry&    commands() { return commands_; }

    size_t load_paths(const std::vector<std::string>& paths);

    // Returns the process exit code.
    int  run();
    void quit();

   private:
    void on_key(int key, int action, int mods);
    void draw_frame();
    void update_title();

    AppConfig          config_;
    SessionModel       model_;
    sync::IntervalSync sync_;
    CommandRegistry    commands_;
    ShortcutManager    shortcuts_;
    PluginManager      plugins_;
    RedrawDebouncer    redraw_;

    std::unique_ptr<GlfwAdapter>      glfw_;
    std::unique_ptr<VulkanBackend>    backend_;
    std::unique_ptr<ImGuiIntegration> imgui_;
    std::unique_ptr<SessionPanels>    panels_;

    bool quit_requested_ = false;
    bool needs_redraw_   = true;
    bool resize_pending_ = false;
};

}   // namespace tracemark
