#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "plugins/plugin.hpp"

namespace tracemark
{

class CommandRegistry;

// Creates, binds and tears down plugins picked from a registry, and exposes their
// actions as commands in category "Plugins".
class PluginManager
{
   public:
    PluginManager(SessionModel&    model,
                  const AppConfig& config,
                  PluginRegistry   registry = builtin_plugins());
    ~PluginManager();

    PluginManager(const PluginManager&)            = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    // Commands of plugins enabled before this call are registered too.
    void set_command_registry(CommandRegistry* registry);

    // Returns false for unknown names. Enabling twice is a no-op.
    bool enable(const std::string& name);
    bool disable(const std::string& name);
    void disable_all();

    // Enables config.enabled_plugins; returns how many were enabled.
    size_t enable_configured();

    bool    is_enabled(const std::string& name) const;
    Plugin* find(const std::string& name) const;

    std::vector<std::string> available() const;
    std::vector<std::string> enabled() const;
    size_t                   plugin_count() const { return loaded_.size(); }

    // Runs `action` of an enabled plugin. False if either is unknown or the action failed.
    bool run_cli_action(const std::string& plugin,
                        const std::string& action,
                        const std::string& json_args);

   private:
    struct Loaded
    {
        std::unique_ptr<Plugin>  plugin;
        std::vector<std::string> registered_commands;
    };

    void register_actions(Loaded& loaded);
    void unregister_actions(Loaded& loaded);

    PluginHost                    host_;
    PluginRegistry                registry_;
    CommandRegistry*              commands_ = nullptr;
    std::map<std::string, Loaded> loaded_;
};

}   // namespace tracemark
