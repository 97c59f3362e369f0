#include "plugins/plugin_manager.hpp"

#include <tracemark/logger.hpp>

#include "plugins/markings_io.hpp"
#include "plugins/random_generator.hpp"
#include "ui/commands/command_registry.hpp"

namespace tracemark
{

const PluginRegistry& builtin_plugins()
{
    static const PluginRegistry registry = {
        {MarkingsIO::kName,
         [](const AppConfig& config) -> std::unique_ptr<Plugin>
         { return std::make_unique<MarkingsIO>(make_marking_store(config)); }},
        {RandomGenerator::kName,
         [](const AppConfig&) -> std::unique_ptr<Plugin>
         { return std::make_unique<RandomGenerator>(); }},
    };
    return registry;
}

PluginManager::PluginManager(SessionModel& model, const AppConfig& config, PluginRegistry registry)
    : host_{model, config}, registry_(std::move(registry))
{
}

PluginManager::~PluginManager()
{
    disable_all();
}

void PluginManager::set_command_registry(CommandRegistry* registry)
{
    for (auto& [name, loaded] : loaded_)
        unregister_actions(loaded);
    commands_ = registry;
    for (auto& [name, loaded] : loaded_)
        register_actions(loaded);
}

bool PluginManager::enable(const std::string& name)
{
    if (loaded_.count(name) > 0)
        return true;

    auto factory = registry_.find(name);
    if (factory == registry_.end())
    {
        TRACEMARK_LOG_ERROR("plugin", "No plugin named '{}'", name);
        return false;
    }

    Loaded loaded;
    loaded.plugin = factory->second(host_.config);
    if (!loaded.plugin)
    {
        TRACEMARK_LOG_ERROR("plugin", "Plugin '{}' could not be created", name);
        return false;
    }
    loaded.plugin->bind(host_);
    register_actions(loaded);

    loaded_.emplace(name, std::move(loaded));
    TRACEMARK_LOG_INFO("plugin", "Enabled plugin {}", name);
    return true;
}

bool PluginManager::disable(const std::string& name)
{
    auto it = loaded_.find(name);
    if (it == loaded_.end())
        return false;

    unregister_actions(it->second);
    it->second.plugin->destroy();
    loaded_.erase(it);
    TRACEMARK_LOG_INFO("plugin", "Disabled plugin {}", name);
    return true;
}

void PluginManager::disable_all()
{
    while (!loaded_.empty())
        disable(loaded_.begin()->first);
}

size_t PluginManager::enable_configured()
{
    size_t n = 0;
    for (const auto& name : host_.config.enabled_plugins)
    {
        if (enable(name))
            ++n;
    }
    return n;
}

bool PluginManager::is_enabled(const std::string& name) const
{
    return loaded_.count(name) > 0;
}

Plugin* PluginManager::find(const std::string& name) const
{
    auto it = loaded_.find(name);
    return it != loaded_.end() ? it->second.plugin.get() : nullptr;
}

std::vector<std::string> PluginManager::available() const
{
    std::vector<std::string> names;
    for (const auto& [name, factory] : registry_)
        names.push_back(name);
    return names;
}

std::vector<std::string> PluginManager::enabled() const
{
    std::vector<std::string> names;
    for (const auto& [name, loaded] : loaded_)
        names.push_back(name);
    return names;
}

bool PluginManager::run_cli_action(const std::string& plugin,
                                   const std::string& action,
                                   const std::string& json_args)
{
    Plugin* p = find(plugin);
    if (!p)
    {
        TRACEMARK_LOG_ERROR("plugin", "Plugin '{}' is not enabled", plugin);
        return false;
    }
    auto actions = p->cli_actions();
    auto it      = actions.find(action);
    if (it == actions.end())
    {
        TRACEMARK_LOG_ERROR("plugin", "Plugin '{}' has no action '{}'", plugin, action);
        return false;
    }
    TRACEMARK_LOG_INFO("plugin", "Running {} {} {}", plugin, action, json_args);
    return it->second(json_args);
}

void PluginManager::register_actions(Loaded& loaded)
{
    if (!commands_)
        return;
    std::string prefix = loaded.plugin->name();
    for (auto& action : loaded.plugin->actions())
    {
        std::string id = prefix + "." + action.id;
        commands_->register_command(id, action.label, std::move(action.callback), "", "Plugins");
        loaded.registered_commands.push_back(id);
    }
}

void PluginManager::unregister_actions(Loaded& loaded)
{
    if (commands_)
    {
        for (const auto& id : loaded.registered_commands)
            commands_->unregister_command(id);
    }
    loaded.registered_commands.clear();
}

}   // namespace tracemark
