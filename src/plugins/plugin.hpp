#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <tracemark/config.hpp>
#include <tracemark/fwd.hpp>
#include <vector>

namespace tracemark
{

// Services a plugin may use while bound.
struct PluginHost
{
    SessionModel& model;
    AppConfig     config;
};

// Menu entry contributed by a plugin. Registered as command "<plugin>.<id>".
struct PluginAction
{
    std::string           id;
    std::string           label;
    std::function<void()> callback;
};

// Command-line entry point. Takes the JSON argument object given on the command
// line and returns false when it cannot be run with it.
using CliAction = std::function<bool(const std::string& json_args)>;

// An optional capability. bind() connects the plugin to the model's events and is
// called once; destroy() undoes it and is called before the plugin is dropped.
class Plugin
{
   public:
    virtual ~Plugin() = default;

    virtual std::string name() const = 0;

    virtual void bind(PluginHost& host) = 0;
    virtual void destroy() {}

    virtual std::vector<PluginAction>        actions() { return {}; }
    virtual std::map<std::string, CliAction> cli_actions() { return {}; }
};

using PluginFactory  = std::function<std::unique_ptr<Plugin>(const AppConfig& config)>;
using PluginRegistry = std::map<std::string, PluginFactory>;

// The plugins compiled into tracemark, by name. Built on first use and never
// modified afterwards.
const PluginRegistry& builtin_plugins();

}   // namespace tracemark
