#pragma once

#include <string>
#include <vector>

namespace tracemark
{

// `--<Plugin> <action> ['<json>']` on the command line.
struct PluginInvocation
{
    std::string plugin;
    std::string action;
    std::string json_args = "{}";
};

struct CliOptions
{
    std::vector<std::string>      files;   // CSV files or directories to load
    std::string                   config_path;
    std::string                   log_level;
    std::vector<PluginInvocation> plugin_actions;
    bool                          help = false;
    std::string                   error;   // Non-empty when parsing failed

    bool ok() const { return error.empty(); }
};

// args excludes argv[0].
CliOptions parse_cli(const std::vector<std::string>& args);

std::string usage_text(const std::string& program);

}   // namespace tracemark
