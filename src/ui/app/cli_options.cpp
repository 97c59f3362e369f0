#include "ui/app/cli_options.hpp"

namespace tracemark
{

namespace
{

bool is_flag(const std::string& arg)
{
    return arg.size() > 1 && arg[0] == '-';
}

}   // namespace

CliOptions parse_cli(const std::vector<std::string>& args)
{
    CliOptions opts;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help")
        {
            opts.help = true;
            continue;
        }

        if (arg == "--config" || arg == "--log-level")
        {
            if (i + 1 >= args.size())
            {
                opts.error = arg + " needs a value";
                return opts;
            }
            (arg == "--config" ? opts.config_path : opts.log_level) = args[++i];
            continue;
        }

        if (arg.rfind("--", 0) == 0 && arg.size() > 2)
        {
            PluginInvocation call;
            call.plugin = arg.substr(2);
            if (i + 1 >= args.size() || is_flag(args[i + 1]))
            {
                opts.error = arg + " needs an action name";
                return opts;
            }
            call.action = args[++i];
            if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] == '{')
                call.json_args = args[++i];
            opts.plugin_actions.push_back(std::move(call));
            continue;
        }

        if (is_flag(arg))
        {
            opts.error = "Unknown option " + arg;
            return opts;
        }

        opts.files.push_back(arg);
    }
    return opts;
}

std::string usage_text(const std::string& program)
{
    return "Usage: " + program
           + " [options] [file.csv | directory]...\n"
             "\n"
             "Options:\n"
             "  --config <path>              Read settings from <path>\n"
             "  --log-level <level>          trace, debug, info, warn, error or critical\n"
             "  --<Plugin> <action> ['json'] Run a plugin action after start-up, e.g.\n"
             "                               --RandomGenerator generate '{\"days\": 2}'\n"
             "  -h, --help                   Show this text\n";
}

}   // namespace tracemark
