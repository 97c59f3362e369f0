#include <iostream>
#include <stdexcept>
#include <tracemark/config.hpp>
#include <tracemark/logger.hpp>

#include "ui/app/app.hpp"
#include "ui/app/cli_options.hpp"

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    tracemark::CliOptions    opts = tracemark::parse_cli(args);
    if (!opts.ok())
    {
        std::cerr << opts.error << "\n\n" << tracemark::usage_text(argv[0]);
        return 2;
    }
    if (opts.help)
    {
        std::cout << tracemark::usage_text(argv[0]);
        return 0;
    }

    tracemark::AppConfig config;
    std::string          config_path =
        opts.config_path.empty() ? tracemark::AppConfig::default_path() : opts.config_path;
    bool config_loaded = config.load(config_path);
    config.apply_environment();
    if (!opts.log_level.empty())
        config.log_level = opts.log_level;
    tracemark::configure_logging(config);

    if (config_loaded)
        TRACEMARK_LOG_INFO("config", "Using {}", config_path);
    else if (!opts.config_path.empty())
        TRACEMARK_LOG_WARN("config", "Cannot read {}, using defaults", config_path);

    try
    {
        tracemark::App app(config);
        app.load_paths(opts.files);

        for (const auto& call : opts.plugin_actions)
        {
            if (!app.plugins().enable(call.plugin))
            {
                TRACEMARK_LOG_ERROR("app", "Unknown plugin {}", call.plugin);
                return 2;
            }
            if (!app.plugins().run_cli_action(call.plugin, call.action, call.json_args))
            {
                TRACEMARK_LOG_ERROR("app", "{} {} failed", call.plugin, call.action);
                return 1;
            }
        }

        return app.run();
    }
    catch (const std::exception& e)
    {
        TRACEMARK_LOG_CRITICAL("app", "{}", e.what());
        return 1;
    }
}
