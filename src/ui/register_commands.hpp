#pragma once

#include <functional>
#include <tracemark/config.hpp>
#include <tracemark/fwd.hpp>
#include <vector>

namespace tracemark
{

class CommandRegistry;

namespace sync
{
class IntervalSync;
}

// What the session command lambdas act on. The callbacks are read at execution
// time, so the front-end may change what they return between frames.
struct CommandBindings
{
    CommandRegistry*                       registry = nullptr;
    SessionModel*                          model    = nullptr;
    sync::IntervalSync*                    sync     = nullptr;
    AppConfig                              config;
    std::function<std::vector<DataItem*>()> selected_items;   // Rows selected in the item list
    std::function<void()>                  quit;
};

// Registers label selection, navigation, visibility, marking and tagging commands.
// Returns false (registering nothing) when registry, model or sync is missing.
bool register_session_commands(const CommandBindings& bindings);

}   // namespace tracemark
