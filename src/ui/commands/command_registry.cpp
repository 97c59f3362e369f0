#include "ui/commands/command_registry.hpp"

#include <algorithm>
#include <tracemark/logger.hpp>

namespace tracemark
{

// ─── Registration ────────────────────────────────────────────────────────────

void CommandRegistry::register_command(Command cmd)
{
    std::lock_guard lock(mutex_);
    std::string     id = cmd.id;
    commands_[id]      = std::move(cmd);
}

void CommandRegistry::register_command(const std::string&    id,
                                       const std::string&    label,
                                       std::function<void()> callback,
                                       const std::string&    shortcut,
                                       const std::string&    category)
{
    Command cmd;
    cmd.id       = id;
    cmd.label    = label;
    cmd.callback = std::move(callback);
    cmd.shortcut = shortcut;
    cmd.category = category;
    register_command(std::move(cmd));
}

void CommandRegistry::unregister_command(const std::string& id)
{
    std::lock_guard lock(mutex_);
    commands_.erase(id);
}

// ─── Execution ───────────────────────────────────────────────────────────────

bool CommandRegistry::execute(const std::string& id)
{
    std::function<void()> cb;
    {
        std::lock_guard lock(mutex_);
        auto            it = commands_.find(id);
        if (it == commands_.end() || !it->second.enabled || !it->second.callback)
        {
            TRACEMARK_LOG_DEBUG("app", "Command '{}' is not available", id);
            return false;
        }
        cb = it->second.callback;
        ++executions_;
    }
    TRACEMARK_LOG_TRACE("app", "Running command '{}'", id);
    cb();
    return true;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const Command* CommandRegistry::find(const std::string& id) const
{
    std::lock_guard lock(mutex_);
    auto            it = commands_.find(id);
    return it != commands_.end() ? &it->second : nullptr;
}

std::vector<const Command*> CommandRegistry::all_commands() const
{
    std::lock_guard             lock(mutex_);
    std::vector<const Command*> result;
    result.reserve(commands_.size());
    for (const auto& [id, cmd] : commands_)
        result.push_back(&cmd);
    std::sort(result.begin(),
              result.end(),
              [](const Command* a, const Command* b)
              {
                  if (a->category != b->category)
                      return a->category < b->category;
                  return a->label < b->label;
              });
    return result;
}

std::vector<const Command*> CommandRegistry::commands_in_category(const std::string& category) const
{
    std::lock_guard             lock(mutex_);
    std::vector<const Command*> result;
    for (const auto& [id, cmd] : commands_)
    {
        if (cmd.category == category)
            result.push_back(&cmd);
    }
    std::sort(result.begin(),
              result.end(),
              [](const Command* a, const Command* b) { return a->label < b->label; });
    return result;
}

std::vector<std::string> CommandRegistry::categories() const
{
    std::lock_guard          lock(mutex_);
    std::vector<std::string> cats;
    for (const auto& [id, cmd] : commands_)
    {
        if (std::find(cats.begin(), cats.end(), cmd.category) == cats.end())
            cats.push_back(cmd.category);
    }
    std::sort(cats.begin(), cats.end());
    return cats;
}

size_t CommandRegistry::count() const
{
    std::lock_guard lock(mutex_);
    return commands_.size();
}

void CommandRegistry::set_enabled(const std::string& id, bool enabled)
{
    std::lock_guard lock(mutex_);
    auto            it = commands_.find(id);
    if (it != commands_.end())
        it->second.enabled = enabled;
}

}   // namespace tracemark
