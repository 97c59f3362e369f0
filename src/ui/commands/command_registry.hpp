#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracemark
{

// Something the user can trigger from a menu, a key, or a plugin action.
struct Command
{
    std::string           id;         // Unique identifier, e.g. "view.move_left"
    std::string           label;      // Display label, e.g. "Move interval left"
    std::string           category;   // Menu the command is listed under
    std::string           shortcut;   // Human-readable shortcut, e.g. "Ctrl+R"
    std::function<void()> callback;
    bool                  enabled = true;
};

// Central table of commands, keyed by id.
// Thread-safe; callbacks run outside the lock so they may register or unregister.
class CommandRegistry
{
   public:
    CommandRegistry()  = default;
    ~CommandRegistry() = default;

    CommandRegistry(const CommandRegistry&)            = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // Overwrites a command with the same id.
    void register_command(Command cmd);
    void register_command(const std::string&    id,
                          const std::string&    label,
                          std::function<void()> callback,
                          const std::string&    shortcut = "",
                          const std::string&    category = "General");

    void unregister_command(const std::string& id);

    // Returns false if the command is unknown or disabled.
    bool execute(const std::string& id);

    const Command* find(const std::string& id) const;

    // Sorted by category, then label.
    std::vector<const Command*> all_commands() const;
    std::vector<const Command*> commands_in_category(const std::string& category) const;
    std::vector<std::string>    categories() const;

    size_t count() const;

    void set_enabled(const std::string& id, bool enabled);

    uint64_t execution_count() const { return executions_; }

   private:
    mutable std::mutex                       mutex_;
    std::unordered_map<std::string, Command> commands_;
    uint64_t                                 executions_ = 0;
};

}   // namespace tracemark
