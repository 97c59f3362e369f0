#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracemark
{

class CommandRegistry;

// Modifier flags (matching GLFW modifier bits)
enum class KeyMod : uint8_t
{
    None    = 0,
    Shift   = 0x01,
    Control = 0x02,
    Alt     = 0x04,
    Super   = 0x08,
};

inline KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}

// GLFW key codes used by the default bindings. Kept here so that nothing outside
// the app needs GLFW headers.
namespace keys
{
inline constexpr int Space  = 32;
inline constexpr int Minus  = 45;
inline constexpr int Num0   = 48;
inline constexpr int Num9   = 57;
inline constexpr int A      = 65;
inline constexpr int Z      = 90;
inline constexpr int Escape = 256;
inline constexpr int Enter  = 257;
inline constexpr int Tab    = 258;
inline constexpr int Delete = 261;
inline constexpr int Right  = 262;
inline constexpr int Left   = 263;
inline constexpr int F1     = 290;
inline constexpr int F12    = 301;

constexpr int letter(char c)
{
    return (c >= 'a' && c <= 'z') ? c - 'a' + A : c;
}
}   // namespace keys

// Key + modifiers.
struct Shortcut
{
    int    key  = 0;   // GLFW key code
    KeyMod mods = KeyMod::None;

    bool operator==(const Shortcut& o) const { return key == o.key && mods == o.mods; }
    bool operator!=(const Shortcut& o) const { return !(*this == o); }

    // e.g. "Ctrl+R", "Space", "-"
    std::string to_string() const;

    // Inverse of to_string(). Returns an invalid shortcut on failure.
    static Shortcut from_string(const std::string& str);

    bool valid() const { return key != 0; }
};

struct ShortcutHash
{
    size_t operator()(const Shortcut& s) const
    {
        return std::hash<int>()(s.key) ^ (std::hash<uint8_t>()(static_cast<uint8_t>(s.mods)) << 16);
    }
};

struct ShortcutBinding
{
    Shortcut    shortcut;
    std::string command_id;
};

// Maps key presses to command ids and runs them through a CommandRegistry.
class ShortcutManager
{
   public:
    ShortcutManager()  = default;
    ~ShortcutManager() = default;

    ShortcutManager(const ShortcutManager&)            = delete;
    ShortcutManager& operator=(const ShortcutManager&) = delete;

    void             set_command_registry(CommandRegistry* registry) { registry_ = registry; }
    CommandRegistry* command_registry() const { return registry_; }

    // Replaces any existing binding for the shortcut.
    void bind(Shortcut shortcut, const std::string& command_id);
    void unbind(const Shortcut& shortcut);
    void unbind_command(const std::string& command_id);

    // Empty string if unbound.
    std::string command_for_shortcut(const Shortcut& shortcut) const;
    // Invalid shortcut if unbound.
    Shortcut shortcut_for_command(const std::string& command_id) const;

    std::vector<ShortcutBinding> all_bindings() const;

    // key: GLFW key code, action: GLFW_PRESS/RELEASE/REPEAT, mods: GLFW modifier bits.
    // Returns true if a command ran.
    bool on_key(int key, int action, int mods);

    // Label selection (Ctrl+letter) and the session commands.
    void register_defaults();

    size_t count() const;
    void   clear();

   private:
    CommandRegistry*                                        registry_ = nullptr;
    mutable std::mutex                                      mutex_;
    std::unordered_map<Shortcut, std::string, ShortcutHash> bindings_;

    static constexpr int kGlfwPress = 1;
};

}   // namespace tracemark
