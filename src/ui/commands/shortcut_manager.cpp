#include "ui/commands/shortcut_manager.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <string_view>
#include <tracemark/label.hpp>

#include "ui/commands/command_registry.hpp"

namespace tracemark
{

namespace
{

struct NamedKey
{
    int              key;
    std::string_view name;    // canonical spelling, used by to_string()
    std::string_view alias;   // accepted by from_string() only
};

constexpr NamedKey kNamedKeys[] = {
    {keys::Space, "Space", "space"},
    {keys::Minus, "-", "minus"},
    {keys::Escape, "Escape", "esc"},
    {keys::Enter, "Enter", "return"},
    {keys::Tab, "Tab", "tab"},
    {keys::Delete, "Delete", "del"},
    {keys::Right, "Right", "right"},
    {keys::Left, "Left", "left"},
};

struct NamedMod
{
    KeyMod           mod;
    std::string_view name;
    std::string_view aliases[3];
};

// Order here is the order to_string() writes modifiers in.
constexpr NamedMod kNamedMods[] = {
    {KeyMod::Control, "Ctrl", {"ctrl", "control", {}}},
    {KeyMod::Shift, "Shift", {"shift", {}, {}}},
    {KeyMod::Alt, "Alt", {"alt", {}, {}}},
    {KeyMod::Super, "Super", {"super", "meta", "cmd"}},
};

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Positive number spelled by `digits`, or 0.
int parse_number(std::string_view digits)
{
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
        return 0;
    return value;
}

std::string key_name(int key)
{
    bool letter = key >= keys::A && key <= keys::Z;
    bool digit  = key >= keys::Num0 && key <= keys::Num9;
    if (letter || digit)
        return std::string(1, static_cast<char>(key));
    if (key >= keys::F1 && key <= keys::F12)
        return "F" + std::to_string(key - keys::F1 + 1);
    for (const auto& named : kNamedKeys)
    {
        if (named.key == key)
            return std::string(named.name);
    }
    return "Key" + std::to_string(key);
}

int key_from_name(std::string_view name)
{
    for (const auto& named : kNamedKeys)
    {
        if (iequals(name, named.name) || iequals(name, named.alias))
            return named.key;
    }

    if (name.size() == 1)
    {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
        bool alnum = (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        return alnum ? c : 0;
    }

    if (name.size() >= 2 && (name[0] == 'f' || name[0] == 'F'))
    {
        int n = parse_number(name.substr(1));
        if (n >= 1 && n <= 12)
            return keys::F1 + n - 1;
    }
    if (name.size() > 3 && iequals(name.substr(0, 3), "key"))
        return parse_number(name.substr(3));
    return 0;
}

std::optional<KeyMod> mod_from_name(std::string_view name)
{
    for (const auto& named : kNamedMods)
    {
        for (std::string_view alias : named.aliases)
        {
            if (!alias.empty() && iequals(name, alias))
                return named.mod;
        }
    }
    return std::nullopt;
}

}   // namespace

// ─── Shortcut string conversion ──────────────────────────────────────────────

std::string Shortcut::to_string() const
{
    std::string text;
    for (const auto& named : kNamedMods)
    {
        if (has_mod(mods, named.mod))
        {
            text += named.name;
            text += '+';
        }
    }
    return text + key_name(key);
}

Shortcut Shortcut::from_string(const std::string& str)
{
    std::vector<std::string_view> parts;
    std::string_view              rest = str;
    while (!rest.empty())
    {
        size_t           plus = rest.find('+');
        std::string_view part = trim(rest.substr(0, plus));
        if (!part.empty())
            parts.push_back(part);
        if (plus == std::string_view::npos)
            break;
        rest.remove_prefix(plus + 1);
    }
    if (parts.empty())
        return {};

    Shortcut parsed;
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        auto mod = mod_from_name(parts[i]);
        if (!mod)
            return {};
        parsed.mods = parsed.mods | *mod;
    }

    parsed.key = key_from_name(parts.back());
    if (!parsed.valid())
        return {};
    return parsed;
}

// ─── ShortcutManager ─────────────────────────────────────────────────────────

void ShortcutManager::bind(Shortcut shortcut, const std::string& command_id)
{
    if (!shortcut.valid())
        return;
    std::lock_guard lock(mutex_);
    bindings_[shortcut] = command_id;
}

void ShortcutManager::unbind(const Shortcut& shortcut)
{
    std::lock_guard lock(mutex_);
    bindings_.erase(shortcut);
}

void ShortcutManager::unbind_command(const std::string& command_id)
{
    std::lock_guard lock(mutex_);
    std::erase_if(bindings_, [&](const auto& pair) { return pair.second == command_id; });
}

std::string ShortcutManager::command_for_shortcut(const Shortcut& shortcut) const
{
    std::lock_guard lock(mutex_);
    auto            it = bindings_.find(shortcut);
    return it != bindings_.end() ? it->second : "";
}

Shortcut ShortcutManager::shortcut_for_command(const std::string& command_id) const
{
    std::lock_guard lock(mutex_);
    for (const auto& [sc, id] : bindings_)
    {
        if (id == command_id)
            return sc;
    }
    return {};
}

std::vector<ShortcutBinding> ShortcutManager::all_bindings() const
{
    std::lock_guard              lock(mutex_);
    std::vector<ShortcutBinding> result;
    result.reserve(bindings_.size());
    for (const auto& [sc, id] : bindings_)
        result.push_back({sc, id});
    return result;
}

bool ShortcutManager::on_key(int key, int action, int mods)
{
    if (action != kGlfwPress || !registry_)
        return false;

    Shortcut sc;
    sc.key  = key;
    sc.mods = static_cast<KeyMod>(mods & 0x0F);

    std::string cmd_id;
    {
        std::lock_guard lock(mutex_);
        auto            it = bindings_.find(sc);
        if (it == bindings_.end())
            return false;
        cmd_id = it->second;
    }
    return registry_->execute(cmd_id);
}

void ShortcutManager::register_defaults()
{
    for (const auto& info : label_table)
        bind({keys::letter(info.shortcut), KeyMod::Control}, "label." + std::string(info.id));

    bind({keys::letter('q'), KeyMod::Control}, "app.quit");
    bind({keys::letter('r'), KeyMod::Control}, "markings.remove_in_interval");

    bind({keys::letter('i'), KeyMod::None}, "view.invert_visible");
    bind({keys::letter('h'), KeyMod::None}, "view.hide_all");
    bind({keys::letter('m'), KeyMod::None}, "view.toggle_markers");
    bind({keys::letter('s'), KeyMod::None}, "view.toggle_steps");
    bind({keys::Minus, KeyMod::None}, "view.move_left");
    bind({keys::Space, KeyMod::None}, "view.move_right");
    bind({keys::letter('k'), KeyMod::None}, "view.maximize");
    bind({keys::Delete, KeyMod::None}, "items.remove_selected");
}

size_t ShortcutManager::count() const
{
    std::lock_guard lock(mutex_);
    return bindings_.size();
}

void ShortcutManager::clear()
{
    std::lock_guard lock(mutex_);
    bindings_.clear();
}

}   // namespace tracemark
