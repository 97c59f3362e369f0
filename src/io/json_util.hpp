#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracemark::json
{

// Minimal reader/writer helpers for the small JSON documents tracemark writes
// (config, markings store). Values are kept as raw text and converted on demand.

struct Member
{
    std::string key;
    std::string raw;   // Raw value text, e.g. "\"abc\"", "12.5", "{...}", "[...]"
};

std::string escape(std::string_view s);

// Top-level members of an object "{...}". Empty when `object` is not an object.
std::vector<Member> object_members(std::string_view object);

// Top-level elements of an array "[...]".
std::vector<std::string> array_elements(std::string_view array);

const std::string* find(const std::vector<Member>& members, std::string_view key);

bool                  is_null(std::string_view raw);
bool                  is_string(std::string_view raw);
std::optional<std::string> as_string(std::string_view raw);
std::optional<double> as_number(std::string_view raw);
std::optional<bool>   as_bool(std::string_view raw);

// Numbers without a fraction or exponent.
bool is_integer(std::string_view raw);

// Shortest text that reads back as the same double, always with a '.' or exponent.
std::string format_double(double v);

// Convenience lookups with defaults.
std::string read_string(const std::vector<Member>& members,
                        std::string_view           key,
                        const std::string&         def = "");
double      read_number(const std::vector<Member>& members, std::string_view key, double def);
bool        read_bool(const std::vector<Member>& members, std::string_view key, bool def);

}   // namespace tracemark::json
