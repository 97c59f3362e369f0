#include "json_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tracemark::json
{

namespace
{

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Index one past the end of the string literal starting at s[pos] == '"'.
size_t skip_string(std::string_view s, size_t pos)
{
    ++pos;
    while (pos < s.size())
    {
        if (s[pos] == '\\')
            pos += 2;
        else if (s[pos] == '"')
            return pos + 1;
        else
            ++pos;
    }
    return s.size();
}

// Index one past the end of the value starting at s[pos].
size_t skip_value(std::string_view s, size_t pos)
{
    int depth = 0;
    while (pos < s.size())
    {
        char c = s[pos];
        if (c == '"')
        {
            pos = skip_string(s, pos);
            if (depth == 0)
                return pos;
            continue;
        }
        if (c == '{' || c == '[')
            ++depth;
        else if (c == '}' || c == ']')
        {
            if (depth == 0)
                return pos;
            --depth;
            if (depth == 0)
                return pos + 1;
        }
        else if (c == ',' && depth == 0)
            return pos;
        ++pos;
    }
    return pos;
}

// Splits the inside of a container into top-level comma separated pieces.
std::vector<std::string_view> split_top_level(std::string_view body)
{
    std::vector<std::string_view> parts;
    size_t                        pos = 0;
    while (pos < body.size())
    {
        while (pos < body.size()
               && (std::isspace(static_cast<unsigned char>(body[pos])) || body[pos] == ','))
            ++pos;
        if (pos >= body.size())
            break;

        size_t start = pos;
        // A member is "key": value, so skip the key string and the colon first.
        if (body[pos] == '"')
        {
            size_t after_key = skip_string(body, pos);
            size_t colon     = after_key;
            while (colon < body.size() && std::isspace(static_cast<unsigned char>(body[colon])))
                ++colon;
            if (colon < body.size() && body[colon] == ':')
                pos = colon + 1;
            else
                pos = after_key;
            while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos])))
                ++pos;
        }
        size_t end = (pos < body.size() && body[pos] != ',') ? skip_value(body, pos) : pos;
        if (end <= start)
        {
            // Stray closing bracket; step over it.
            pos = start + 1;
            continue;
        }
        parts.push_back(trim(body.substr(start, end - start)));
        pos = end;
    }
    return parts;
}

std::optional<std::string_view> container_body(std::string_view raw, char open, char close)
{
    raw = trim(raw);
    if (raw.size() < 2 || raw.front() != open || raw.back() != close)
        return std::nullopt;
    return raw.substr(1, raw.size() - 2);
}

}   // namespace

std::string escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::vector<Member> object_members(std::string_view object)
{
    std::vector<Member> members;
    auto                body = container_body(object, '{', '}');
    if (!body)
        return members;

    for (std::string_view part : split_top_level(*body))
    {
        if (part.empty() || part.front() != '"')
            continue;
        size_t key_end = skip_string(part, 0);
        auto   key     = as_string(part.substr(0, key_end));
        size_t colon   = part.find(':', key_end);
        if (!key || colon == std::string_view::npos)
            continue;
        members.push_back({*key, std::string(trim(part.substr(colon + 1)))});
    }
    return members;
}

std::vector<std::string> array_elements(std::string_view array)
{
    std::vector<std::string> elements;
    auto                     body = container_body(array, '[', ']');
    if (!body)
        return elements;
    for (std::string_view part : split_top_level(*body))
    {
        if (!part.empty())
            elements.emplace_back(part);
    }
    return elements;
}

const std::string* find(const std::vector<Member>& members, std::string_view key)
{
    for (const auto& m : members)
    {
        if (m.key == key)
            return &m.raw;
    }
    return nullptr;
}

bool is_null(std::string_view raw)
{
    return trim(raw) == "null";
}

bool is_string(std::string_view raw)
{
    raw = trim(raw);
    return raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
}

std::optional<std::string> as_string(std::string_view raw)
{
    raw = trim(raw);
    if (!is_string(raw))
        return std::nullopt;

    std::string out;
    out.reserve(raw.size());
    for (size_t i = 1; i + 1 < raw.size(); ++i)
    {
        char c = raw[i];
        if (c != '\\' || i + 2 >= raw.size())
        {
            out += c;
            continue;
        }
        char n = raw[++i];
        switch (n)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += n;
                break;
        }
    }
    return out;
}

std::optional<double> as_number(std::string_view raw)
{
    raw = trim(raw);
    if (raw.empty())
        return std::nullopt;
    std::string text(raw);
    char*       end = nullptr;
    double      v   = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0')
        return std::nullopt;
    return v;
}

std::optional<bool> as_bool(std::string_view raw)
{
    raw = trim(raw);
    if (raw == "true")
        return true;
    if (raw == "false")
        return false;
    return std::nullopt;
}

bool is_integer(std::string_view raw)
{
    raw = trim(raw);
    if (!as_number(raw))
        return false;
    return raw.find_first_of(".eE") == std::string_view::npos;
}

std::string format_double(double v)
{
    if (!std::isfinite(v))
        return "null";
    char buf[64];
    for (int precision = 15; precision <= 17; ++precision)
    {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v)
            break;
    }
    std::string out(buf);
    if (out.find_first_of(".eE") == std::string::npos)
        out += ".0";
    return out;
}

std::string read_string(const std::vector<Member>& members,
                        std::string_view           key,
                        const std::string&         def)
{
    const std::string* raw = find(members, key);
    if (!raw)
        return def;
    return as_string(*raw).value_or(def);
}

double read_number(const std::vector<Member>& members, std::string_view key, double def)
{
    const std::string* raw = find(members, key);
    if (!raw)
        return def;
    return as_number(*raw).value_or(def);
}

bool read_bool(const std::vector<Member>& members, std::string_view key, bool def)
{
    const std::string* raw = find(members, key);
    if (!raw)
        return def;
    return as_bool(*raw).value_or(def);
}

}   // namespace tracemark::json
