#include <string>
#include <type_traits>
#include <tracemark/metadata.hpp>

#include "io/json_util.hpp"

namespace tracemark
{

bool metadata_matches(const Metadata& partial, const Metadata& full)
{
    for (const auto& [key, value] : partial)
    {
        auto it = full.find(key);
        if (it == full.end() || it->second != value)
            return false;
    }
    return true;
}

bool metadata_is_total(const Metadata& metadata)
{
    auto it = metadata.find("is_total");
    if (it == metadata.end())
        return false;
    const bool* flag = std::get_if<bool>(&it->second);
    return flag && *flag;
}

std::string metadata_value_to_string(const MetadataValue& value)
{
    return std::visit(
        [](const auto& v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else if constexpr (std::is_same_v<T, std::string>)
            {
                std::string quoted = "'";
                for (char c : v)
                {
                    if (c == '\\' || c == '\'')
                        quoted += '\\';
                    quoted += c;
                }
                return quoted + "'";
            }
            else if constexpr (std::is_same_v<T, double>)
                return json::format_double(v);
            else
                return std::to_string(v);
        },
        value);
}

std::string metadata_to_string(const Metadata& metadata)
{
    std::string out = "{";
    bool        first = true;
    for (const auto& [key, value] : metadata)
    {
        if (!first)
            out += ", ";
        first = false;
        out += key + "=" + metadata_value_to_string(value);
    }
    out += "}";
    return out;
}

}   // namespace tracemark
