#include <stdexcept>
#include <tracemark/label.hpp>

namespace tracemark
{

const LabelInfo& label_info(Label label)
{
    for (const auto& info : label_table)
    {
        if (info.label == label)
            return info;
    }
    throw std::logic_error("label missing from label_table");
}

std::string_view label_id(Label label)
{
    return label_info(label).id;
}

Color label_color(Label label)
{
    return label_info(label).color;
}

std::optional<Label> parse_label(std::string_view id)
{
    for (const auto& info : label_table)
    {
        if (info.id == id)
            return info.label;
    }
    return std::nullopt;
}

uint32_t Color::to_abgr() const
{
    auto channel = [](float v) -> uint32_t
    {
        if (v <= 0.0f)
            return 0;
        if (v >= 1.0f)
            return 255;
        return static_cast<uint32_t>(v * 255.0f + 0.5f);
    };
    return (channel(a) << 24) | (channel(b) << 16) | (channel(g) << 8) | channel(r);
}

}   // namespace tracemark
