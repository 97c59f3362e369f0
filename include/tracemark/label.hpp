#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <tracemark/color.hpp>

namespace tracemark
{

// Closed set of marking categories.
enum class Label : uint8_t
{
    BFill,
    FFill,
    Discard,
    Zero,
    Good,
    Comment,
    LinearFill,
};

struct LabelInfo
{
    Label            label;
    std::string_view id;         // Stored and parsed form, e.g. "linear-fill"
    Color            color;
    char             shortcut;   // Pressed together with Ctrl
};

inline constexpr std::array<LabelInfo, 7> label_table = {{
    {Label::BFill, "bfill", rgb8(148, 0, 211), 'B'},
    {Label::FFill, "ffill", rgb8(250, 128, 114), 'N'},
    {Label::Discard, "discard", rgb8(255, 165, 0), 'D'},
    {Label::Zero, "zero", rgb8(70, 130, 180), 'Z'},
    {Label::Good, "good", rgb8(0, 128, 0), 'J'},
    {Label::Comment, "comment", rgb8(143, 188, 143), 'C'},
    {Label::LinearFill, "linear-fill", rgb8(255, 105, 180), 'W'},
}};

const LabelInfo&     label_info(Label label);
std::string_view     label_id(Label label);
Color                label_color(Label label);
std::optional<Label> parse_label(std::string_view id);

}   // namespace tracemark
