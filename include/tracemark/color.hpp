#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tracemark
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr Color with_alpha(float alpha) const { return Color{r, g, b, alpha}; }

    constexpr bool operator==(const Color& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }

    // Packed as 0xAABBGGRR, the layout ImGui's draw lists take.
    uint32_t to_abgr() const;
};

inline constexpr Color rgb8(int r, int g, int b)
{
    return Color{r / 255.0f, g / 255.0f, b / 255.0f, 1.0f};
}

struct NamedColor
{
    std::string_view name;
    Color            color;
};

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
}   // namespace colors

// Item colour cycle. Names double as default item names.
namespace palette
{
inline constexpr NamedColor item_cycle[] = {
    {"blue", rgb8(0, 0, 255)},
    {"red", rgb8(255, 0, 0)},
    {"forestgreen", rgb8(34, 139, 34)},
    {"magenta", rgb8(255, 0, 255)},
    {"darkorange", rgb8(255, 140, 0)},
    {"teal", rgb8(0, 128, 128)},
    {"deeppink", rgb8(255, 20, 147)},
    {"navy", rgb8(0, 0, 128)},
    {"dodgerblue", rgb8(30, 144, 255)},
    {"turquoise", rgb8(64, 224, 208)},
    {"darkviolet", rgb8(148, 0, 211)},
    {"darkred", rgb8(139, 0, 0)},
    {"lime", rgb8(0, 255, 0)},
    {"gold", rgb8(255, 215, 0)},
    {"steelblue", rgb8(70, 130, 180)},
    {"cyan", rgb8(0, 255, 255)},
    {"darkgreen", rgb8(0, 100, 0)},
    {"olive", rgb8(128, 128, 0)},
    {"black", rgb8(0, 0, 0)},
};
inline constexpr size_t item_cycle_size = sizeof(item_cycle) / sizeof(item_cycle[0]);

// Wraps instead of indexing past the end for slots >= item_cycle_size.
inline constexpr const NamedColor& item_color(size_t slot)
{
    return item_cycle[slot % item_cycle_size];
}
}   // namespace palette

}   // namespace tracemark
