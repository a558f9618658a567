#pragma once

namespace trigon
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // Same colour with its alpha multiplied by `opacity`.
    constexpr Color faded(float opacity) const { return Color{r, g, b, a * opacity}; }
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 1.0f, 0.0f};
inline constexpr Color yellow{1.0f, 1.0f, 0.0f};
inline constexpr Color orange{1.0f, 0.5f, 0.0f};
inline constexpr Color magenta{1.0f, 0.0f, 1.0f};
inline constexpr Color cyan{0.0f, 1.0f, 1.0f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
inline constexpr Color light_gray{0.83f, 0.83f, 0.83f};
}   // namespace colors

// Colour of each trigonometric function's line, label and readout row.
namespace palette
{
inline constexpr Color sine      = colors::red;
inline constexpr Color cosine    = colors::green;
inline constexpr Color tangent   = colors::yellow;
inline constexpr Color cotangent = colors::orange;
inline constexpr Color secant    = colors::magenta;
inline constexpr Color cosecant  = colors::cyan;
inline constexpr Color axis      = colors::gray;
inline constexpr Color unit      = colors::light_gray;
inline constexpr Color angle     = colors::white;
}   // namespace palette

}   // namespace trigon
