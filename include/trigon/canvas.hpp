#pragma once

#include <algorithm>
#include <string_view>
#include <trigon/color.hpp>
#include <trigon/geometry.hpp>
#include <vector>

namespace trigon
{

enum class FontStyle
{
    Regular,
    Italic,
};

enum class TextAlign
{
    Left,     // anchor is the left edge, vertically centred
    Center,   // anchor is the centre of the text box
};

struct TextStyle
{
    float     size  = 13.0f;
    FontStyle style = FontStyle::Regular;
    TextAlign align = TextAlign::Center;
};

// Maps diagram space (origin at the circle centre, y up) to window pixels
// (origin top-left, y down). The diagram is designed for an 800x800 window and
// scales uniformly with the smaller window side.
struct ViewTransform
{
    static constexpr float kDesignSize = 800.0f;

    float width  = 800.0f;
    float height = 800.0f;
    Vec2  offset = {-120.0f, 0.0f};   // shifts the circle left to make room for the readout

    float scale() const { return std::min(width, height) / kDesignSize; }

    Vec2 to_pixels(Vec2 p) const
    {
        float s = scale();
        return {width * 0.5f + (p.x + offset.x) * s, height * 0.5f - (p.y + offset.y) * s};
    }

    Vec2 to_diagram(Vec2 px) const
    {
        float s = scale();
        return {(px.x - width * 0.5f) / s - offset.x, (height * 0.5f - px.y) / s - offset.y};
    }
};

// Immediate-mode drawing surface in diagram space. Widths and radii are in
// diagram units; implementations apply their own ViewTransform.
class Canvas
{
   public:
    virtual ~Canvas() = default;

    virtual void clear(const Color& color) = 0;

    virtual void line(Vec2 from, Vec2 to, float width, const Color& color) = 0;

    virtual void circle(Vec2 center, float radius, float width, const Color& color) = 0;

    virtual void fill_circle(Vec2 center, float radius, const Color& color) = 0;

    virtual void polyline(const std::vector<Vec2>& points, float width, const Color& color) = 0;

    // `text` is UTF-8.
    virtual void text(Vec2 anchor, std::string_view text, const TextStyle& style, const Color& color) = 0;
};

}   // namespace trigon
