#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <trigon/canvas.hpp>

namespace trigon
{

// Canvas that accumulates SVG elements. Diagram space is mapped through a
// ViewTransform sized to the document.
class SvgCanvas : public Canvas
{
   public:
    SvgCanvas(uint32_t width, uint32_t height);

    void clear(const Color& color) override;
    void line(Vec2 from, Vec2 to, float width, const Color& color) override;
    void circle(Vec2 center, float radius, float width, const Color& color) override;
    void fill_circle(Vec2 center, float radius, const Color& color) override;
    void polyline(const std::vector<Vec2>& points, float width, const Color& color) override;
    void text(Vec2 anchor, std::string_view text, const TextStyle& style, const Color& color) override;

    const ViewTransform& view() const { return view_; }

    // Complete document: header, accumulated body, closing tag.
    std::string finish() const;

   private:
    ViewTransform      view_;
    uint32_t           width_;
    uint32_t           height_;
    std::ostringstream body_;
};

}   // namespace trigon
