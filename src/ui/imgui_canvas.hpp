#pragma once

#ifdef TRIGON_USE_IMGUI

    #include <trigon/canvas.hpp>

struct ImDrawList;
struct ImFont;

namespace trigon
{

// Canvas over an ImGui draw list. Coordinates follow ImGui's display space
// (screen coordinates of the window, origin top-left).
class ImGuiCanvas : public Canvas
{
   public:
    ImGuiCanvas(ImDrawList* draw_list, const ViewTransform& view, ImFont* regular, ImFont* italic);

    void clear(const Color& color) override;
    void line(Vec2 from, Vec2 to, float width, const Color& color) override;
    void circle(Vec2 center, float radius, float width, const Color& color) override;
    void fill_circle(Vec2 center, float radius, const Color& color) override;
    void polyline(const std::vector<Vec2>& points, float width, const Color& color) override;
    void text(Vec2 anchor, std::string_view text, const TextStyle& style, const Color& color) override;

    const ViewTransform& view() const { return view_; }

   private:
    ImDrawList*   draw_list_;
    ViewTransform view_;
    ImFont*       regular_;
    ImFont*       italic_;
};

}   // namespace trigon

#endif   // TRIGON_USE_IMGUI
