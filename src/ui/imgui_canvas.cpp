#ifdef TRIGON_USE_IMGUI

    #include "imgui_canvas.hpp"

    #include <cfloat>
    #include <imgui.h>

namespace trigon
{

static ImU32 to_imgui(const Color& c)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, c.a));
}

static ImVec2 to_imvec(Vec2 p)
{
    return ImVec2(p.x, p.y);
}

ImGuiCanvas::ImGuiCanvas(ImDrawList*          draw_list,
                         const ViewTransform& view,
                         ImFont*              regular,
                         ImFont*              italic)
    : draw_list_(draw_list), view_(view), regular_(regular), italic_(italic ? italic : regular)
{
}

void ImGuiCanvas::clear(const Color& color)
{
    draw_list_->AddRectFilled(ImVec2(0.0f, 0.0f), ImVec2(view_.width, view_.height), to_imgui(color));
}

void ImGuiCanvas::line(Vec2 from, Vec2 to, float width, const Color& color)
{
    if (width <= 0.0f || color.a <= 0.0f)
        return;
    draw_list_->AddLine(to_imvec(view_.to_pixels(from)),
                        to_imvec(view_.to_pixels(to)),
                        to_imgui(color),
                        width * view_.scale());
}

void ImGuiCanvas::circle(Vec2 center, float radius, float width, const Color& color)
{
    if (width <= 0.0f || radius <= 0.0f || color.a <= 0.0f)
        return;
    draw_list_->AddCircle(to_imvec(view_.to_pixels(center)),
                          radius * view_.scale(),
                          to_imgui(color),
                          0,
                          width * view_.scale());
}

void ImGuiCanvas::fill_circle(Vec2 center, float radius, const Color& color)
{
    if (radius <= 0.0f || color.a <= 0.0f)
        return;
    draw_list_->AddCircleFilled(to_imvec(view_.to_pixels(center)),
                                radius * view_.scale(),
                                to_imgui(color));
}

void ImGuiCanvas::polyline(const std::vector<Vec2>& points, float width, const Color& color)
{
    if (points.size() < 2 || width <= 0.0f || color.a <= 0.0f)
        return;

    std::vector<ImVec2> px;
    px.reserve(points.size());
    for (const auto& p : points)
    {
        px.push_back(to_imvec(view_.to_pixels(p)));
    }
    draw_list_->AddPolyline(px.data(),
                            static_cast<int>(px.size()),
                            to_imgui(color),
                            ImDrawFlags_None,
                            width * view_.scale());
}

void ImGuiCanvas::text(Vec2 anchor, std::string_view text, const TextStyle& style, const Color& color)
{
    if (text.empty() || color.a <= 0.0f)
        return;

    ImFont* font = style.style == FontStyle::Italic ? italic_ : regular_;
    if (!font)
        return;

    const char* begin = text.data();
    const char* end   = text.data() + text.size();
    float       size  = style.size * view_.scale();
    ImVec2      extent = font->CalcTextSizeA(size, FLT_MAX, 0.0f, begin, end);

    Vec2   p = view_.to_pixels(anchor);
    ImVec2 pos(p.x, p.y - extent.y * 0.5f);
    if (style.align == TextAlign::Center)
    {
        pos.x -= extent.x * 0.5f;
    }

    draw_list_->AddText(font, size, pos, to_imgui(color), begin, end);
}

}   // namespace trigon

#endif   // TRIGON_USE_IMGUI
