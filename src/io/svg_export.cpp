#include <algorithm>
#include <cstdio>
#include <fstream>
#include <trigon/export.hpp>
#include <trigon/logger.hpp>
#include <trigon/scene.hpp>

#include "../render/scene_painter.hpp"
#include "svg_canvas.hpp"

namespace trigon
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

int channel(float v)
{
    return static_cast<int>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
}

// Convert a Color to an SVG rgb() string (alpha is emitted separately)
std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "rgb(%d,%d,%d)", channel(c.r), channel(c.g), channel(c.b));
    return buf;
}

// Convert a float to a compact string (no trailing zeros)
std::string fmt(float v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", static_cast<double>(v));
    return buf;
}

// XML-escape a string for safe embedding in SVG attributes/text content
std::string xml_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Sentinel-length lines would print as 3.4e+38; keep them a little past the viewport.
float clamp_to_view(float v, float limit)
{
    return std::clamp(v, -limit, limit);
}

}   // namespace

// ─── SvgCanvas ──────────────────────────────────────────────────────────────

SvgCanvas::SvgCanvas(uint32_t width, uint32_t height) : width_(width), height_(height)
{
    view_.width  = static_cast<float>(width);
    view_.height = static_cast<float>(height);
}

void SvgCanvas::clear(const Color& color)
{
    body_.str("");
    body_.clear();
    body_ << "  <rect width=\"100%\" height=\"100%\" fill=\"" << svg_color(color) << "\"/>\n";
}

void SvgCanvas::line(Vec2 from, Vec2 to, float width, const Color& color)
{
    const float limit = 4.0f * static_cast<float>(std::max(width_, height_));
    Vec2        a     = view_.to_pixels(from);
    Vec2        b     = view_.to_pixels(to);
    body_ << "  <line x1=\"" << fmt(clamp_to_view(a.x, limit)) << "\" y1=\""
          << fmt(clamp_to_view(a.y, limit)) << "\" x2=\"" << fmt(clamp_to_view(b.x, limit))
          << "\" y2=\"" << fmt(clamp_to_view(b.y, limit)) << "\" stroke=\"" << svg_color(color)
          << "\" stroke-opacity=\"" << fmt(color.a) << "\" stroke-width=\""
          << fmt(width * view_.scale()) << "\" stroke-linecap=\"round\"/>\n";
}

void SvgCanvas::circle(Vec2 center, float radius, float width, const Color& color)
{
    Vec2 c = view_.to_pixels(center);
    body_ << "  <circle cx=\"" << fmt(c.x) << "\" cy=\"" << fmt(c.y) << "\" r=\""
          << fmt(radius * view_.scale()) << "\" fill=\"none\" stroke=\"" << svg_color(color)
          << "\" stroke-opacity=\"" << fmt(color.a) << "\" stroke-width=\""
          << fmt(width * view_.scale()) << "\"/>\n";
}

void SvgCanvas::fill_circle(Vec2 center, float radius, const Color& color)
{
    Vec2 c = view_.to_pixels(center);
    body_ << "  <circle cx=\"" << fmt(c.x) << "\" cy=\"" << fmt(c.y) << "\" r=\""
          << fmt(radius * view_.scale()) << "\" fill=\"" << svg_color(color) << "\" fill-opacity=\""
          << fmt(color.a) << "\"/>\n";
}

void SvgCanvas::polyline(const std::vector<Vec2>& points, float width, const Color& color)
{
    if (points.size() < 2)
        return;

    body_ << "  <polyline points=\"";
    for (size_t i = 0; i < points.size(); ++i)
    {
        Vec2 p = view_.to_pixels(points[i]);
        if (i > 0)
            body_ << ' ';
        body_ << fmt(p.x) << ',' << fmt(p.y);
    }
    body_ << "\" fill=\"none\" stroke=\"" << svg_color(color) << "\" stroke-opacity=\""
          << fmt(color.a) << "\" stroke-width=\"" << fmt(width * view_.scale())
          << "\" stroke-linejoin=\"round\"/>\n";
}

void SvgCanvas::text(Vec2 anchor, std::string_view text, const TextStyle& style, const Color& color)
{
    Vec2 p = view_.to_pixels(anchor);
    body_ << "  <text x=\"" << fmt(p.x) << "\" y=\"" << fmt(p.y)
          << "\" font-family=\"'Times New Roman', serif\" font-size=\""
          << fmt(style.size * view_.scale()) << "\"";
    if (style.style == FontStyle::Italic)
        body_ << " font-style=\"italic\"";
    body_ << " text-anchor=\"" << (style.align == TextAlign::Center ? "middle" : "start")
          << "\" dominant-baseline=\"central\" fill=\"" << svg_color(color) << "\" fill-opacity=\""
          << fmt(color.a) << "\">" << xml_escape(text) << "</text>\n";
}

std::string SvgCanvas::finish() const
{
    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
           "width=\""
        << width_ << "\" height=\"" << height_
        << "\" "
           "viewBox=\"0 0 "
        << width_ << " " << height_ << "\">\n";
    svg << body_.str();
    svg << "</svg>\n";
    return svg.str();
}

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::to_string(const SceneModel& scene, uint32_t width, uint32_t height)
{
    SvgCanvas    canvas(width, height);
    ScenePainter painter;
    painter.paint(scene, canvas);
    return canvas.finish();
}

bool SvgExporter::write_svg(const std::string& path,
                            const SceneModel&  scene,
                            uint32_t           width,
                            uint32_t           height)
{
    if (width == 0 || height == 0)
    {
        TRIGON_LOG_ERROR("export", "Invalid SVG size {}x{}", width, height);
        return false;
    }

    std::string content = to_string(scene, width, height);

    std::ofstream file(path);
    if (!file.is_open())
    {
        TRIGON_LOG_ERROR("export", "Cannot open {} for writing", path);
        return false;
    }

    file << content;
    if (!file.good())
    {
        TRIGON_LOG_ERROR("export", "Write to {} failed", path);
        return false;
    }
    TRIGON_LOG_INFO("export", "Wrote {} ({}x{}, theta={})", path, width, height, scene.theta());
    return true;
}

}   // namespace trigon
