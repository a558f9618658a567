#include "scene_painter.hpp"

#include <cmath>
#include <cstdio>
#include <numbers>
#include <trigon/scene.hpp>
#include <vector>

namespace trigon
{

namespace
{

constexpr float kTwoPi         = 2.0f * std::numbers::pi_v<float>;
constexpr float kRadToDeg      = 180.0f / std::numbers::pi_v<float>;
constexpr float kLargeValue    = 1.0e9f;

std::string format_fixed(const char* format, float v)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), format, static_cast<double>(v));
    return buf;
}

float effective_rate(const SceneModel& scene)
{
    return scene.running() ? scene.rate() : 0.0f;
}

float value_of(const TrigValues& v, TrigFunction fn)
{
    switch (fn)
    {
        case TrigFunction::Sine:
            return v.sin;
        case TrigFunction::Cosine:
            return v.cos;
        case TrigFunction::Tangent:
            return v.tan;
        case TrigFunction::Cotangent:
            return v.cot;
        case TrigFunction::Secant:
            return v.sec;
        case TrigFunction::Cosecant:
            return v.csc;
    }
    return 0.0f;
}

}   // namespace

// ─── Text ────────────────────────────────────────────────────────────────────

std::string ScenePainter::format_value(float value)
{
    if (value > kLargeValue)
        return "inf";
    if (value < -kLargeValue)
        return "-inf";
    return format_fixed("%.2f", value);
}

std::string ScenePainter::readout_text(const SceneModel& scene, TrigFunction fn)
{
    return std::string(label_text(label_for(fn))) + " = " + format_value(value_of(scene.values(), fn));
}

std::string ScenePainter::theta_text(float theta)
{
    return "θ = " + format_fixed("%.2f", theta) + " (" + format_fixed("%.0f", theta * kRadToDeg) + "°)";
}

std::string ScenePainter::rate_text(const SceneModel& scene)
{
    return "rate = " + format_fixed("%.2f", effective_rate(scene)) + " rad/s";
}

std::string ScenePainter::rate_degrees_text(const SceneModel& scene)
{
    return "(" + format_fixed("%.0f", effective_rate(scene) * kRadToDeg) + " deg/s)";
}

Color ScenePainter::function_color(TrigFunction fn)
{
    switch (fn)
    {
        case TrigFunction::Sine:
            return palette::sine;
        case TrigFunction::Cosine:
            return palette::cosine;
        case TrigFunction::Tangent:
            return palette::tangent;
        case TrigFunction::Cotangent:
            return palette::cotangent;
        case TrigFunction::Secant:
            return palette::secant;
        case TrigFunction::Cosecant:
            return palette::cosecant;
    }
    return colors::white;
}

int ScenePainter::arc_segment_count(float theta, int full_turn_segments)
{
    if (!(theta > 0.0f) || full_turn_segments <= 0)
        return 0;
    float progress = theta / kTwoPi;
    return static_cast<int>(std::ceil(static_cast<float>(full_turn_segments) * progress));
}

// ─── Painting ────────────────────────────────────────────────────────────────

void ScenePainter::paint(const SceneModel& scene, Canvas& canvas) const
{
    canvas.clear(style_.background);

    paint_axes(scene, canvas);
    paint_unit_circle(scene, canvas);
    paint_function_lines(scene, canvas);
    paint_node(scene, canvas);
    paint_readout(scene, canvas);
}

void ScenePainter::paint_label(const SceneModel& scene,
                               Canvas&           canvas,
                               Label             label,
                               const Color&      color) const
{
    if (!scene.show_labels())
        return;

    TextStyle ts;
    ts.size  = style_.label_font_size;
    ts.style = FontStyle::Regular;
    ts.align = TextAlign::Center;
    canvas.text(scene.label_position(label),
                label_text(label),
                ts,
                color.faded(scene.label_opacity(label)));
}

void ScenePainter::paint_axes(const SceneModel& scene, Canvas& canvas) const
{
    const float e = style_.axis_extent;
    const float w = style_.stroke_weight - 1.0f;
    canvas.line({-e, 0.0f}, {e, 0.0f}, w, palette::axis);
    canvas.line({0.0f, e}, {0.0f, -e}, w, palette::axis);

    // Radius to the node
    const TrigValues& s = scene.scaled();
    canvas.line({0.0f, 0.0f}, {s.cos, s.sin}, style_.stroke_weight - 0.8f, palette::axis);
    paint_label(scene, canvas, Label::Unit, palette::unit);
}

void ScenePainter::paint_unit_circle(const SceneModel& scene, Canvas& canvas) const
{
    const float r = scene.radius();
    canvas.circle({0.0f, 0.0f}, r, style_.stroke_weight - 0.3f, palette::axis);

    if (!scene.show_theta())
        return;

    paint_label(scene, canvas, Label::Theta, palette::angle);

    const float theta = scene.theta();
    const int   n     = arc_segment_count(theta, style_.arc_segments);
    if (n == 0)
        return;

    std::vector<Vec2> points;
    points.reserve(static_cast<size_t>(n) + 1);
    for (int i = 0; i <= n; ++i)
    {
        float a = theta * static_cast<float>(i) / static_cast<float>(n);
        points.push_back({std::cos(a) * r, std::sin(a) * r});
    }
    canvas.polyline(points, style_.stroke_weight, palette::angle);
}

void ScenePainter::paint_function_lines(const SceneModel& scene, Canvas& canvas) const
{
    const TrigValues& s = scene.scaled();
    const float       r = scene.radius();
    const float       w = style_.stroke_weight;

    for (TrigFunction fn : kAllTrigFunctions)
    {
        if (!scene.function_visible(fn))
            continue;

        const Color c = function_color(fn);
        switch (fn)
        {
            case TrigFunction::Sine:
                canvas.line({s.cos, 0.0f}, {s.cos, s.sin}, w, c);
                break;
            case TrigFunction::Cosine:
                canvas.line({0.0f, 0.0f}, {s.cos, 0.0f}, w, c);
                break;
            case TrigFunction::Tangent:
                canvas.line({r, 0.0f}, {r, s.tan}, w, c);
                break;
            case TrigFunction::Cotangent:
                canvas.line({s.cos, s.sin}, {0.0f, s.csc}, w, c);
                break;
            case TrigFunction::Secant:
                canvas.line({0.0f, 0.0f}, {r, s.tan}, w, c);
                break;
            case TrigFunction::Cosecant:
                canvas.line({0.0f, 0.0f}, {0.0f, s.csc}, w, c);
                break;
        }
        paint_label(scene, canvas, label_for(fn), c);
    }
}

void ScenePainter::paint_node(const SceneModel& scene, Canvas& canvas) const
{
    const TrigValues& s = scene.scaled();
    canvas.fill_circle({s.cos, s.sin}, style_.node_radius, colors::white);
}

void ScenePainter::paint_readout(const SceneModel& scene, Canvas& canvas) const
{
    if (!scene.show_values())
        return;

    TextStyle ts;
    ts.size  = style_.readout_font_size;
    ts.style = FontStyle::Italic;
    ts.align = TextAlign::Left;

    for (TrigFunction fn : kAllTrigFunctions)
    {
        Color c = function_color(fn);
        if (!scene.function_visible(fn))
            c = c.faded(style_.hidden_row_alpha);
        canvas.text({readout::kColumnX, readout::row_y(fn)}, readout_text(scene, fn), ts, c);
    }

    if (scene.show_theta())
    {
        canvas.text({readout::kColumnX, readout::kThetaRowY}, theta_text(scene.theta()), ts, colors::white);
    }

    canvas.text({readout::kColumnX, readout::kRateRowY}, rate_text(scene), ts, palette::axis);
    canvas.text({readout::kColumnX + 64.0f, readout::kRateRowY - style_.readout_line_gap},
                rate_degrees_text(scene),
                ts,
                palette::axis);
}

}   // namespace trigon
