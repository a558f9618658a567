#pragma once

#include <string>
#include <trigon/canvas.hpp>
#include <trigon/label.hpp>

namespace trigon
{

class SceneModel;

// Draws a SceneModel onto any Canvas: axes and radius line, unit circle and
// angle arc, the six function lines with their labels, the node on the
// circle, then the value readout.
class ScenePainter
{
   public:
    struct Style
    {
        Color background        = colors::black;
        float stroke_weight     = 3.0f;
        float axis_extent       = 1000.0f;
        float node_radius       = 8.0f;
        int   arc_segments      = 128;     // for a full turn
        float label_font_size   = 13.0f;
        float readout_font_size = 18.0f;
        float readout_line_gap  = 21.0f;   // second line of the rate row
        float hidden_row_alpha  = 0.35f;
    };

    ScenePainter() = default;
    explicit ScenePainter(const Style& style) : style_(style) {}

    const Style& style() const { return style_; }

    void paint(const SceneModel& scene, Canvas& canvas) const;

    // Two decimals; anything beyond 1e9 in magnitude prints as "inf" / "-inf".
    static std::string format_value(float value);

    // "sin θ = 0.50"
    static std::string readout_text(const SceneModel& scene, TrigFunction fn);
    // "θ = 1.57 (90°)"
    static std::string theta_text(float theta);
    // "rate = 0.25 rad/s" and "(14 deg/s)"; zero while paused.
    static std::string rate_text(const SceneModel& scene);
    static std::string rate_degrees_text(const SceneModel& scene);

    static Color function_color(TrigFunction fn);

    // Number of segments of the angle arc; 0 means nothing to draw.
    static int arc_segment_count(float theta, int full_turn_segments);

   private:
    void paint_axes(const SceneModel& scene, Canvas& canvas) const;
    void paint_unit_circle(const SceneModel& scene, Canvas& canvas) const;
    void paint_function_lines(const SceneModel& scene, Canvas& canvas) const;
    void paint_node(const SceneModel& scene, Canvas& canvas) const;
    void paint_readout(const SceneModel& scene, Canvas& canvas) const;

    void paint_label(const SceneModel& scene, Canvas& canvas, Label label, const Color& color) const;

    Style style_;
};

}   // namespace trigon
