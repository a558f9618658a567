#pragma once

#include <array>
#include <trigon/geometry.hpp>
#include <trigon/label.hpp>

namespace trigon
{

struct FadeConfig
{
    float fade_in_seconds   = 0.3f;
    float fade_out_seconds  = 0.3f;
    float fade_intensity    = 0.8f;   // Opacity floor is 1 - fade_intensity
    Vec2  label_half_extent = {20.0f, 15.0f};

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;

    float min_opacity() const { return 1.0f - fade_intensity; }
};

// Per-label rectangles and fade state. Each frame the owner moves every label
// with set_position() and then calls update(): watched labels that overlap a
// label they are sensitive to ramp toward the opacity floor, all other watched
// labels ramp back to full opacity.
class LabelOverlapFader
{
   public:
    struct Record
    {
        Aabb  rect;
        bool  should_fade = false;
        bool  enabled     = true;
        float opacity     = 1.0f;
    };

    explicit LabelOverlapFader(const FadeConfig& config = {});

    const FadeConfig& config() const { return config_; }

    // Throws std::invalid_argument; opacities are re-clamped to the new floor.
    void set_config(const FadeConfig& config);

    void set_position(Label label, Vec2 point);

    // Disabled labels are never overlap targets. Watched labels still ramp.
    void set_enabled(Label label, bool enabled);
    bool enabled(Label label) const;

    void evaluate_overlaps();
    void advance_opacity(float dt);

    // evaluate_overlaps() then advance_opacity(dt).
    void update(float dt);

    // Full opacity for labels that are not watched.
    float get_opacity(Label label) const;
    Vec2  get_position(Label label) const;
    bool  should_fade(Label label) const;

    // Throws std::out_of_range for a value outside the Label enumeration.
    const Aabb& rect(Label label) const;

    // Back to the initial state: origin rectangles, fully opaque, nothing fading.
    void reset();

   private:
    const Record& record(Label label) const;
    Record&       record(Label label);

    FadeConfig                         config_;
    std::array<Record, kLabelCount>    records_{};
};

}   // namespace trigon
