#pragma once

#include <array>
#include <trigon/geometry.hpp>
#include <trigon/label.hpp>
#include <trigon/label_fader.hpp>
#include <trigon/trig_engine.hpp>

namespace trigon
{

struct SceneConfig
{
    float default_rate     = 0.25f;   // rad/s
    float rate_increment   = 0.08f;
    float default_radius   = 200.0f;  // diagram units
    float radius_increment = 20.0f;
    float min_radius       = 40.0f;
    FadeConfig fade;

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

// Fixed layout of the value readout to the right of the circle (diagram space).
namespace readout
{
inline constexpr float kColumnX   = 430.0f;
inline constexpr float kRowWidth  = 150.0f;
inline constexpr float kRowHeight = 30.0f;
inline constexpr float kThetaRowY = 200.0f;
inline constexpr float kRateRowY  = -200.0f;

// Baseline-centre y of a function's row.
constexpr float row_y(TrigFunction fn)
{
    switch (fn)
    {
        case TrigFunction::Sine:
            return 150.0f;
        case TrigFunction::Cosine:
            return 100.0f;
        case TrigFunction::Tangent:
            return 50.0f;
        case TrigFunction::Cotangent:
            return -50.0f;
        case TrigFunction::Secant:
            return -100.0f;
        case TrigFunction::Cosecant:
            return -150.0f;
    }
    return 0.0f;
}

// Click target that toggles a function's visibility.
inline Aabb row_rect(TrigFunction fn)
{
    return Aabb::from_center({kColumnX + kRowWidth * 0.5f, row_y(fn)},
                             {kRowWidth * 0.5f, kRowHeight * 0.5f});
}
}   // namespace readout

// Per-frame orchestration of the angle, the trig values and the label fader,
// plus the toggles driven by keyboard commands and readout clicks.
class SceneModel
{
   public:
    explicit SceneModel(const SceneConfig& config = {});

    const SceneConfig& config() const { return config_; }

    // Keyboard-only frame: no pointer input.
    void update(float dt);

    // `pointer` is in diagram space. A press edge inside a readout row toggles that function.
    void update(float dt, Vec2 pointer, bool primary_down);

    // ─── Commands ───────────────────────────────────────────────────────

    void toggle_running() { running_ = !running_; }
    void toggle_labels() { show_labels_ = !show_labels_; }
    void toggle_values() { show_values_ = !show_values_; }
    void toggle_theta() { show_theta_ = !show_theta_; }
    void toggle_function(TrigFunction fn);

    void increment_rate();
    void decrement_rate();
    void reset_rate() { rate_ = config_.default_rate; }
    void reset_theta();

    void increment_radius();
    void decrement_radius();
    void reset_radius() { radius_ = config_.default_radius; }

    // ─── State ──────────────────────────────────────────────────────────

    bool  running() const { return running_; }
    bool  show_labels() const { return show_labels_; }
    bool  show_values() const { return show_values_; }
    bool  show_theta() const { return show_theta_; }
    bool  function_visible(TrigFunction fn) const { return visible_[index_of(fn)]; }
    float rate() const { return rate_; }
    float radius() const { return radius_; }
    float theta() const { return engine_.theta(); }

    const TrigValues& values() const { return engine_.values(); }
    const TrigValues& scaled() const { return engine_.scaled(); }

    Vec2  label_position(Label label) const { return fader_.get_position(label); }
    float label_opacity(Label label) const { return fader_.get_opacity(label); }

    const TrigEngine&        engine() const { return engine_; }
    const LabelOverlapFader& fader() const { return fader_; }

    // Jump to an angle and refresh derived values without advancing time.
    void set_theta(float theta);

    // set_theta() followed by a fade long enough for every label to reach its
    // resting opacity. Used for single exported frames.
    void prepare_still(float theta);

   private:
    void recompute(float dt);
    void place_labels();
    void handle_pointer(Vec2 pointer, bool primary_down);

    SceneConfig       config_;
    TrigEngine        engine_;
    LabelOverlapFader fader_;

    float rate_   = 0.25f;
    float radius_ = 200.0f;

    bool running_     = true;
    bool show_labels_ = true;
    bool show_values_ = true;
    bool show_theta_  = true;

    std::array<bool, kTrigFunctionCount> visible_{true, true, true, true, true, true};

    bool primary_was_down_ = false;
};

}   // namespace trigon
