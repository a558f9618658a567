#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>
#include <trigon/logger.hpp>
#include <trigon/scene.hpp>

namespace trigon
{

namespace
{

constexpr float kPi = std::numbers::pi_v<float>;

// Keeps a label anchor finite when a formula multiplies a sentinel value.
float finite_coord(float v)
{
    if (std::isnan(v))
        return 0.0f;
    return std::clamp(v, -kTrigSentinel, kTrigSentinel);
}

Vec2 finite_point(float x, float y)
{
    return {finite_coord(x), finite_coord(y)};
}

}   // namespace

void SceneConfig::validate() const
{
    if (!(default_rate >= 0.0f && std::isfinite(default_rate)))
        throw std::invalid_argument("default_rate must be finite and non-negative");
    if (!(rate_increment > 0.0f && std::isfinite(rate_increment)))
        throw std::invalid_argument("rate_increment must be finite and positive");
    if (!(min_radius > 0.0f && std::isfinite(min_radius)))
        throw std::invalid_argument("min_radius must be finite and positive");
    if (!(default_radius >= min_radius && std::isfinite(default_radius)))
        throw std::invalid_argument("default_radius must be finite and not below min_radius");
    if (!(radius_increment > 0.0f && std::isfinite(radius_increment)))
        throw std::invalid_argument("radius_increment must be finite and positive");
    fade.validate();
}

SceneModel::SceneModel(const SceneConfig& config) : config_(config), fader_(config.fade)
{
    config_.validate();
    rate_   = config_.default_rate;
    radius_ = config_.default_radius;

    engine_.compute(radius_);
    place_labels();
}

void SceneModel::update(float dt)
{
    recompute(dt);
}

void SceneModel::update(float dt, Vec2 pointer, bool primary_down)
{
    handle_pointer(pointer, primary_down);
    recompute(dt);
}

void SceneModel::recompute(float dt)
{
    engine_.advance(dt, rate_, running_);
    engine_.compute(radius_);
    place_labels();
    fader_.update(dt);
}

void SceneModel::place_labels()
{
    const TrigValues& v     = engine_.values();
    const TrigValues& s     = engine_.scaled();
    const float       theta = engine_.theta();
    const float       r     = radius_;

    const float cot_dir = theta >= kPi ? -1.0f : 1.0f;
    const float unit_dx = std::cos(theta - kPi * 0.5f);
    const float unit_dy = std::sin(theta - kPi * 0.5f);

    fader_.set_position(Label::Cosine, finite_point(s.cos * 0.5f, 15.0f));
    fader_.set_position(Label::Sine, finite_point(s.cos + 22.0f, s.sin * 0.5f));
    fader_.set_position(Label::Tangent, finite_point(r + 23.0f, s.tan * 0.5f));
    fader_.set_position(Label::Cotangent,
                        finite_point(s.cos * 0.5f + cot_dir * v.cos * 20.0f,
                                     (s.sin + s.csc) * 0.5f + 12.0f + std::abs(v.sin) * 8.0f));
    fader_.set_position(Label::Secant,
                        finite_point(r * 0.5f - v.tan * 7.0f, s.tan * 0.5f + 18.0f));
    fader_.set_position(Label::Cosecant, finite_point(-25.0f, s.csc * 0.5f));
    fader_.set_position(Label::Theta,
                        finite_point(std::cos(theta * 0.5f) * r * 0.93f,
                                     std::sin(theta * 0.5f) * r * 0.93f));
    fader_.set_position(Label::Unit,
                        finite_point(s.cos * 0.5f + 15.0f * unit_dx,
                                     s.sin * 0.5f + 15.0f * unit_dy));
}

void SceneModel::handle_pointer(Vec2 pointer, bool primary_down)
{
    bool pressed      = primary_down && !primary_was_down_;
    primary_was_down_ = primary_down;

    if (!pressed || !show_values_)
        return;

    for (TrigFunction fn : kAllTrigFunctions)
    {
        if (readout::row_rect(fn).contains(pointer))
        {
            toggle_function(fn);
            return;
        }
    }
}

void SceneModel::toggle_function(TrigFunction fn)
{
    bool& vis = visible_[index_of(fn)];
    vis       = !vis;
    fader_.set_enabled(label_for(fn), vis);
    TRIGON_LOG_DEBUG("scene",
                     "{} {}",
                     std::string(label_id(label_for(fn))),
                     vis ? "shown" : "hidden");
}

void SceneModel::increment_rate()
{
    rate_ += config_.rate_increment;
}

void SceneModel::decrement_rate()
{
    rate_ = std::max(0.0f, rate_ - config_.rate_increment);
}

void SceneModel::reset_theta()
{
    set_theta(0.0f);
}

void SceneModel::increment_radius()
{
    radius_ += config_.radius_increment;
}

void SceneModel::decrement_radius()
{
    radius_ = std::max(config_.min_radius, radius_ - config_.radius_increment);
}

void SceneModel::set_theta(float theta)
{
    engine_.set_theta(theta);
    engine_.compute(radius_);
    place_labels();
}

void SceneModel::prepare_still(float theta)
{
    set_theta(theta);
    fader_.evaluate_overlaps();
    fader_.advance_opacity(std::max(config_.fade.fade_in_seconds, config_.fade.fade_out_seconds));
}

}   // namespace trigon
