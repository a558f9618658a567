#include <cmath>
#include <trigon/trig_engine.hpp>

namespace trigon
{

namespace
{

void clamp_to_sentinel(float& value)
{
    if (std::isinf(value))
    {
        value = std::signbit(value) ? -kTrigSentinel : kTrigSentinel;
    }
}

float wrap_angle(float theta)
{
    float wrapped = std::fmod(theta, kTau);
    if (wrapped < 0.0f)
        wrapped += kTau;
    // fmod of a value a hair below a negative multiple of tau can round up to tau
    if (wrapped >= kTau)
        wrapped = 0.0f;
    return wrapped;
}

}   // namespace

void TrigValues::clamp_infinite()
{
    clamp_to_sentinel(tan);
    clamp_to_sentinel(cot);
    clamp_to_sentinel(sec);
    clamp_to_sentinel(csc);
}

void TrigEngine::advance(float dt, float rate, bool running)
{
    if (!running)
        return;

    theta_ += rate * dt;

    if (theta_ >= kTau)
    {
        theta_ -= kTau;
        // A single step longer than a full turn
        if (theta_ >= kTau)
            theta_ = wrap_angle(theta_);
    }
}

void TrigEngine::set_theta(float theta)
{
    theta_ = wrap_angle(theta);
}

void TrigEngine::compute(float radius)
{
    values_.sin = std::sin(theta_);
    values_.cos = std::cos(theta_);
    values_.tan = std::tan(theta_);
    values_.cot = 1.0f / values_.tan;
    values_.sec = 1.0f / values_.cos;
    values_.csc = 1.0f / values_.sin;

    // Scale before clamping: a huge finite ratio can still overflow once scaled.
    scaled_ = values_ * radius;

    values_.clamp_infinite();
    scaled_.clamp_infinite();
}

}   // namespace trigon
