#pragma once

#include <limits>
#include <numbers>

namespace trigon
{

inline constexpr float kTau = 2.0f * std::numbers::pi_v<float>;

// Finite stand-in for an infinite ratio.
inline constexpr float kTrigSentinel = std::numeric_limits<float>::max();

struct TrigValues
{
    float sin = 0.0f;
    float cos = 0.0f;
    float tan = 0.0f;
    float cot = 0.0f;
    float sec = 0.0f;
    float csc = 0.0f;

    TrigValues operator*(float s) const
    {
        return {sin * s, cos * s, tan * s, cot * s, sec * s, csc * s};
    }

    // Replace +/-infinity by the signed sentinel. Only the reciprocal-derived
    // ratios and tan can diverge.
    void clamp_infinite();
};

// Owns the animation angle and the six derived ratios.
class TrigEngine
{
   public:
    TrigEngine() = default;

    // Advance theta by rate * dt when running, wrapping into [0, 2pi).
    void advance(float dt, float rate, bool running);

    // Recompute raw and radius-scaled values from the current theta.
    void compute(float radius);

    float theta() const { return theta_; }
    void  set_theta(float theta);
    void  reset() { theta_ = 0.0f; }

    const TrigValues& values() const { return values_; }
    const TrigValues& scaled() const { return scaled_; }

   private:
    float      theta_ = 0.0f;
    TrigValues values_;
    TrigValues scaled_;
};

}   // namespace trigon
