#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace trigon
{

// Text labels placed on the diagram. Closed set: the ordinal indexes per-label arrays.
enum class Label : uint8_t
{
    Sine = 0,
    Cosine,
    Tangent,
    Cotangent,
    Secant,
    Cosecant,
    Theta,
    Unit,
};

inline constexpr size_t kLabelCount = 8;

inline constexpr std::array<Label, kLabelCount> kAllLabels = {
    Label::Sine,
    Label::Cosine,
    Label::Tangent,
    Label::Cotangent,
    Label::Secant,
    Label::Cosecant,
    Label::Theta,
    Label::Unit,
};

// The six plotted functions. Ordinals match the first six Label members.
enum class TrigFunction : uint8_t
{
    Sine = 0,
    Cosine,
    Tangent,
    Cotangent,
    Secant,
    Cosecant,
};

inline constexpr size_t kTrigFunctionCount = 6;

inline constexpr std::array<TrigFunction, kTrigFunctionCount> kAllTrigFunctions = {
    TrigFunction::Sine,
    TrigFunction::Cosine,
    TrigFunction::Tangent,
    TrigFunction::Cotangent,
    TrigFunction::Secant,
    TrigFunction::Cosecant,
};

constexpr size_t index_of(Label label)
{
    return static_cast<size_t>(label);
}

constexpr size_t index_of(TrigFunction fn)
{
    return static_cast<size_t>(fn);
}

constexpr Label label_for(TrigFunction fn)
{
    return static_cast<Label>(static_cast<uint8_t>(fn));
}

// Labels whose opacity is animated. The rest only serve as overlap targets.
constexpr bool is_watched(Label label)
{
    switch (label)
    {
        case Label::Sine:
        case Label::Cosine:
        case Label::Secant:
        case Label::Theta:
        case Label::Unit:
            return true;
        default:
            return false;
    }
}

// Directional fade-trigger table: true when `self` must fade while overlapping `other`.
constexpr bool should_fade(Label self, Label other)
{
    switch (self)
    {
        case Label::Sine:
            return other == Label::Tangent || other == Label::Cosecant;
        case Label::Cosine:
            return other == Label::Secant;
        case Label::Secant:
            return other == Label::Cotangent;
        case Label::Theta:
            return other == Label::Sine;
        case Label::Unit:
            return other == Label::Cosine || other == Label::Sine || other == Label::Cosecant;
        default:
            return false;
    }
}

// Text drawn for a label on the diagram.
constexpr std::string_view label_text(Label label)
{
    switch (label)
    {
        case Label::Sine:
            return "sin θ";
        case Label::Cosine:
            return "cos θ";
        case Label::Tangent:
            return "tan θ";
        case Label::Cotangent:
            return "cot θ";
        case Label::Secant:
            return "sec θ";
        case Label::Cosecant:
            return "csc θ";
        case Label::Theta:
            return "θ";
        case Label::Unit:
            return "1.0";
    }
    return "";
}

// Short identifier used in command ids and logs, e.g. "sin".
constexpr std::string_view label_id(Label label)
{
    switch (label)
    {
        case Label::Sine:
            return "sin";
        case Label::Cosine:
            return "cos";
        case Label::Tangent:
            return "tan";
        case Label::Cotangent:
            return "cot";
        case Label::Secant:
            return "sec";
        case Label::Cosecant:
            return "csc";
        case Label::Theta:
            return "theta";
        case Label::Unit:
            return "unit";
    }
    return "";
}

}   // namespace trigon
