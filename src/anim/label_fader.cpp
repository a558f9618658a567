#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <trigon/label_fader.hpp>
#include <trigon/logger.hpp>
#include <utility>

namespace trigon
{

void FadeConfig::validate() const
{
    if (!(fade_in_seconds > 0.0f && std::isfinite(fade_in_seconds)))
        throw std::invalid_argument("fade_in_seconds must be finite and positive");
    if (!(fade_out_seconds > 0.0f && std::isfinite(fade_out_seconds)))
        throw std::invalid_argument("fade_out_seconds must be finite and positive");
    if (!(fade_intensity >= 0.0f && fade_intensity <= 1.0f))
        throw std::invalid_argument("fade_intensity must lie in [0, 1]");
    if (!(label_half_extent.x >= 0.0f && label_half_extent.y >= 0.0f
          && std::isfinite(label_half_extent.x) && std::isfinite(label_half_extent.y)))
        throw std::invalid_argument("label_half_extent must be finite and non-negative");
}

LabelOverlapFader::LabelOverlapFader(const FadeConfig& config) : config_(config)
{
    config_.validate();
    reset();
}

void LabelOverlapFader::set_config(const FadeConfig& config)
{
    config.validate();
    config_ = config;

    for (auto& rec : records_)
    {
        rec.rect.half_extent = config_.label_half_extent;
        rec.opacity          = std::clamp(rec.opacity, config_.min_opacity(), 1.0f);
    }
    TRIGON_LOG_DEBUG("fader",
                     "Fade config: in={}s out={}s intensity={}",
                     config_.fade_in_seconds,
                     config_.fade_out_seconds,
                     config_.fade_intensity);
}

void LabelOverlapFader::reset()
{
    for (auto& rec : records_)
    {
        rec.rect        = Aabb::from_center({0.0f, 0.0f}, config_.label_half_extent);
        rec.should_fade = false;
        rec.enabled     = true;
        rec.opacity     = 1.0f;
    }
}

const LabelOverlapFader::Record& LabelOverlapFader::record(Label label) const
{
    size_t idx = index_of(label);
    if (idx >= records_.size())
    {
        throw std::out_of_range("Unknown label ordinal " + std::to_string(idx));
    }
    return records_[idx];
}

LabelOverlapFader::Record& LabelOverlapFader::record(Label label)
{
    return const_cast<Record&>(std::as_const(*this).record(label));
}

void LabelOverlapFader::set_position(Label label, Vec2 point)
{
    record(label).rect = Aabb::from_center(point, config_.label_half_extent);
}

void LabelOverlapFader::set_enabled(Label label, bool enabled)
{
    record(label).enabled = enabled;
}

bool LabelOverlapFader::enabled(Label label) const
{
    return record(label).enabled;
}

void LabelOverlapFader::evaluate_overlaps()
{
    // Pass 1 reads rectangles only; pass 2 publishes the flags.
    std::array<bool, kLabelCount> fading{};

    for (Label curr : kAllLabels)
    {
        if (!is_watched(curr))
            continue;

        const Aabb& curr_rect = records_[index_of(curr)].rect;
        for (Label other : kAllLabels)
        {
            if (other == curr || !trigon::should_fade(curr, other))
                continue;

            const Record& other_rec = records_[index_of(other)];
            if (other_rec.enabled && curr_rect.overlaps(other_rec.rect))
            {
                fading[index_of(curr)] = true;
                break;
            }
        }
    }

    for (Label l : kAllLabels)
    {
        if (is_watched(l))
            records_[index_of(l)].should_fade = fading[index_of(l)];
    }
}

void LabelOverlapFader::advance_opacity(float dt)
{
    const float fade_out_rate = 1.0f / config_.fade_out_seconds;
    const float fade_in_rate  = 1.0f / config_.fade_in_seconds;
    const float min_opacity   = config_.min_opacity();

    for (Label l : kAllLabels)
    {
        if (!is_watched(l))
            continue;

        Record& rec  = records_[index_of(l)];
        float   step = rec.should_fade ? -fade_out_rate * dt : fade_in_rate * dt;
        rec.opacity  = std::clamp(rec.opacity + step, min_opacity, 1.0f);
    }
}

void LabelOverlapFader::update(float dt)
{
    evaluate_overlaps();
    advance_opacity(dt);
}

float LabelOverlapFader::get_opacity(Label label) const
{
    size_t idx = index_of(label);
    if (idx >= records_.size() || !is_watched(label))
        return 1.0f;
    return records_[idx].opacity;
}

Vec2 LabelOverlapFader::get_position(Label label) const
{
    return record(label).rect.center;
}

bool LabelOverlapFader::should_fade(Label label) const
{
    return record(label).should_fade;
}

const Aabb& LabelOverlapFader::rect(Label label) const
{
    return record(label).rect;
}

}   // namespace trigon
