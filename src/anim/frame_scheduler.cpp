#include "frame_scheduler.hpp"

#include <thread>
#include <trigon/logger.hpp>

namespace trigon
{

FrameScheduler::FrameScheduler(float target_fps, Mode mode) : mode_(mode)
{
    set_target_fps(target_fps);
    reset();
}

void FrameScheduler::set_target_fps(float fps)
{
    if (fps > 0.0f)
    {
        target_fps_ = fps;
    }
}

void FrameScheduler::set_max_dt(float seconds)
{
    if (seconds > 0.0f)
    {
        max_dt_ = seconds;
    }
}

void FrameScheduler::begin_frame()
{
    TRIGON_LOG_TRACE("scheduler", "begin_frame {}", frame_.number);
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        start_time_       = frame_start_;
        last_frame_start_ = frame_start_;
        frame_.dt          = 0.0f;
        frame_.elapsed_sec = 0.0f;
        frame_.number      = 0;
        return;
    }

    Duration elapsed_since_start = frame_start_ - start_time_;
    Duration dt_duration         = frame_start_ - last_frame_start_;
    last_frame_start_            = frame_start_;

    float raw_dt = static_cast<float>(dt_duration.count());
    if (raw_dt > max_dt_)
    {
        raw_dt = max_dt_;
    }

    frame_.dt          = raw_dt;
    frame_.elapsed_sec = static_cast<float>(elapsed_since_start.count());
    frame_.number++;

    update_stats(raw_dt * 1000.0f);
}

void FrameScheduler::end_frame()
{
    if (mode_ != Mode::TargetFPS || target_fps_ <= 0.0f)
        return;

    Duration target_frame_time{1.0 / static_cast<double>(target_fps_)};
    Duration frame_duration = Clock::now() - frame_start_;
    if (frame_duration >= target_frame_time)
        return;

    // Sleep for most of the remaining time, leave 1ms for the spin
    Duration remaining  = target_frame_time - frame_duration;
    auto     sleep_time = remaining - Duration{0.001};
    if (sleep_time.count() > 0.0)
    {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(sleep_time));
    }

    auto deadline = frame_start_ + std::chrono::duration_cast<Clock::duration>(target_frame_time);
    auto spin_cap = Clock::now() + std::chrono::milliseconds(10);
    while (Clock::now() < deadline && Clock::now() < spin_cap)
    {
    }
}

void FrameScheduler::reset()
{
    first_frame_       = true;
    frame_             = Frame{};
    stats_             = FrameStats{};
    max_dt_in_window_  = 0.0f;
    dt_sum_in_window_  = 0.0;
    hitches_in_window_ = 0;
    window_counter_    = 0;
}

void FrameScheduler::update_stats(float dt_ms)
{
    if (dt_ms > max_dt_in_window_)
        max_dt_in_window_ = dt_ms;
    dt_sum_in_window_ += dt_ms;
    window_counter_++;

    float target_ms = 1000.0f / target_fps_;
    if (dt_ms > target_ms * 2.0f)
    {
        hitches_in_window_++;
        TRIGON_LOG_DEBUG("scheduler",
                         "Frame {} hitch: {}ms (target: {}ms)",
                         frame_.number,
                         dt_ms,
                         target_ms);
    }

    if (window_counter_ >= STATS_WINDOW_FRAMES)
    {
        stats_.max_frame_time_ms  = max_dt_in_window_;
        stats_.avg_frame_time_ms  = static_cast<float>(dt_sum_in_window_ / window_counter_);
        stats_.hitch_count        = hitches_in_window_;
        stats_.window_frame_count = window_counter_;

        if (hitches_in_window_ > 0)
        {
            TRIGON_LOG_INFO("scheduler",
                            "Stats ({} frames): avg={}ms max={}ms hitches={}",
                            STATS_WINDOW_FRAMES,
                            stats_.avg_frame_time_ms,
                            stats_.max_frame_time_ms,
                            hitches_in_window_);
        }

        max_dt_in_window_  = 0.0f;
        dt_sum_in_window_  = 0.0;
        hitches_in_window_ = 0;
        window_counter_    = 0;
    }
}

}   // namespace trigon
