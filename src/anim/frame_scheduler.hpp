#pragma once

#include <chrono>
#include <cstdint>
#include <trigon/frame.hpp>

namespace trigon
{

// Measures the time between frames and paces the loop.
class FrameScheduler
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep + spin-wait to hit target FPS
        VSync,       // Let the swapchain present pace the loop
    };

    explicit FrameScheduler(float target_fps = 60.0f, Mode mode = Mode::TargetFPS);

    // TargetFPS for a positive rate, VSync otherwise
    static Mode mode_for(float target_fps) { return target_fps > 0.0f ? Mode::TargetFPS : Mode::VSync; }

    // Ignored unless positive
    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Longest dt handed to the scene; a stalled frame (window drag, debugger)
    // would otherwise make the angle jump.
    void  set_max_dt(float seconds);
    float max_dt() const { return max_dt_; }

    // Call at the start and end of each frame
    void begin_frame();
    void end_frame();

    void reset();

    const Frame& current_frame() const { return frame_; }
    float        elapsed_seconds() const { return frame_.elapsed_sec; }
    float        dt() const { return frame_.dt; }
    uint64_t     frame_number() const { return frame_.number; }

    struct FrameStats
    {
        float    max_frame_time_ms  = 0.0f;
        float    avg_frame_time_ms  = 0.0f;
        uint32_t hitch_count        = 0;   // frames > 2x target in window
        uint64_t window_frame_count = 0;
    };
    FrameStats frame_stats() const { return stats_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    float target_fps_ = 60.0f;
    Mode  mode_       = Mode::TargetFPS;
    float max_dt_     = 0.25f;

    TimePoint start_time_;
    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    Frame frame_;

    static constexpr uint64_t STATS_WINDOW_FRAMES = 600;   // ~10s at 60fps
    FrameStats                stats_;
    float                     max_dt_in_window_  = 0.0f;
    double                    dt_sum_in_window_  = 0.0;
    uint32_t                  hitches_in_window_ = 0;
    uint64_t                  window_counter_    = 0;

    void update_stats(float dt_ms);
};

}   // namespace trigon
