#pragma once

#include <chrono>

#include "bookmark.hpp"
#include "constants.hpp"
#include "viewport.hpp"

namespace viewmark {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Eased camera move from the current pose to a bookmark.
///
/// Idle until start(); tick() then pushes one interpolated pose per call
/// and finishes with the exact target pose. Starting again while a move
/// is running replaces it. The host calls tick() once per frame; nothing
/// here blocks.
class ViewportTransition {
public:
    enum class State {
        IDLE,
        ANIMATING,
    };

    /// Construct with a viewport (non-owning pointer).
    explicit ViewportTransition(IViewport* viewport);

    /// Begin moving from `current` to `target` over `duration` seconds.
    /// Durations <= 0 or not finite become MIN_TRANSITION_DURATION.
    void start(const Pose& current, const Bookmark& target,
               double duration, TimePoint now);

    /// Advance to `now`. Returns true while still animating.
    bool tick(TimePoint now);

    /// Drop the running move without touching the viewport.
    void cancel();

    State state() const { return state_; }
    bool is_animating() const { return state_ == State::ANIMATING; }

    const Pose& start_pose() const { return start_pose_; }
    const Pose& target_pose() const { return target_pose_; }
    double duration() const { return duration_; }

    /// Pose at eased fraction `s` in [0, 1] between two poses.
    static Pose interpolate(const Pose& from, const Pose& to, float s);

    /// Smoothstep ease: t^2 (3 - 2t) on t clamped to [0, 1].
    static double ease(double t);

private:
    IViewport* viewport_;
    State      state_ = State::IDLE;
    Pose       start_pose_;
    Pose       target_pose_;
    TimePoint  start_time_{};
    double     duration_ = DEFAULT_TRANSITION_DURATION;
};

} // namespace viewmark
