#include "viewmark/transition.hpp"

#include <algorithm>
#include <cmath>

#include "viewmark/log.hpp"

namespace viewmark {

ViewportTransition::ViewportTransition(IViewport* viewport)
    : viewport_(viewport) {
}

void ViewportTransition::start(const Pose& current, const Bookmark& target,
                               double duration, TimePoint now) {
    start_pose_  = current;
    target_pose_ = target.to_pose();
    start_time_  = now;
    // Also catches NaN and infinity
    duration_    = (std::isfinite(duration) && duration > MIN_TRANSITION_DURATION)
                   ? duration : MIN_TRANSITION_DURATION;
    state_       = State::ANIMATING;
}

bool ViewportTransition::tick(TimePoint now) {
    if (state_ != State::ANIMATING) {
        return false;
    }
    if (!viewport_ || !viewport_->is_active()) {
        logger()->warn("Viewport went away mid-transition; cancelling");
        cancel();
        return false;
    }

    double elapsed = std::chrono::duration<double>(now - start_time_).count();
    double t = std::clamp(elapsed / duration_, 0.0, 1.0);

    if (t >= 1.0) {
        viewport_->apply_pose(target_pose_, true);
        state_ = State::IDLE;
        return false;
    }

    viewport_->apply_pose(interpolate(start_pose_, target_pose_,
                                      static_cast<float>(ease(t))), true);
    return true;
}

void ViewportTransition::cancel() {
    state_ = State::IDLE;
}

Pose ViewportTransition::interpolate(const Pose& from, const Pose& to, float s) {
    s = std::clamp(s, 0.0f, 1.0f);
    Pose pose;
    pose.pivot        = from.pivot + (to.pivot - from.pivot) * s;
    pose.rotation     = from.rotation.slerp(s, to.rotation);
    pose.size         = from.size + (to.size - from.size) * s;
    pose.distance     = from.distance + (to.distance - from.distance) * s;
    pose.orthographic = to.orthographic;
    return pose;
}

double ViewportTransition::ease(double t) {
    t = std::clamp(t, 0.0, 1.0);
    return t * t * (3.0 - 2.0 * t);
}

} // namespace viewmark
