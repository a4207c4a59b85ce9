#include "viewmark/viewport.hpp"

namespace viewmark {

VirtualViewport::VirtualViewport(const Pose& pose)
    : pose_(pose) {
}

bool VirtualViewport::is_active() const {
    return active_;
}

Pose VirtualViewport::read_current_pose() const {
    return pose_;
}

void VirtualViewport::apply_pose(const Pose& pose, bool /*instant*/) {
    pose_ = pose;
    ++apply_count_;
}

} // namespace viewmark
