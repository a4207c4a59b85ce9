#pragma once

#include <cstddef>

#include "bookmark.hpp"

namespace viewmark {

/// Host surface that owns the camera being bookmarked.
///
/// This is the only coupling point to a renderer or editor. Callers must
/// check is_active() before reading or applying poses.
class IViewport {
public:
    virtual ~IViewport() = default;

    /// True while there is a camera to read from and write to.
    virtual bool is_active() const = 0;

    /// Current camera pose. Hosts that do not track a camera distance
    /// should fill it with fallback_camera_distance().
    virtual Pose read_current_pose() const = 0;

    /// Move the camera. `instant` is false when the host may smooth the
    /// change itself.
    virtual void apply_pose(const Pose& pose, bool instant) = 0;
};

/// In-memory viewport holding a single pose. Used by the command-line
/// tool and the Python bindings where no renderer is attached.
class VirtualViewport : public IViewport {
public:
    VirtualViewport() = default;
    explicit VirtualViewport(const Pose& pose);

    bool is_active() const override;
    Pose read_current_pose() const override;
    void apply_pose(const Pose& pose, bool instant) override;

    void set_active(bool active) { active_ = active; }

    /// Number of apply_pose calls so far.
    std::size_t apply_count() const { return apply_count_; }

private:
    Pose pose_;
    bool active_ = true;
    std::size_t apply_count_ = 0;
};

} // namespace viewmark
