#pragma once

#include <ctime>
#include <string>

#include "color.hpp"
#include "constants.hpp"
#include "geometry.hpp"

namespace viewmark {

/// Camera pose as seen by a viewport: where it looks, how it is turned,
/// and how far back it sits.
struct Pose {
    Vec3  pivot = Vec3::Zero();
    Quat  rotation = Quat::Identity();
    float size = DEFAULT_VIEW_SIZE;
    bool  orthographic = false;
    float distance = DEFAULT_CAMERA_DISTANCE;

    bool operator==(const Pose& other) const;
    bool operator!=(const Pose& other) const { return !(*this == other); }
};

/// World-space camera position for a pose.
Vec3 camera_position(const Pose& pose);

/// Camera forward axis for a pose.
Vec3 camera_forward(const Pose& pose);

/// A named camera viewpoint.
///
/// Identity is positional: a bookmark is addressed by its index in its
/// context's list. `pivot` must stay consistent with `camera_position`,
/// `rotation` and `camera_distance`; use reconcile() after editing the
/// position directly.
struct Bookmark {
    std::string name;
    Vec3  pivot = Vec3::Zero();
    Quat  rotation = Quat::Identity();
    float size = DEFAULT_VIEW_SIZE;
    bool  orthographic = false;
    Rgba  color;
    float camera_distance = DEFAULT_CAMERA_DISTANCE;
    Vec3  camera_position = Vec3::Zero();

    /// Recompute pivot from camera_position, rotation and distance.
    void reconcile();

    /// Pose that reproduces this bookmark, pivot reconciled.
    Pose to_pose() const;

    bool operator==(const Bookmark& other) const;
    bool operator!=(const Bookmark& other) const { return !(*this == other); }
};

/// Build a bookmark from a captured pose. The camera position is
/// derived from the pose so the two stay consistent.
Bookmark bookmark_from_pose(const std::string& name, const Pose& pose, const Rgba& color);

/// "Bookmark HHMMSS" for the given local time.
std::string default_bookmark_name(std::time_t when);

} // namespace viewmark
