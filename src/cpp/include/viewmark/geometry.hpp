#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace viewmark {

using Vec3 = Eigen::Vector3f;
using Quat = Eigen::Quaternionf;

/// Camera forward axis for a rotation (left-handed, +Z forward).
Vec3 forward(const Quat& rotation);

/// Rotation from Euler angles in degrees, applied Z, then X, then Y.
Quat euler_to_rotation(const Vec3& degrees);

/// Euler angles in degrees for a rotation, each wrapped to [0, 360).
/// Inverse of euler_to_rotation up to gimbal lock (X = +/-90 puts all
/// yaw into Y and reports Z as 0).
Vec3 rotation_to_euler(const Quat& rotation);

/// Pivot a camera at `position` looks at when it sits `distance` in
/// front of it. Negative distances are treated as zero.
Vec3 reconcile_pivot(const Vec3& position, const Quat& rotation, float distance);

/// Distance along `camera_forward` from the camera to the pivot, never
/// negative. Used when the host does not track a camera distance.
float fallback_camera_distance(const Vec3& pivot,
                               const Vec3& camera_position,
                               const Vec3& camera_forward);

} // namespace viewmark
