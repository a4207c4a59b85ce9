#include "viewmark/bookmark.hpp"

#include <algorithm>
#include <cstdio>

namespace viewmark {

namespace {

bool same_rotation(const Quat& a, const Quat& b) {
    return a.coeffs() == b.coeffs();
}

} // anonymous namespace

bool Pose::operator==(const Pose& other) const {
    return pivot == other.pivot
        && same_rotation(rotation, other.rotation)
        && size == other.size
        && orthographic == other.orthographic
        && distance == other.distance;
}

Vec3 camera_position(const Pose& pose) {
    return pose.pivot - camera_forward(pose) * std::max(0.0f, pose.distance);
}

Vec3 camera_forward(const Pose& pose) {
    return forward(pose.rotation);
}

void Bookmark::reconcile() {
    pivot = reconcile_pivot(camera_position, rotation, camera_distance);
}

Pose Bookmark::to_pose() const {
    Pose pose;
    pose.pivot = reconcile_pivot(camera_position, rotation, camera_distance);
    pose.rotation = rotation;
    pose.size = size;
    pose.orthographic = orthographic;
    pose.distance = std::max(0.0f, camera_distance);
    return pose;
}

bool Bookmark::operator==(const Bookmark& other) const {
    return name == other.name
        && pivot == other.pivot
        && same_rotation(rotation, other.rotation)
        && size == other.size
        && orthographic == other.orthographic
        && color == other.color
        && camera_distance == other.camera_distance
        && camera_position == other.camera_position;
}

Bookmark bookmark_from_pose(const std::string& name, const Pose& pose, const Rgba& color) {
    Bookmark bm;
    bm.name = name;
    bm.pivot = pose.pivot;
    bm.rotation = pose.rotation;
    bm.size = pose.size;
    bm.orthographic = pose.orthographic;
    bm.color = color;
    bm.camera_distance = std::max(0.0f, pose.distance);
    bm.camera_position = camera_position(pose);
    return bm;
}

std::string default_bookmark_name(std::time_t when) {
    std::tm local{};
    localtime_r(&when, &local);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "Bookmark %02d%02d%02d",
                  local.tm_hour, local.tm_min, local.tm_sec);
    return buf;
}

} // namespace viewmark
