#include "viewmark/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace viewmark {

namespace {

constexpr float DEG_TO_RAD = 3.14159265358979323846f / 180.0f;
constexpr float RAD_TO_DEG = 180.0f / 3.14159265358979323846f;

float wrap_degrees(float angle) {
    float wrapped = std::fmod(angle, 360.0f);
    if (wrapped < 0.0f) {
        wrapped += 360.0f;
    }
    // fmod of a tiny negative value can land exactly on 360
    return wrapped >= 360.0f ? 0.0f : wrapped;
}

} // anonymous namespace

Vec3 forward(const Quat& rotation) {
    return rotation * Vec3::UnitZ();
}

Quat euler_to_rotation(const Vec3& degrees) {
    const Quat qx(Eigen::AngleAxisf(degrees.x() * DEG_TO_RAD, Vec3::UnitX()));
    const Quat qy(Eigen::AngleAxisf(degrees.y() * DEG_TO_RAD, Vec3::UnitY()));
    const Quat qz(Eigen::AngleAxisf(degrees.z() * DEG_TO_RAD, Vec3::UnitZ()));
    return (qy * qx * qz).normalized();
}

Vec3 rotation_to_euler(const Quat& rotation) {
    // R = Ry * Rx * Rz, so R(1,2) = -sin(x)
    const Eigen::Matrix3f m = rotation.normalized().toRotationMatrix();
    const float sin_x = std::clamp(-m(1, 2), -1.0f, 1.0f);
    const float x = std::asin(sin_x);

    float y = 0.0f;
    float z = 0.0f;
    if (std::abs(sin_x) < 0.9999f) {
        y = std::atan2(m(0, 2), m(2, 2));
        z = std::atan2(m(1, 0), m(1, 1));
    } else {
        y = std::atan2(-m(2, 0), m(0, 0));
    }

    return Vec3(wrap_degrees(x * RAD_TO_DEG),
                wrap_degrees(y * RAD_TO_DEG),
                wrap_degrees(z * RAD_TO_DEG));
}

Vec3 reconcile_pivot(const Vec3& position, const Quat& rotation, float distance) {
    return position + forward(rotation) * std::max(0.0f, distance);
}

float fallback_camera_distance(const Vec3& pivot,
                               const Vec3& camera_position,
                               const Vec3& camera_forward) {
    return std::max(0.0f, (pivot - camera_position).dot(camera_forward));
}

} // namespace viewmark
