#include "viewmark/nearest.hpp"

#include <limits>

#include "viewmark/constants.hpp"

namespace viewmark {

float look_score(const Vec3& pivot, const Vec3& ray_origin, const Vec3& ray_direction) {
    float t = (pivot - ray_origin).dot(ray_direction);
    Vec3 closest_on_line = ray_origin + ray_direction * t;
    float perpendicular = (pivot - closest_on_line).norm();
    return perpendicular * (t < 0.0f ? BEHIND_PENALTY : 1.0f);
}

std::optional<NearestHit> nearest_look_target(const std::vector<Bookmark>& records,
                                              const Vec3& ray_origin,
                                              const Vec3& ray_direction) {
    if (records.empty()) {
        return std::nullopt;
    }

    NearestHit best;
    best.score = std::numeric_limits<float>::infinity();
    bool found = false;

    for (std::size_t i = 0; i < records.size(); ++i) {
        float score = look_score(records[i].pivot, ray_origin, ray_direction);
        if (!found || score < best.score) {
            best.index = i;
            best.score = score;
            found = true;
        }
    }
    return best;
}

} // namespace viewmark
