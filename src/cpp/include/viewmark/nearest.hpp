#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "bookmark.hpp"

namespace viewmark {

/// Winner of a nearest-look-target query.
struct NearestHit {
    std::size_t index = 0;
    float score = 0.0f;
};

/// Score of one pivot against a look ray: its perpendicular distance to
/// the ray's line, doubled when the pivot is behind the origin.
float look_score(const Vec3& pivot, const Vec3& ray_origin, const Vec3& ray_direction);

/// Bookmark whose pivot lies closest to the look ray.
///
/// `ray_direction` must be normalized; the result is meaningless
/// otherwise. Equal scores go to the lowest index. Returns nullopt for an
/// empty list.
std::optional<NearestHit> nearest_look_target(const std::vector<Bookmark>& records,
                                              const Vec3& ray_origin,
                                              const Vec3& ray_direction);

} // namespace viewmark
