#include <gtest/gtest.h>

#include <vector>

#include "viewmark/constants.hpp"
#include "viewmark/nearest.hpp"

namespace viewmark {
namespace {

std::vector<Bookmark> with_pivots(const std::vector<Vec3>& pivots) {
    std::vector<Bookmark> records;
    for (const auto& p : pivots) {
        Bookmark bm;
        bm.pivot = p;
        bm.camera_position = p;
        records.push_back(bm);
    }
    return records;
}

const Vec3 kOrigin = Vec3::Zero();
const Vec3 kAlongX = Vec3(1.0f, 0.0f, 0.0f);

TEST(NearestTest, EmptyListHasNoHit) {
    EXPECT_FALSE(nearest_look_target({}, kOrigin, kAlongX).has_value());
}

TEST(NearestTest, SingleRecordAlwaysWins) {
    auto records = with_pivots({Vec3(3.0f, 4.0f, 0.0f)});
    auto hit = nearest_look_target(records, kOrigin, kAlongX);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 0u);
    EXPECT_FLOAT_EQ(hit->score, 4.0f);
}

TEST(NearestTest, PointOnRayTiesGoToFirst) {
    // A at the origin, B ahead on the ray, C behind
    auto records = with_pivots({
        Vec3(0.0f, 0.0f, 0.0f),
        Vec3(10.0f, 0.0f, 0.0f),
        Vec3(0.0f, 0.0f, -5.0f),
    });
    auto hit = nearest_look_target(records, kOrigin, kAlongX);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 0u);
    EXPECT_FLOAT_EQ(hit->score, 0.0f);
    EXPECT_FLOAT_EQ(look_score(records[1].pivot, kOrigin, kAlongX), 0.0f);
}

TEST(NearestTest, PointsBehindArePenalized) {
    EXPECT_FLOAT_EQ(look_score(Vec3(-5.0f, 1.0f, 0.0f), kOrigin, kAlongX),
                    1.0f * BEHIND_PENALTY);
    EXPECT_FLOAT_EQ(look_score(Vec3(5.0f, 1.0f, 0.0f), kOrigin, kAlongX), 1.0f);
}

TEST(NearestTest, PenaltyDisfavorsButDoesNotExclude) {
    // Behind scores 2 * 1 = 2, ahead scores 3
    auto records = with_pivots({Vec3(5.0f, 3.0f, 0.0f), Vec3(-5.0f, 1.0f, 0.0f)});
    auto hit = nearest_look_target(records, kOrigin, kAlongX);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 1u);
    EXPECT_FLOAT_EQ(hit->score, 2.0f);
}

TEST(NearestTest, EqualScoresPickLowestIndex) {
    auto records = with_pivots({
        Vec3(5.0f, 2.0f, 0.0f),
        Vec3(1.0f, 1.0f, 0.0f),
        Vec3(9.0f, 0.0f, -1.0f),
    });
    auto hit = nearest_look_target(records, kOrigin, kAlongX);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 1u);
}

TEST(NearestTest, OffsetOrigin) {
    Vec3 origin(0.0f, 10.0f, 0.0f);
    Vec3 down(0.0f, -1.0f, 0.0f);
    auto records = with_pivots({Vec3(2.0f, 0.0f, 0.0f), Vec3(0.0f, 0.0f, 0.5f)});
    auto hit = nearest_look_target(records, origin, down);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 1u);
    EXPECT_FLOAT_EQ(hit->score, 0.5f);
}

} // namespace
} // namespace viewmark
