#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>
#include <unistd.h>
#include <vector>

#include "viewmark/constants.hpp"
#include "viewmark/snapshot.hpp"
#include "viewmark/task_queue.hpp"

namespace viewmark {
namespace {

Bookmark make_bookmark(const std::string& name, float seed) {
    Bookmark bm;
    bm.name = name;
    bm.rotation = euler_to_rotation(Vec3(seed * 7.0f, seed * 13.0f, 0.0f));
    bm.camera_position = Vec3(seed, -seed * 0.5f, seed * 0.1f + 0.3f);
    bm.camera_distance = 1.0f + seed / 3.0f;
    bm.size = 0.7f + seed;
    bm.orthographic = (static_cast<int>(seed) % 2) == 1;
    bm.color = Rgba{0.1f * seed, 0.25f, 0.333f, 1.0f};
    bm.reconcile();
    return bm;
}

/// Fixture with a store and a unique temporary bookmark file.
class SnapshotTest : public ::testing::Test {
protected:
    std::string tmp_path;
    TaskQueue queue;
    BookmarkStore store{queue};

    void SetUp() override {
        tmp_path = "/tmp/viewmark_test_snapshot_"
                   + std::to_string(getpid()) + "_"
                   + std::to_string(reinterpret_cast<uintptr_t>(this))
                   + ".json";
        store.set_active_context("scene-a");
    }

    void TearDown() override {
        std::remove(tmp_path.c_str());
    }
};

// ---- RoundTrip ----

TEST_F(SnapshotTest, RoundTripKeepsEveryBucketAndRecord) {
    store.set_active_context("scene-a", "Assets/A.unity");
    store.add(make_bookmark("a0", 1.0f));
    store.add(make_bookmark("a1", 2.0f));
    store.set_active_context("scene-b", "Assets/B.unity");
    store.set_active_context("scene-c", "Assets/C.unity");
    for (int i = 0; i < 5; ++i) {
        store.add(make_bookmark("c" + std::to_string(i), 3.0f + static_cast<float>(i) * 0.37f));
    }
    store.set_active_context("scene-b");

    std::string json = encode_snapshot(store);

    TaskQueue other_queue;
    BookmarkStore restored(other_queue);
    ASSERT_EQ(restore_snapshot(restored, json), Status::OK);

    EXPECT_EQ(restored.active_context(), "scene-b");
    ASSERT_EQ(restored.contexts(), store.contexts());
    for (const auto& key : store.contexts()) {
        EXPECT_EQ(restored.context_path(key), store.context_path(key)) << key;
        EXPECT_EQ(restored.records(key), store.records(key)) << key;
    }
    EXPECT_EQ(restored.size("scene-a"), 2u);
    EXPECT_EQ(restored.size("scene-b"), 0u);
    EXPECT_EQ(restored.size("scene-c"), 5u);
}

TEST_F(SnapshotTest, EncodedFormUsesDocumentedKeys) {
    store.add(make_bookmark("a0", 1.0f));
    std::string json = encode_snapshot(store);

    EXPECT_NE(json.find("\"activeContext\": \"scene-a\""), std::string::npos);
    EXPECT_NE(json.find("\"buckets\""), std::string::npos);
    EXPECT_NE(json.find("\"contextPath\""), std::string::npos);
    EXPECT_NE(json.find("\"cameraDistance\""), std::string::npos);
    EXPECT_NE(json.find("\"cameraPosition\""), std::string::npos);
    EXPECT_NE(json.find("\"legacyRecords\": []"), std::string::npos);
}

TEST_F(SnapshotTest, NamesWithEscapesSurvive) {
    Bookmark bm = make_bookmark("say \"hi\"\\\n\tcaf\xc3\xa9", 1.0f);
    store.add(bm);

    TaskQueue other_queue;
    BookmarkStore restored(other_queue);
    ASSERT_EQ(restore_snapshot(restored, encode_snapshot(store)), Status::OK);
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored.get(0)->name, bm.name);
}

TEST_F(SnapshotTest, UnicodeEscapeDecodesToUtf8) {
    Snapshot snap = decode_snapshot(
        R"({"activeContext": "s", "buckets": [{"key": "s", "records": [)"
        R"({"name": "caf\u00e9"}]}]})");
    ASSERT_EQ(snap.buckets.size(), 1u);
    ASSERT_EQ(snap.buckets[0].records.size(), 1u);
    EXPECT_EQ(snap.buckets[0].records[0].name, "caf\xc3\xa9");
}

TEST_F(SnapshotTest, NonFiniteFloatsAreWrittenAsZero) {
    Bookmark bm = make_bookmark("nan", 1.0f);
    bm.size = std::numeric_limits<float>::quiet_NaN();
    store.add(bm);

    TaskQueue other_queue;
    BookmarkStore restored(other_queue);
    ASSERT_EQ(restore_snapshot(restored, encode_snapshot(store)), Status::OK);
    EXPECT_FLOAT_EQ(restored.get(0)->size, 0.0f);
}

// ---- Decoding ----

TEST_F(SnapshotTest, UnknownKeysAreSkipped) {
    Snapshot snap = decode_snapshot(R"({
        "version": 3,
        "extra": {"nested": [1, 2.5e-3, null, "x", true, {"deep": false}]},
        "activeContext": "s",
        "buckets": [{"key": "s", "flag": null, "records": [{"name": "n", "future": [1]}]}]
    })");
    ASSERT_EQ(snap.buckets.size(), 1u);
    EXPECT_EQ(snap.buckets[0].records[0].name, "n");
}

TEST_F(SnapshotTest, MissingFieldsTakeDefaults) {
    Snapshot snap = decode_snapshot(R"({"buckets": [{"key": "s", "records": [{
        "name": "n", "pivot": [0, 0, 5], "rotation": [0, 0, 0, 1], "cameraDistance": 5
    }]}]})");
    EXPECT_FALSE(snap.has_active_context);
    const Bookmark& bm = snap.buckets[0].records[0];
    EXPECT_EQ(bm.color, Rgba{});
    EXPECT_FALSE(bm.orthographic);
    // Camera position derived from pivot, rotation and distance
    EXPECT_NEAR(bm.camera_position.x(), 0.0f, 1e-6f);
    EXPECT_NEAR(bm.camera_position.y(), 0.0f, 1e-6f);
    EXPECT_NEAR(bm.camera_position.z(), 0.0f, 1e-6f);
}

TEST_F(SnapshotTest, DecodeThrowsOnMalformedInput) {
    EXPECT_THROW(decode_snapshot(""), SnapshotError);
    EXPECT_THROW(decode_snapshot("{ not json"), SnapshotError);
    EXPECT_THROW(decode_snapshot("{} trailing"), SnapshotError);
    EXPECT_THROW(decode_snapshot(R"({"buckets": [{"records": [{"pivot": [1, 2]}]}]})"),
                 SnapshotError);
    EXPECT_THROW(decode_snapshot(R"({"activeContext": "unterminated})"), SnapshotError);
    EXPECT_THROW(decode_snapshot(R"({"buckets": [{"records": [{"size": 1.2.3}]}]})"),
                 SnapshotError);
}

TEST_F(SnapshotTest, ModerateNestingInUnknownKeysIsSkipped) {
    std::string nested = std::string(20, '[') + std::string(20, ']');
    Snapshot snap = decode_snapshot("{\"extra\": " + nested + ", \"activeContext\": \"s\"}");
    EXPECT_EQ(snap.active_context, "s");
}

TEST_F(SnapshotTest, DeepNestingThrows) {
    std::string nested = std::string(MAX_SNAPSHOT_DEPTH + 1, '[')
                       + std::string(MAX_SNAPSHOT_DEPTH + 1, ']');
    EXPECT_THROW(decode_snapshot("{\"extra\": " + nested + "}"), SnapshotError);
}

// ---- Restore ----

TEST_F(SnapshotTest, HugelyNestedSnapshotIsMalformedNotFatal) {
    store.add(make_bookmark("a0", 1.0f));
    std::string json = "{\"x\":" + std::string(2000000, '[')
                     + std::string(2000000, ']') + "}";

    EXPECT_EQ(restore_snapshot(store, json), Status::MALFORMED_SNAPSHOT);
    EXPECT_TRUE(store.contexts().empty());
}

TEST_F(SnapshotTest, DuplicateContextKeysAreMerged) {
    std::string json = R"({
        "activeContext": "a",
        "buckets": [
            {"key": "a", "contextPath": "", "records": [{"name": "first"}]},
            {"key": "b", "records": []},
            {"key": "a", "contextPath": "Assets/A.unity", "records": [{"name": "second"}]}
        ]
    })";

    ASSERT_EQ(restore_snapshot(store, json), Status::OK);
    EXPECT_EQ(store.contexts(), (std::vector<ContextKey>{"a", "b"}));
    ASSERT_EQ(store.size("a"), 2u);
    EXPECT_EQ(store.get("a", 0)->name, "first");
    EXPECT_EQ(store.get("a", 1)->name, "second");
    EXPECT_EQ(store.context_path("a"), "Assets/A.unity");
}

TEST_F(SnapshotTest, MalformedSnapshotEmptiesStore) {
    store.add(make_bookmark("a0", 1.0f));

    EXPECT_EQ(restore_snapshot(store, "{\"buckets\": [ oops"), Status::MALFORMED_SNAPSHOT);

    EXPECT_TRUE(store.contexts().empty());
    EXPECT_EQ(store.size(), 0u);

    // Still usable afterwards
    EXPECT_EQ(store.add(make_bookmark("fresh", 2.0f)), 0u);
}

TEST_F(SnapshotTest, LegacyRecordsMigrateIntoActiveContext) {
    store.add(make_bookmark("existing", 1.0f));
    std::string json = R"({
        "bookmarks": [
            {"name": "old1", "pivot": [1, 2, 3], "rotation": [0, 0, 0, 1],
             "size": 4, "cameraDistance": 2, "cameraPositionAtSave": [1, 2, 1]},
            {"name": "old2", "pivot": [0, 0, 0], "rotation": [0, 0, 0, 1]}
        ]
    })";

    ASSERT_EQ(restore_snapshot(store, json), Status::OK);

    // No activeContext in the file, so the store's current one is used
    EXPECT_EQ(store.active_context(), "scene-a");
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get(0)->name, "old1");
    EXPECT_EQ(store.get(0)->camera_position, Vec3(1.0f, 2.0f, 1.0f));
    EXPECT_EQ(store.get(1)->name, "old2");
}

TEST_F(SnapshotTest, LegacyRecordsAppendAfterExistingBucket) {
    std::string json = R"({
        "activeContext": "s",
        "buckets": [{"key": "s", "contextPath": "S.unity", "records": [{"name": "new"}]}],
        "legacyRecords": [{"name": "old"}]
    })";

    ASSERT_EQ(restore_snapshot(store, json), Status::OK);
    ASSERT_EQ(store.size("s"), 2u);
    EXPECT_EQ(store.get("s", 0)->name, "new");
    EXPECT_EQ(store.get("s", 1)->name, "old");
}

TEST_F(SnapshotTest, LegacyRecordsMigrateExactlyOnce) {
    std::string json = R"({"activeContext": "s", "legacyRecords": [{"name": "old"}]})";
    ASSERT_EQ(restore_snapshot(store, json), Status::OK);

    std::string saved = encode_snapshot(store);
    EXPECT_TRUE(decode_snapshot(saved).legacy_records.empty());

    TaskQueue other_queue;
    BookmarkStore restored(other_queue);
    ASSERT_EQ(restore_snapshot(restored, saved), Status::OK);
    EXPECT_EQ(restored.size("s"), 1u);
}

TEST_F(SnapshotTest, RestoreNotifiesOnce) {
    int calls = 0;
    store.subscribe([&]() { ++calls; });

    ASSERT_EQ(restore_snapshot(store, R"({"activeContext": "x", "buckets": []})"), Status::OK);
    queue.run_pending();
    EXPECT_EQ(calls, 1);
}

// ---- Files ----

TEST_F(SnapshotTest, MissingFileIsNoOp) {
    store.add(make_bookmark("kept", 1.0f));
    EXPECT_EQ(load_store_file(store, tmp_path), Status::NO_OP);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(SnapshotTest, SaveThenLoadFile) {
    store.add(make_bookmark("a0", 1.0f));
    save_store_file(store, tmp_path);

    TaskQueue other_queue;
    BookmarkStore restored(other_queue);
    ASSERT_EQ(load_store_file(restored, tmp_path), Status::OK);
    EXPECT_EQ(restored.records("scene-a"), store.records());
}

TEST_F(SnapshotTest, CorruptFileLoadsEmpty) {
    {
        std::ofstream out(tmp_path);
        out << "garbage";
    }
    store.add(make_bookmark("a0", 1.0f));
    EXPECT_EQ(load_store_file(store, tmp_path), Status::MALFORMED_SNAPSHOT);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SnapshotTest, SaveToUnwritablePathThrows) {
    EXPECT_THROW(save_store_file(store, "/nonexistent_dir_viewmark/bookmarks.json"),
                 StoreFileError);
}

} // namespace
} // namespace viewmark
