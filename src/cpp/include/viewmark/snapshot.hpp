#pragma once

#include <string>
#include <vector>

#include "bookmark_store.hpp"
#include "status.hpp"

namespace viewmark {

/// Persisted form of a BookmarkStore.
///
/// `legacy_records` holds bookmarks from the single flat list used before
/// bookmarks were kept per context. It is only ever filled by decoding.
struct Snapshot {
    ContextKey active_context;
    bool has_active_context = false;
    std::vector<Bucket> buckets;
    std::vector<Bookmark> legacy_records;
};

/// Copy the store's buckets and active context.
Snapshot take_snapshot(const BookmarkStore& store);

/// Serialize to JSON. Floats keep enough digits to read back exactly.
std::string encode_snapshot(const Snapshot& snapshot);
std::string encode_snapshot(const BookmarkStore& store);

/// Parse JSON written by encode_snapshot (or the legacy flat layout).
/// Throws SnapshotError on malformed input.
Snapshot decode_snapshot(const std::string& json);

/// Replace the store's content with a decoded snapshot.
///
/// Legacy records are appended to the active context's bucket and
/// dropped. Malformed input leaves an empty store and returns
/// MALFORMED_SNAPSHOT.
Status restore_snapshot(BookmarkStore& store, const std::string& json);

/// Load a bookmark file into the store. A missing file is NO_OP.
Status load_store_file(BookmarkStore& store, const std::string& path);

/// Write the store to a bookmark file. Throws StoreFileError.
void save_store_file(const BookmarkStore& store, const std::string& path);

} // namespace viewmark
