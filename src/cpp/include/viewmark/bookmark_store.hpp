#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bookmark.hpp"
#include "status.hpp"
#include "task_queue.hpp"

namespace viewmark {

/// Opaque name of the scene a bookmark list belongs to.
using ContextKey = std::string;

/// Ordered bookmarks for one context. Order is display and hotkey order.
struct Bucket {
    ContextKey key;
    std::string context_path;
    std::vector<Bookmark> records;
};

/// Per-context ordered bookmark lists with deferred change notification.
///
/// Exactly one context is active; index-based calls without an explicit
/// ContextKey address the active context. Buckets are created on first
/// write or activation and are never removed. Callers only ever receive
/// copies, so the pivot rule cannot be bypassed from outside.
///
/// Listeners are not called inline. A mutation posts one notification to
/// the TaskQueue; further mutations in the same turn fold into it.
class BookmarkStore {
public:
    using Listener = std::function<void()>;
    using SubscriptionId = std::uint64_t;

    /// The queue must outlive the store.
    explicit BookmarkStore(TaskQueue& queue);

    // Non-copyable
    BookmarkStore(const BookmarkStore&) = delete;
    BookmarkStore& operator=(const BookmarkStore&) = delete;

    // --- Contexts ---

    /// Make `key` the active context. NO_OP if it already is; a non-empty
    /// `context_path` is recorded either way.
    Status set_active_context(const ContextKey& key, const std::string& context_path = "");

    const ContextKey& active_context() const { return active_; }

    /// Keys of all known contexts in creation order.
    std::vector<ContextKey> contexts() const;

    bool has_context(const ContextKey& key) const;

    /// Scene path recorded for a context ("" if unknown).
    std::string context_path(const ContextKey& key) const;

    // --- Queries ---

    std::size_t size() const;
    std::size_t size(const ContextKey& key) const;

    std::vector<Bookmark> records() const;
    std::vector<Bookmark> records(const ContextKey& key) const;

    /// Bookmark at index, or nullopt when out of range.
    std::optional<Bookmark> get(std::size_t index) const;
    std::optional<Bookmark> get(const ContextKey& key, std::size_t index) const;

    /// Copy of every bucket in creation order.
    std::vector<Bucket> buckets() const;

    // --- Mutators ---

    /// Append and return the new index.
    std::size_t add(const Bookmark& bookmark);
    std::size_t add(const ContextKey& key, const Bookmark& bookmark);

    Status remove_at(std::size_t index);
    Status remove_at(const ContextKey& key, std::size_t index);

    /// Notifies even when the name does not change.
    Status rename(std::size_t index, const std::string& name);
    Status rename(const ContextKey& key, std::size_t index, const std::string& name);

    Status replace(std::size_t index, const Bookmark& bookmark);
    Status replace(const ContextKey& key, std::size_t index, const Bookmark& bookmark);

    /// Move the camera and recompute the pivot from the stored rotation
    /// and distance.
    Status set_position(std::size_t index, const Vec3& position);
    Status set_position(const ContextKey& key, std::size_t index, const Vec3& position);

    /// Turn the camera in place (Z-X-Y Euler degrees); pivot follows.
    Status set_rotation_euler(std::size_t index, const Vec3& degrees);
    Status set_rotation_euler(const ContextKey& key, std::size_t index, const Vec3& degrees);

    Status set_color(std::size_t index, const Rgba& color);
    Status set_color(const ContextKey& key, std::size_t index, const Rgba& color);

    /// Move a bookmark so that it ends up at `new_index`. Unlike
    /// move_to_slot() the target is not decremented when it lies after
    /// `old_index`, so reorder(i, j) is undone by reorder(j, i).
    Status reorder(std::size_t old_index, std::size_t new_index);
    Status reorder(const ContextKey& key, std::size_t old_index, std::size_t new_index);

    /// Drag-and-drop move: `slot` is the gap in [0, size] before which the
    /// bookmark is dropped, counted before it is taken out.
    Status move_to_slot(std::size_t old_index, std::size_t slot);
    Status move_to_slot(const ContextKey& key, std::size_t old_index, std::size_t slot);

    /// Replace every bucket and the active context in one step.
    void assign(std::vector<Bucket> buckets, const ContextKey& active);

    /// Drop every bucket. The active key is kept.
    void clear();

    // --- Notification ---

    SubscriptionId subscribe(Listener listener);

    /// Returns false if the id is unknown.
    bool unsubscribe(SubscriptionId id);

    std::size_t listener_count() const;

private:
    struct Notifier {
        std::vector<std::pair<SubscriptionId, Listener>> listeners;
        SubscriptionId next_id = 1;
        bool pending = false;
    };

    TaskQueue& queue_;
    std::vector<Bucket> buckets_;
    ContextKey active_;
    std::shared_ptr<Notifier> notifier_;

    /// Bucket for key, created when missing.
    Bucket& bucket_for(const ContextKey& key);
    Bucket* find_bucket(const ContextKey& key);
    const Bucket* find_bucket(const ContextKey& key) const;

    /// Records of key's bucket if index is valid, else nullptr.
    Bookmark* record_at(const ContextKey& key, std::size_t index);

    void notify_changed();
};

} // namespace viewmark
