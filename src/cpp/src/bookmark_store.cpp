#include "viewmark/bookmark_store.hpp"

#include <algorithm>

#include "viewmark/log.hpp"

namespace viewmark {

BookmarkStore::BookmarkStore(TaskQueue& queue)
    : queue_(queue)
    , buckets_()
    , active_()
    , notifier_(std::make_shared<Notifier>()) {
}

// --- Contexts ---

Status BookmarkStore::set_active_context(const ContextKey& key,
                                         const std::string& context_path) {
    Bucket& bucket = bucket_for(key);
    if (!context_path.empty()) {
        bucket.context_path = context_path;
    }
    if (key == active_) {
        return Status::NO_OP;
    }
    logger()->debug("Switching context \"{}\" -> \"{}\"", active_, key);
    active_ = key;
    notify_changed();
    return Status::OK;
}

std::vector<ContextKey> BookmarkStore::contexts() const {
    std::vector<ContextKey> keys;
    keys.reserve(buckets_.size());
    for (const auto& bucket : buckets_) {
        keys.push_back(bucket.key);
    }
    return keys;
}

bool BookmarkStore::has_context(const ContextKey& key) const {
    return find_bucket(key) != nullptr;
}

std::string BookmarkStore::context_path(const ContextKey& key) const {
    const Bucket* bucket = find_bucket(key);
    return bucket ? bucket->context_path : std::string();
}

// --- Queries ---

std::size_t BookmarkStore::size() const {
    return size(active_);
}

std::size_t BookmarkStore::size(const ContextKey& key) const {
    const Bucket* bucket = find_bucket(key);
    return bucket ? bucket->records.size() : 0;
}

std::vector<Bookmark> BookmarkStore::records() const {
    return records(active_);
}

std::vector<Bookmark> BookmarkStore::records(const ContextKey& key) const {
    const Bucket* bucket = find_bucket(key);
    return bucket ? bucket->records : std::vector<Bookmark>();
}

std::optional<Bookmark> BookmarkStore::get(std::size_t index) const {
    return get(active_, index);
}

std::optional<Bookmark> BookmarkStore::get(const ContextKey& key, std::size_t index) const {
    const Bucket* bucket = find_bucket(key);
    if (!bucket || index >= bucket->records.size()) {
        return std::nullopt;
    }
    return bucket->records[index];
}

std::vector<Bucket> BookmarkStore::buckets() const {
    return buckets_;
}

// --- Mutators ---

std::size_t BookmarkStore::add(const Bookmark& bookmark) {
    return add(active_, bookmark);
}

std::size_t BookmarkStore::add(const ContextKey& key, const Bookmark& bookmark) {
    Bucket& bucket = bucket_for(key);
    bucket.records.push_back(bookmark);
    std::size_t index = bucket.records.size() - 1;
    logger()->debug("Creating \"{}\" at #{}", bookmark.name, index);
    notify_changed();
    return index;
}

Status BookmarkStore::remove_at(std::size_t index) {
    return remove_at(active_, index);
}

Status BookmarkStore::remove_at(const ContextKey& key, std::size_t index) {
    Bookmark* at = record_at(key, index);
    if (!at) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    logger()->debug("Removing \"{}\" at #{}", at->name, index);
    auto& records = bucket_for(key).records;
    records.erase(records.begin() + static_cast<std::ptrdiff_t>(index));
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::rename(std::size_t index, const std::string& name) {
    return rename(active_, index, name);
}

Status BookmarkStore::rename(const ContextKey& key, std::size_t index,
                             const std::string& name) {
    Bookmark* at = record_at(key, index);
    if (!at) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    logger()->debug("Renaming \"{}\" to \"{}\" at #{}", at->name, name, index);
    Bookmark bm = *at;
    bm.name = name;
    *at = bm;
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::replace(std::size_t index, const Bookmark& bookmark) {
    return replace(active_, index, bookmark);
}

Status BookmarkStore::replace(const ContextKey& key, std::size_t index,
                              const Bookmark& bookmark) {
    Bookmark* at = record_at(key, index);
    if (!at) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    *at = bookmark;
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::set_position(std::size_t index, const Vec3& position) {
    return set_position(active_, index, position);
}

Status BookmarkStore::set_position(const ContextKey& key, std::size_t index,
                                   const Vec3& position) {
    Bookmark* at = record_at(key, index);
    if (!at) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    Bookmark bm = *at;
    bm.camera_position = position;
    bm.reconcile();
    *at = bm;
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::set_rotation_euler(std::size_t index, const Vec3& degrees) {
    return set_rotation_euler(active_, index, degrees);
}

Status BookmarkStore::set_rotation_euler(const ContextKey& key, std::size_t index,
                                         const Vec3& degrees) {
    Bookmark* at = record_at(key, index);
    if (!at) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    Bookmark bm = *at;
    bm.rotation = euler_to_rotation(degrees);
    bm.reconcile();
    *at = bm;
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::set_color(std::size_t index, const Rgba& color) {
    return set_color(active_, index, color);
}

Status BookmarkStore::set_color(const ContextKey& key, std::size_t index,
                                const Rgba& color) {
    Bookmark* at = record_at(key, index);
    if (!at) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    at->color = color;
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::reorder(std::size_t old_index, std::size_t new_index) {
    return reorder(active_, old_index, new_index);
}

Status BookmarkStore::reorder(const ContextKey& key, std::size_t old_index,
                              std::size_t new_index) {
    if (!record_at(key, old_index) || !record_at(key, new_index)) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    auto& records = bucket_for(key).records;
    Bookmark moved = records[old_index];
    records.erase(records.begin() + static_cast<std::ptrdiff_t>(old_index));
    records.insert(records.begin() + static_cast<std::ptrdiff_t>(new_index), moved);
    logger()->debug("Moving \"{}\" from #{} to #{}", moved.name, old_index, new_index);
    notify_changed();
    return Status::OK;
}

Status BookmarkStore::move_to_slot(std::size_t old_index, std::size_t slot) {
    return move_to_slot(active_, old_index, slot);
}

Status BookmarkStore::move_to_slot(const ContextKey& key, std::size_t old_index,
                                   std::size_t slot) {
    if (!record_at(key, old_index) || slot > size(key)) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    // Taking the record out shifts every later gap left by one
    std::size_t target = slot > old_index ? slot - 1 : slot;
    return reorder(key, old_index, target);
}

void BookmarkStore::assign(std::vector<Bucket> buckets, const ContextKey& active) {
    buckets_ = std::move(buckets);
    active_ = active;
    notify_changed();
}

void BookmarkStore::clear() {
    buckets_.clear();
    notify_changed();
}

// --- Notification ---

BookmarkStore::SubscriptionId BookmarkStore::subscribe(Listener listener) {
    SubscriptionId id = notifier_->next_id++;
    notifier_->listeners.emplace_back(id, std::move(listener));
    return id;
}

bool BookmarkStore::unsubscribe(SubscriptionId id) {
    auto& listeners = notifier_->listeners;
    auto it = std::find_if(listeners.begin(), listeners.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners.end()) {
        return false;
    }
    listeners.erase(it);
    return true;
}

std::size_t BookmarkStore::listener_count() const {
    return notifier_->listeners.size();
}

// --- Private ---

Bucket& BookmarkStore::bucket_for(const ContextKey& key) {
    auto it = std::find_if(buckets_.begin(), buckets_.end(),
                           [&key](const Bucket& b) { return b.key == key; });
    if (it != buckets_.end()) {
        return *it;
    }
    Bucket bucket;
    bucket.key = key;
    buckets_.push_back(std::move(bucket));
    return buckets_.back();
}

Bucket* BookmarkStore::find_bucket(const ContextKey& key) {
    auto it = std::find_if(buckets_.begin(), buckets_.end(),
                           [&key](const Bucket& b) { return b.key == key; });
    return it != buckets_.end() ? &*it : nullptr;
}

const Bucket* BookmarkStore::find_bucket(const ContextKey& key) const {
    auto it = std::find_if(buckets_.begin(), buckets_.end(),
                           [&key](const Bucket& b) { return b.key == key; });
    return it != buckets_.end() ? &*it : nullptr;
}

Bookmark* BookmarkStore::record_at(const ContextKey& key, std::size_t index) {
    Bucket* bucket = find_bucket(key);
    if (!bucket || index >= bucket->records.size()) {
        return nullptr;
    }
    return &bucket->records[index];
}

void BookmarkStore::notify_changed() {
    if (notifier_->pending || notifier_->listeners.empty()) {
        return;
    }
    notifier_->pending = true;

    std::weak_ptr<Notifier> weak = notifier_;
    queue_.post([weak]() {
        auto notifier = weak.lock();
        if (!notifier) {
            return;  // store is gone
        }
        notifier->pending = false;
        // Listeners may subscribe or unsubscribe while being called
        auto listeners = notifier->listeners;
        for (const auto& entry : listeners) {
            entry.second();
        }
    });
}

} // namespace viewmark
