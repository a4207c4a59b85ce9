#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "bookmark_store.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "hotkeys.hpp"
#include "nearest.hpp"
#include "status.hpp"
#include "task_queue.hpp"
#include "transition.hpp"
#include "viewport.hpp"

namespace viewmark {

/// Composition root for a bookmark session.
///
/// Owns the task queue, the store, the transition and the viewport, and
/// wires them to the configuration. The host calls tick() once per frame
/// to advance camera moves and deliver change notifications.
class Controller {
public:
    /// Construct with an injected viewport, optional config path, and
    /// optional bookmark file path (defaults to the config's STORE_PATH).
    /// Loads the config and the bookmark file.
    explicit Controller(
        std::unique_ptr<IViewport> viewport,
        const std::string& config_path = "",
        const std::string& store_path = ""
    );

    ~Controller();

    // The store keeps a reference to the queue member
    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    // --- Properties ---

    BookmarkStore& store();
    const BookmarkStore& store() const;
    Config& config();
    const Config& config() const;
    IViewport& viewport();
    const ViewportTransition& transition() const;
    TaskQueue& queue();
    const std::string& store_path() const;

    // --- Persistence ---

    /// Reload the bookmark file. NO_OP when it does not exist.
    Status load();

    /// Write the bookmark file. Throws StoreFileError.
    void save() const;

    // --- Actions ---

    /// Switch to the bookmarks of another scene.
    Status open_context(const ContextKey& key, const std::string& context_path = "");

    /// Bookmark the current viewport pose. An empty name becomes
    /// "Bookmark HHMMSS". The new index is written to `index` if given.
    Status capture(const std::string& name, std::size_t* index = nullptr);

    /// Move the viewport to a bookmark, animated when ANIMATE is set.
    Status jump_to(std::size_t index, TimePoint now = Clock::now());

    /// Bookmark closest to the viewport's look ray, if any.
    std::optional<NearestHit> nearest_to_view() const;

    /// Jump to nearest_to_view(). NO_OP when there are no bookmarks.
    Status jump_to_nearest(TimePoint now = Clock::now(),
                           std::optional<NearestHit>* hit = nullptr);

    /// Jump for a Shift/Ctrl + digit press. NO_OP for other keys.
    Status handle_hotkey(const KeyPress& key, TimePoint now = Clock::now());

    /// Stop a running camera move where it is.
    void cancel_transition();

    // --- Frame ---

    /// Advance the camera move, then run queued notifications.
    void tick(TimePoint now = Clock::now());

    bool is_animating() const;

    /// Reseed the generator used for new bookmark colors.
    void seed_colors(unsigned seed);

private:
    std::unique_ptr<IViewport> viewport_;
    Config config_;
    std::string store_path_;
    TaskQueue queue_;
    BookmarkStore store_;
    ViewportTransition transition_;
    std::mt19937 rng_;
    BookmarkStore::SubscriptionId autosave_id_ = 0;

    Status apply_bookmark(const Bookmark& target, TimePoint now);
    void autosave();
};

} // namespace viewmark
