#include "viewmark/controller.hpp"

#include <ctime>
#include <utility>

#include "viewmark/log.hpp"
#include "viewmark/snapshot.hpp"

namespace viewmark {

Controller::Controller(
    std::unique_ptr<IViewport> viewport,
    const std::string& config_path,
    const std::string& store_path)
    : viewport_(std::move(viewport))
    , config_(config_path)
    , store_path_()
    , queue_()
    , store_(queue_)
    , transition_(viewport_.get())
    , rng_(std::random_device{}())
{
    config_.load();
    set_log_level(config_.log_level());
    store_path_ = store_path.empty() ? config_.store_path() : store_path;

    load();

    if (config_.autosave()) {
        autosave_id_ = store_.subscribe([this]() { autosave(); });
    }
}

Controller::~Controller() {
    if (autosave_id_ != 0) {
        store_.unsubscribe(autosave_id_);
    }
}

BookmarkStore& Controller::store() {
    return store_;
}

const BookmarkStore& Controller::store() const {
    return store_;
}

Config& Controller::config() {
    return config_;
}

const Config& Controller::config() const {
    return config_;
}

IViewport& Controller::viewport() {
    return *viewport_;
}

const ViewportTransition& Controller::transition() const {
    return transition_;
}

TaskQueue& Controller::queue() {
    return queue_;
}

const std::string& Controller::store_path() const {
    return store_path_;
}

// --- Persistence ---

Status Controller::load() {
    return load_store_file(store_, store_path_);
}

void Controller::save() const {
    save_store_file(store_, store_path_);
}

// --- Actions ---

Status Controller::open_context(const ContextKey& key, const std::string& context_path) {
    return store_.set_active_context(key, context_path);
}

Status Controller::capture(const std::string& name, std::size_t* index) {
    if (!viewport_ || !viewport_->is_active()) {
        return Status::NO_ACTIVE_VIEWPORT;
    }

    Pose pose = viewport_->read_current_pose();
    std::string label = name.empty() ? default_bookmark_name(std::time(nullptr)) : name;
    Rgba color = random_bright_color(rng_, config_.min_saturation(), config_.min_value());

    std::size_t added = store_.add(bookmark_from_pose(label, pose, color));
    if (index) {
        *index = added;
    }
    return Status::OK;
}

Status Controller::jump_to(std::size_t index, TimePoint now) {
    auto target = store_.get(index);
    if (!target) {
        return Status::INDEX_OUT_OF_RANGE;
    }
    return apply_bookmark(*target, now);
}

std::optional<NearestHit> Controller::nearest_to_view() const {
    if (!viewport_ || !viewport_->is_active()) {
        return std::nullopt;
    }
    Pose pose = viewport_->read_current_pose();
    return nearest_look_target(store_.records(),
                               camera_position(pose),
                               camera_forward(pose).normalized());
}

Status Controller::jump_to_nearest(TimePoint now, std::optional<NearestHit>* hit) {
    if (!viewport_ || !viewport_->is_active()) {
        return Status::NO_ACTIVE_VIEWPORT;
    }
    auto nearest = nearest_to_view();
    if (hit) {
        *hit = nearest;
    }
    if (!nearest) {
        return Status::NO_OP;
    }
    logger()->debug("Nearest look target #{} (score={:.3f})", nearest->index, nearest->score);
    return jump_to(nearest->index, now);
}

Status Controller::handle_hotkey(const KeyPress& key, TimePoint now) {
    auto index = hotkey_index(key);
    if (!index) {
        return Status::NO_OP;
    }
    return jump_to(*index, now);
}

void Controller::cancel_transition() {
    transition_.cancel();
}

// --- Frame ---

void Controller::tick(TimePoint now) {
    transition_.tick(now);
    queue_.run_pending();
}

bool Controller::is_animating() const {
    return transition_.is_animating();
}

void Controller::seed_colors(unsigned seed) {
    rng_.seed(seed);
}

// --- Private ---

Status Controller::apply_bookmark(const Bookmark& target, TimePoint now) {
    if (!viewport_ || !viewport_->is_active()) {
        return Status::NO_ACTIVE_VIEWPORT;
    }

    if (config_.animate()) {
        transition_.start(viewport_->read_current_pose(), target,
                          config_.transition_duration(), now);
    } else {
        transition_.cancel();
        viewport_->apply_pose(target.to_pose(), true);
    }
    return Status::OK;
}

void Controller::autosave() {
    try {
        save();
    } catch (const StoreFileError& e) {
        logger()->error("Autosave failed: {}", e.what());
    }
}

} // namespace viewmark
