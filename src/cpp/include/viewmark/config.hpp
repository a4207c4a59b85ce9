#pragma once

#include <map>
#include <string>

#include "constants.hpp"

namespace viewmark {

/// Manages viewmark settings load/save from ~/.viewmark_config.
///
/// Key=value file format, one setting per line, '#' starts a comment.
class Config {
public:
    /// Construct with optional custom config file path.
    explicit Config(const std::string& config_path = "");

    /// Load config from file. Missing file is silently ignored.
    void load();

    /// Save current config to file. Returns false if it cannot be written.
    bool save() const;

    /// Get a config value by key, or a default if missing.
    std::string get(const std::string& key, const std::string& default_val = "") const;

    /// Set a config value.
    void set(const std::string& key, const std::string& value);

    // --- Typed accessors ---

    /// Bookmark file; defaults to ~/.viewmark_bookmarks.json.
    std::string store_path() const;
    void set_store_path(const std::string& value);

    /// Animate jumps instead of snapping.
    bool animate() const;
    void set_animate(bool value);

    /// Jump animation length in seconds.
    double transition_duration() const;
    void set_transition_duration(double value);

    /// Write the bookmark file after every change.
    bool autosave() const;
    void set_autosave(bool value);

    /// Display preferences for the host's scene overlay (bookmark
    /// markers and their labels). The library itself draws nothing.
    bool show_markers() const;
    void set_show_markers(bool value);

    bool show_labels() const;
    void set_show_labels(bool value);

    float min_saturation() const;
    void set_min_saturation(float value);

    float min_value() const;
    void set_min_value(float value);

    std::string log_level() const;
    void set_log_level(const std::string& value);

    /// Return the config file path.
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::map<std::string, std::string> data_;

    void set_defaults();
    bool get_bool(const std::string& key, bool default_val) const;
    double get_double(const std::string& key, double default_val) const;
};

} // namespace viewmark
