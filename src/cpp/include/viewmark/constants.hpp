#pragma once

#include <cstddef>
#include <string>

namespace viewmark {

// Nearest-look-target scoring
constexpr float BEHIND_PENALTY = 2.0f;

// Transition timing (seconds)
constexpr double DEFAULT_TRANSITION_DURATION = 0.4;
constexpr double MIN_TRANSITION_DURATION     = 1e-4;

// Hotkey slots: digits 1..9 then 0
constexpr std::size_t HOTKEY_SLOTS = 10;

// Bright color generation limits
constexpr float DEFAULT_MIN_SATURATION = 0.65f;
constexpr float DEFAULT_MIN_VALUE      = 0.85f;

// Deepest object/array nesting accepted in a bookmark file
constexpr std::size_t MAX_SNAPSHOT_DEPTH = 64;

// Default record values
constexpr float DEFAULT_VIEW_SIZE       = 10.0f;
constexpr float DEFAULT_CAMERA_DISTANCE = 0.0f;

// Config / store file names
inline const std::string DEFAULT_CONFIG_FILENAME = ".viewmark_config";
inline const std::string DEFAULT_STORE_FILENAME  = ".viewmark_bookmarks.json";

// Name of the spdlog logger shared by the library
inline const std::string LOGGER_NAME = "viewmark";
inline const std::string DEFAULT_LOG_LEVEL = "info";

} // namespace viewmark
