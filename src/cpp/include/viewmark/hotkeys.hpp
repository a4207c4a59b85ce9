#pragma once

#include <cstddef>
#include <optional>

namespace viewmark {

/// A digit key press as delivered by the host's input layer. Hosts
/// report keypad digits with the same `digit` as top-row digits.
struct KeyPress {
    char digit = '\0';    // '0'..'9'
    bool shift = false;
    bool control = false;
};

/// Bookmark index for a digit: '1'..'9' -> 0..8, '0' -> 9.
/// Any other character gives nullopt. The result is not checked against
/// the number of bookmarks.
std::optional<std::size_t> hotkey_index(char digit);

/// Bookmark index for a key press; requires Shift or Ctrl to be held.
std::optional<std::size_t> hotkey_index(const KeyPress& key);

} // namespace viewmark
