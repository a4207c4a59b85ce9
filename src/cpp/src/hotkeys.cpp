#include "viewmark/hotkeys.hpp"

#include "viewmark/constants.hpp"

namespace viewmark {

std::optional<std::size_t> hotkey_index(char digit) {
    if (digit < '0' || digit > '9') {
        return std::nullopt;
    }
    if (digit == '0') {
        return HOTKEY_SLOTS - 1;
    }
    return static_cast<std::size_t>(digit - '1');
}

std::optional<std::size_t> hotkey_index(const KeyPress& key) {
    if (!key.shift && !key.control) {
        return std::nullopt;
    }
    return hotkey_index(key.digit);
}

} // namespace viewmark
