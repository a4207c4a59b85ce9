#pragma once

#include <stdexcept>
#include <string>

namespace viewmark {

/// Outcome of a store mutation or controller action.
///
/// None of these are fatal; callers decide how to surface them.
enum class Status {
    OK,
    NO_OP,
    INDEX_OUT_OF_RANGE,
    NO_ACTIVE_VIEWPORT,
    MALFORMED_SNAPSHOT,
};

/// Human-readable name of a status value.
const char* to_string(Status status);

/// Raised by the snapshot parser on malformed input.
class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised when the bookmark file cannot be written.
class StoreFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace viewmark
