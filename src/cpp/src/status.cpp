#include "viewmark/status.hpp"

namespace viewmark {

const char* to_string(Status status) {
    switch (status) {
    case Status::OK:                 return "ok";
    case Status::NO_OP:              return "no-op";
    case Status::INDEX_OUT_OF_RANGE: return "index out of range";
    case Status::NO_ACTIVE_VIEWPORT: return "no active viewport";
    case Status::MALFORMED_SNAPSHOT: return "malformed snapshot";
    }
    return "unknown";
}

} // namespace viewmark
