#include "viewmark/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "viewmark/constants.hpp"

namespace viewmark {

std::shared_ptr<spdlog::logger> logger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::from_str(DEFAULT_LOG_LEVEL));
    return created;
}

void set_log_level(const std::string& level) {
    // from_str maps unknown names to "off"; treat those as info instead
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger()->set_level(parsed);
}

} // namespace viewmark
