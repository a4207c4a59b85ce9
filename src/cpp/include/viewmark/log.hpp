#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace viewmark {

/// Shared library logger ("viewmark"), created on first use on stderr.
std::shared_ptr<spdlog::logger> logger();

/// Set the logger level by name ("trace", "debug", "info", "warn",
/// "error", "critical", "off"). Unknown names fall back to info.
void set_log_level(const std::string& level);

} // namespace viewmark
