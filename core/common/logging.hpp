#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace fraudscope {

/// Shared "fraudscope" logger. Created on first use (stderr, colored).
std::shared_ptr<spdlog::logger> logger();

/// Set the logger level from a name ("trace", "debug", "info", "warn",
/// "error", "critical", "off"). Throws ConfigurationError on unknown names.
void setLogLevel(const std::string& level);

} // namespace fraudscope
