#include "common/logging.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fraudscope {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("fraudscope");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("fraudscope");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void setLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unrecognised names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigurationError("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace fraudscope
