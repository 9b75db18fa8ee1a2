#pragma once

#include <cstdlib>
#include <string>
#include <spdlog/spdlog.h>

namespace hypoforge {

// Console pattern shared by both executables; level from HYPOFORGE_LOG_LEVEL.
inline void configure_logging() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
    if (const char* level = std::getenv("HYPOFORGE_LOG_LEVEL")) {
        const auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && std::string(level) != "off") {
            spdlog::warn("⚠️ Unknown HYPOFORGE_LOG_LEVEL '{}', keeping info", level);
        } else {
            spdlog::set_level(parsed);
        }
    }
}

} // namespace hypoforge
