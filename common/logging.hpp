#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace bikefit {
namespace logging {

// Level named by BIKEFIT_LOG_LEVEL ("trace" ... "critical", "warn", "err", "off").
// Unset or unrecognized names give the fallback.
inline spdlog::level::level_enum parse_level(const char* name,
                                             spdlog::level::level_enum fallback) {
    if (name == nullptr) {
        return fallback;
    }
    std::string level(name);
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return fallback;
    }
    return parsed;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("bikefit");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(parse_level(std::getenv("BIKEFIT_LOG_LEVEL"), spdlog::level::info));
        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace bikefit
