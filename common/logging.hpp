#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace drape {
namespace logging {

inline spdlog::level::level_enum level_from_env(const char* level_env) {
    if (!level_env) {
        return spdlog::level::info;
    }
    std::string level(level_env);
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get("drape");
        if (!log) {
            log = spdlog::stderr_color_mt("drape");
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // DRAPE_LOG_LEVEL: trace, debug, info, warn, error, off
        log->set_level(level_from_env(std::getenv("DRAPE_LOG_LEVEL")));
        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace drape
