#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace crew {

spdlog::level::level_enum parse_log_level(const std::string& value) {
    std::string level = value;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace")                     return spdlog::level::trace;
    if (level == "debug")                     return spdlog::level::debug;
    if (level == "info")                      return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error")                     return spdlog::level::err;
    if (level == "off")                       return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const std::string& level, bool ignore_env) {
    auto logger = spdlog::get("crew");
    if (!logger) {
        logger = spdlog::stderr_color_mt("crew");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    const char* env_level = ignore_env ? nullptr : std::getenv("CREW_LOG_LEVEL");
    spdlog::set_level(parse_log_level(env_level ? env_level : level));
}

} // namespace crew
