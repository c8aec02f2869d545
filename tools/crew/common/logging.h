#pragma once

// Diagnostic logging setup. All modules log through spdlog's default logger,
// which writes to stderr so stdout stays clean for operator output.

#include <string>

#include <spdlog/spdlog.h>

namespace crew {

// Parse "trace|debug|info|warn|error|off" (case-insensitive).
// Unknown values fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& value);

// Install the stderr logger. CREW_LOG_LEVEL overrides the given level
// unless ignore_env is set (used for -v).
void init_logging(const std::string& level, bool ignore_env = false);

} // namespace crew
