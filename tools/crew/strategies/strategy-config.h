#pragma once

#include "../common/constants.h"

#include <cstddef>
#include <string>

namespace crew {

// Settings shared by both orchestration strategies
struct strategy_config {
    std::string model;                                          // empty = inherit from the host session
    int dispatch_timeout_ms = config::DEFAULT_DISPATCH_TIMEOUT_MS;
    int tick_interval_ms = config::DEFAULT_TICK_INTERVAL_MS;
    bool persist_sessions = false;                              // continuation channel per role
    size_t preview_width = config::DEFAULT_PREVIEW_WIDTH;
};

} // namespace crew
