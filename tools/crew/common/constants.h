#pragma once

// Centralized constants for the crew module.
// All magic numbers should be defined here for consistency.

#include <cstddef>

namespace crew::config {

// =============================================================================
// Child process invocation
// =============================================================================

// Agent binary launched for every dispatch (resolved through PATH)
constexpr const char* DEFAULT_AGENT_BINARY = "pi";

// Model used when neither the config nor the parent session names one
constexpr const char* FALLBACK_MODEL = "default";

// Directory (relative to the working directory) for crew state
constexpr const char* DEFAULT_DATA_DIR = ".crew";

// Config file looked up inside the data directory
constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// =============================================================================
// Timeouts and scheduling (milliseconds)
// =============================================================================

// Per-dispatch deadline (0 = no deadline)
constexpr int DEFAULT_DISPATCH_TIMEOUT_MS = 0;

// Interval of the elapsed-time ticker while any unit is running
constexpr int DEFAULT_TICK_INTERVAL_MS = 250;

// Interval for reaping a child that closed its pipes but has not exited yet
constexpr int REAP_POLL_INTERVAL_MS = 10;

// Upper bound for a single poll() wait when the loop has no timers
constexpr int MAX_POLL_WAIT_MS = 1000;

// =============================================================================
// Output limits
// =============================================================================

// Bytes read from a child pipe per read() call
constexpr size_t READ_CHUNK_SIZE = 4096;

// Tail of stderr kept as diagnostic text
constexpr size_t MAX_DIAGNOSTIC_BYTES = 4096;

// Width of the activity preview in projected status rows
constexpr size_t DEFAULT_PREVIEW_WIDTH = 60;

// Longest profile name accepted by the registry
constexpr size_t MAX_ROLE_NAME_LENGTH = 64;

} // namespace crew::config
