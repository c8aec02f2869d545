#pragma once

// Runtime configuration: compiled defaults, then the JSON config file, then
// command line flags.

#include "constants.h"
#include "crew-common.h"
#include "../profiles/profile-registry.h"
#include "../strategies/pipeline-strategy.h"

#include <cstdint>
#include <string>
#include <vector>

namespace crew {

enum class strategy_mode {
    DISPATCHER,
    PIPELINE,
};

const char* strategy_mode_to_string(strategy_mode mode);

// Returns false for anything but "dispatcher" / "pipeline"
bool parse_strategy_mode(const std::string& value, strategy_mode& out);

struct crew_config {
    std::string agent_binary = config::DEFAULT_AGENT_BINARY;
    std::string model;                       // empty = CREW_MODEL, then launcher fallback
    strategy_mode mode = strategy_mode::DISPATCHER;
    std::string data_dir = config::DEFAULT_DATA_DIR;
    bool persist_sessions = true;
    int dispatch_timeout_ms = config::DEFAULT_DISPATCH_TIMEOUT_MS;
    int tick_interval_ms = config::DEFAULT_TICK_INTERVAL_MS;
    size_t preview_width = config::DEFAULT_PREVIEW_WIDTH;
    std::string log_level = "info";

    std::vector<capability_profile> profiles;   // registered after the built-ins
    std::vector<pipeline_step> pipeline;        // empty = default pipeline

    // Command line only
    std::string config_path;
    std::string prompt;
    bool verbose = false;
    bool show_help = false;
    json cli_overrides = json::object();     // flags that must win over the file
};

// Merge a parsed config object into cfg. Unknown keys are ignored; a wrongly
// typed key fails with an error naming it.
bool apply_config_json(const json& j, crew_config& cfg, std::string& error);

// Read and merge a JSON config file
bool load_config_file(const std::string& path, crew_config& cfg, std::string& error);

// Parse command line flags into cfg (argv[0] is skipped)
bool parse_cli_args(int argc, const char* const* argv, crew_config& cfg, std::string& error);

// Default config file location: <data_dir>/config.json
std::string default_config_path(const crew_config& cfg);

void print_usage(const char* argv0);

} // namespace crew
