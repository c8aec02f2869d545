#include "config.h"

#include <cstdio>
#include <fstream>
#include <limits>

namespace crew {

const char* strategy_mode_to_string(strategy_mode mode) {
    switch (mode) {
        case strategy_mode::DISPATCHER: return "dispatcher";
        case strategy_mode::PIPELINE:   return "pipeline";
        default:                        return "unknown";
    }
}

bool parse_strategy_mode(const std::string& value, strategy_mode& out) {
    if (value == "dispatcher") {
        out = strategy_mode::DISPATCHER;
        return true;
    }
    if (value == "pipeline") {
        out = strategy_mode::PIPELINE;
        return true;
    }
    return false;
}

static std::string type_error(const std::string& key, const char* expected) {
    return "Invalid config: '" + key + "' must be " + expected;
}

static bool get_string(const json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        error = type_error(key, "a string");
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

static bool get_bool(const json& j, const char* key, bool& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_boolean()) {
        error = type_error(key, "a boolean");
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

static bool get_non_negative(const json& j, const char* key, int64_t& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0 ||
        j[key].get<int64_t>() > std::numeric_limits<int>::max()) {
        error = type_error(key, "a non-negative integer no larger than 2147483647");
        return false;
    }
    out = j[key].get<int64_t>();
    return true;
}

static bool parse_profile(const json& item, size_t index, capability_profile& out, std::string& error) {
    const std::string where = "profiles[" + std::to_string(index) + "]";
    if (!item.is_object()) {
        error = type_error(where, "an object");
        return false;
    }

    std::string name_key = where + ".name";
    if (!item.contains("name") || !item["name"].is_string()) {
        error = type_error(name_key, "a string");
        return false;
    }
    out.name = item["name"].get<std::string>();

    if (!get_string(item, "description", out.description, error) ||
        !get_string(item, "instructions", out.instructions, error) ||
        !get_bool(item, "full_identity_replace", out.full_identity_replace, error)) {
        error += " (" + where + ")";
        return false;
    }

    if (item.contains("tools")) {
        const json& tools = item["tools"];
        if (!tools.is_array()) {
            error = type_error(where + ".tools", "an array of strings");
            return false;
        }
        for (const auto& tool : tools) {
            if (!tool.is_string()) {
                error = type_error(where + ".tools", "an array of strings");
                return false;
            }
            out.capability_set.push_back(tool.get<std::string>());
        }
    }
    return true;
}

static bool parse_step(const json& item, size_t index, pipeline_step& out, std::string& error) {
    const std::string where = "pipeline[" + std::to_string(index) + "]";
    if (!item.is_object()) {
        error = type_error(where, "an object");
        return false;
    }
    if (!item.contains("role") || !item["role"].is_string()) {
        error = type_error(where + ".role", "a string");
        return false;
    }
    out.role = item["role"].get<std::string>();
    if (!get_string(item, "template", out.instruction_template, error)) {
        error += " (" + where + ")";
        return false;
    }
    return true;
}

bool apply_config_json(const json& j, crew_config& cfg, std::string& error) {
    if (!j.is_object()) {
        error = "Invalid config: top level must be an object";
        return false;
    }

    if (!get_string(j, "agent_binary", cfg.agent_binary, error) ||
        !get_string(j, "model", cfg.model, error) ||
        !get_string(j, "data_dir", cfg.data_dir, error) ||
        !get_string(j, "log_level", cfg.log_level, error) ||
        !get_bool(j, "persist_sessions", cfg.persist_sessions, error)) {
        return false;
    }

    if (j.contains("mode")) {
        if (!j["mode"].is_string() || !parse_strategy_mode(j["mode"].get<std::string>(), cfg.mode)) {
            error = type_error("mode", "\"dispatcher\" or \"pipeline\"");
            return false;
        }
    }

    int64_t value = 0;
    if (j.contains("dispatch_timeout_ms")) {
        if (!get_non_negative(j, "dispatch_timeout_ms", value, error)) {
            return false;
        }
        cfg.dispatch_timeout_ms = static_cast<int>(value);
    }
    if (j.contains("tick_interval_ms")) {
        if (!get_non_negative(j, "tick_interval_ms", value, error)) {
            return false;
        }
        if (value == 0) {
            error = type_error("tick_interval_ms", "a positive integer");
            return false;
        }
        cfg.tick_interval_ms = static_cast<int>(value);
    }
    if (j.contains("preview_width")) {
        if (!get_non_negative(j, "preview_width", value, error)) {
            return false;
        }
        cfg.preview_width = static_cast<size_t>(value);
    }

    if (j.contains("profiles")) {
        if (!j["profiles"].is_array()) {
            error = type_error("profiles", "an array");
            return false;
        }
        std::vector<capability_profile> profiles;
        size_t index = 0;
        for (const auto& item : j["profiles"]) {
            capability_profile profile;
            if (!parse_profile(item, index++, profile, error)) {
                return false;
            }
            profiles.push_back(std::move(profile));
        }
        cfg.profiles = std::move(profiles);
    }

    if (j.contains("pipeline")) {
        if (!j["pipeline"].is_array()) {
            error = type_error("pipeline", "an array");
            return false;
        }
        std::vector<pipeline_step> steps;
        size_t index = 0;
        for (const auto& item : j["pipeline"]) {
            pipeline_step step;
            if (!parse_step(item, index++, step, error)) {
                return false;
            }
            steps.push_back(std::move(step));
        }
        cfg.pipeline = std::move(steps);
    }

    return true;
}

bool load_config_file(const std::string& path, crew_config& cfg, std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = format_error("load config", "cannot open file", path);
        return false;
    }

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        error = format_error("load config", "not valid JSON", path);
        return false;
    }

    if (!apply_config_json(j, cfg, error)) {
        error += " (" + path + ")";
        return false;
    }
    return true;
}

std::string default_config_path(const crew_config& cfg) {
    return (fs::path(cfg.data_dir) / config::DEFAULT_CONFIG_FILE).string();
}

bool parse_cli_args(int argc, const char* const* argv, crew_config& cfg, std::string& error) {
    // Value flags are collected as config keys so they go through the same
    // validation as the file
    json overrides = json::object();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--no-persist") {
            overrides["persist_sessions"] = false;
        } else if (arg == "-p" || arg == "--prompt") {
            if (!next_value(cfg.prompt)) {
                return false;
            }
        } else if (arg == "--config") {
            if (!next_value(cfg.config_path)) {
                return false;
            }
        } else if (arg == "--mode") {
            if (!next_value(value)) {
                return false;
            }
            overrides["mode"] = value;
        } else if (arg == "--agent-binary") {
            if (!next_value(value)) {
                return false;
            }
            overrides["agent_binary"] = value;
        } else if (arg == "--model" || arg == "-m") {
            if (!next_value(value)) {
                return false;
            }
            overrides["model"] = value;
        } else if (arg == "--data-dir" || arg == "-dd") {
            if (!next_value(value)) {
                return false;
            }
            overrides["data_dir"] = value;
        } else if (arg == "--timeout") {
            if (!next_value(value)) {
                return false;
            }
            try {
                overrides["dispatch_timeout_ms"] = std::stoll(value);
            } catch (const std::exception&) {
                error = "Invalid --timeout value: " + value;
                return false;
            }
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    cfg.cli_overrides = overrides;
    return apply_config_json(overrides, cfg, error);
}

void print_usage(const char* argv0) {
    printf("\nUsage: %s [options]\n\n", argv0);
    printf("Orchestrates child coding agents as separate processes.\n\n");
    printf("Options:\n");
    printf("  --mode MODE           dispatcher (default) or pipeline\n");
    printf("  --agent-binary PATH   child agent executable (default: %s)\n", config::DEFAULT_AGENT_BINARY);
    printf("  -m, --model ID        model passed to children (default: $CREW_MODEL)\n");
    printf("  --config FILE         JSON config file (default: <data-dir>/%s)\n", config::DEFAULT_CONFIG_FILE);
    printf("  -dd, --data-dir DIR   continuation records and config (default: %s)\n", config::DEFAULT_DATA_DIR);
    printf("  --timeout MS          per-dispatch deadline, 0 = none (default: 0)\n");
    printf("  --no-persist          do not continue earlier work per role\n");
    printf("  -p, --prompt CMD      run one command and exit\n");
    printf("  -v, --verbose         debug logging\n");
    printf("  -h, --help            show this help\n\n");
    printf("Commands:\n");
    printf("  /delegate ROLE TASK   run one role on a task (dispatcher)\n");
    printf("  /pipeline TASK        run the pipeline on a task\n");
    printf("  /call TOOL [JSON]     call an active host tool (e.g. delegate)\n");
    printf("  /status  /agents  /tools  /sessions  /cancel [ROLE]  /reset [ROLE]  /help  /exit\n\n");
}

} // namespace crew
