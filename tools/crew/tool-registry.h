#pragma once

#include "common/crew-common.h"

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace crew {

// Tool execution context passed to each tool
struct tool_context {
    std::string working_dir;
    std::atomic<bool>* is_interrupted = nullptr;
};

/**
 * Result of a tool execution.
 *
 * Contract:
 * - success=true: output contains result, error should be empty
 * - success=false: error contains message (required), output may contain partial result
 *
 * Callers should check success first, then use either output or error accordingly.
 */
struct tool_result {
    bool success = true;
    std::string output;  // Result data (valid when success=true)
    std::string error;   // Error message (valid when success=false)
};

// Tool definition
struct tool_def {
    std::string name;
    std::string description;
    std::string signature;   // Compact signature: "delegate(role: string, task: string)"
    std::string parameters;  // JSON schema string

    std::function<tool_result(const json&, const tool_context&)> execute;
};

// Capabilities offered to one agent session
class tool_registry {
public:
    // Register a tool (replaces an existing tool with the same name)
    void register_tool(const tool_def& tool);

    // Get tool by name
    const tool_def* get_tool(const std::string& name) const;

    std::vector<std::string> get_tool_names() const;

    // Execute a tool by name
    tool_result execute(const std::string& name, const json& args, const tool_context& ctx) const;

private:
    std::map<std::string, tool_def> tools_;
};

} // namespace crew
