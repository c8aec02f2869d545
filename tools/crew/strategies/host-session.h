#pragma once

#include "../tool-registry.h"

#include <set>
#include <string>
#include <vector>

namespace crew {

/**
 * The parent agent's side of the boundary: its capability surface and its
 * instructions. The parent's own tool-calling loop lives elsewhere; the
 * orchestration strategies only restrict or augment what it sees here.
 */
class host_session {
public:
    host_session(std::string default_system_prompt, std::string model = "");

    tool_registry& tools() { return tools_; }
    const tool_registry& tools() const { return tools_; }

    // Register a tool and make it active
    void add_tool(const tool_def& tool);

    // Whitelist of active tools. Unknown names are ignored.
    void set_active_tools(const std::vector<std::string>& names);
    void activate_all_tools();
    std::vector<std::string> active_tools() const;
    bool is_tool_active(const std::string& name) const;

    // Execute an active tool; inactive or unknown tools are refused
    tool_result execute(const std::string& name, const json& args) const;

    const std::string& default_system_prompt() const { return default_system_prompt_; }
    const std::string& system_prompt() const { return system_prompt_; }
    void set_system_prompt(const std::string& prompt) { system_prompt_ = prompt; }

    // Model of the parent session, inherited by children (may be empty)
    const std::string& model() const { return model_; }

    tool_context& context() { return ctx_; }
    const tool_context& context() const { return ctx_; }

private:
    tool_registry tools_;
    std::set<std::string> active_;
    std::string default_system_prompt_;
    std::string system_prompt_;
    std::string model_;
    tool_context ctx_;
};

} // namespace crew
