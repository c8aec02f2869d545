#include "host-session.h"

namespace crew {

host_session::host_session(std::string default_system_prompt, std::string model)
    : default_system_prompt_(std::move(default_system_prompt))
    , system_prompt_(default_system_prompt_)
    , model_(std::move(model)) {
}

void host_session::add_tool(const tool_def& tool) {
    tools_.register_tool(tool);
    active_.insert(tool.name);
}

void host_session::set_active_tools(const std::vector<std::string>& names) {
    active_.clear();
    for (const auto& name : names) {
        if (tools_.get_tool(name)) {
            active_.insert(name);
        }
    }
}

void host_session::activate_all_tools() {
    active_.clear();
    for (const auto& name : tools_.get_tool_names()) {
        active_.insert(name);
    }
}

std::vector<std::string> host_session::active_tools() const {
    return {active_.begin(), active_.end()};
}

bool host_session::is_tool_active(const std::string& name) const {
    return active_.count(name) > 0;
}

tool_result host_session::execute(const std::string& name, const json& args) const {
    if (!is_tool_active(name)) {
        if (tools_.get_tool(name)) {
            return {false, "", "Tool not available in this session: " + name};
        }
        return {false, "", "Unknown tool: " + name};
    }
    return tools_.execute(name, args, ctx_);
}

} // namespace crew
