#include "tool-registry.h"

#include <spdlog/spdlog.h>

namespace crew {

void tool_registry::register_tool(const tool_def& tool) {
    tools_[tool.name] = tool;
}

const tool_def* tool_registry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

std::vector<std::string> tool_registry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        names.push_back(name);
    }
    return names;
}

tool_result tool_registry::execute(const std::string& name, const json& args, const tool_context& ctx) const {
    const tool_def* tool = get_tool(name);
    if (!tool) {
        return {false, "", "Unknown tool: " + name};
    }
    if (!tool->execute) {
        return {false, "", "Tool has no implementation: " + name};
    }

    try {
        return tool->execute(args, ctx);
    } catch (const json::exception& e) {
        spdlog::warn("tool '{}' rejected its arguments: {}", name, e.what());
        return {false, "", format_error(name, "invalid arguments", e.what())};
    }
}

} // namespace crew
