#include "host-tools.h"
#include "../strategies/host-session.h"

#include <algorithm>

namespace crew {

static tool_result ls_execute(const json& args, const tool_context& ctx) {
    std::string path = args.value("path", ".");

    fs::path dir(path);
    if (dir.is_relative() && !ctx.working_dir.empty()) {
        dir = fs::path(ctx.working_dir) / dir;
    }

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return {false, "", format_error("ls", "not a directory", dir.string())};
    }

    std::vector<std::string> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            name += "/";
        }
        entries.push_back(name);
    }
    if (ec) {
        return {false, "", format_error("ls", ec.message(), dir.string())};
    }

    std::sort(entries.begin(), entries.end());
    std::string out;
    for (const auto& e : entries) {
        out += e + "\n";
    }
    if (out.empty()) {
        out = "(empty directory)\n";
    }
    return {true, out, ""};
}

tool_def make_ls_tool() {
    tool_def tool;
    tool.name = "ls";
    tool.description = "List directory entries, sorted by name. Directories end with '/'.";
    tool.signature = "ls(path?: string)";
    tool.parameters = R"json({
        "type": "object",
        "properties": {
            "path": {
                "type": "string",
                "description": "Directory to list (default: working directory)"
            }
        }
    })json";
    tool.execute = ls_execute;
    return tool;
}

void register_host_tools(host_session& host) {
    host.add_tool(make_read_tool());
    host.add_tool(make_ls_tool());
}

} // namespace crew
