#include "host-tools.h"

#include <fstream>
#include <sstream>

namespace crew {

static fs::path resolve_path(const std::string& path, const tool_context& ctx) {
    fs::path p(path);
    if (p.is_relative() && !ctx.working_dir.empty()) {
        p = fs::path(ctx.working_dir) / p;
    }
    return p;
}

static tool_result read_execute(const json& args, const tool_context& ctx) {
    std::string path = args.value("path", "");
    int offset = args.value("offset", 1);
    int limit = args.value("limit", 2000);

    if (path.empty()) {
        return {false, "", "path is required"};
    }
    if (offset < 1) {
        offset = 1;
    }

    fs::path full = resolve_path(path, ctx);
    std::error_code ec;
    if (!fs::exists(full, ec)) {
        return {false, "", format_error("read", "file not found", full.string())};
    }
    if (fs::is_directory(full, ec)) {
        return {false, "", format_error("read", "path is a directory", full.string())};
    }

    std::ifstream f(full);
    if (!f) {
        return {false, "", format_error("read", "cannot open file", full.string())};
    }

    std::ostringstream out;
    std::string line;
    int line_no = 0;
    int emitted = 0;
    while (std::getline(f, line)) {
        line_no++;
        if (line_no < offset) {
            continue;
        }
        if (emitted >= limit) {
            out << "... (truncated at " << limit << " lines)\n";
            break;
        }
        out << line_no << "\t" << line << "\n";
        emitted++;
    }
    return {true, out.str(), ""};
}

tool_def make_read_tool() {
    tool_def tool;
    tool.name = "read";
    tool.description = "Read a text file with line numbers. Relative paths resolve against the working directory.";
    tool.signature = "read(path: string, offset?: int, limit?: int)";
    tool.parameters = R"json({
        "type": "object",
        "properties": {
            "path": {
                "type": "string",
                "description": "File to read"
            },
            "offset": {
                "type": "integer",
                "description": "First line to return, 1-based (default: 1)"
            },
            "limit": {
                "type": "integer",
                "description": "Maximum number of lines (default: 2000)"
            }
        },
        "required": ["path"]
    })json";
    tool.execute = read_execute;
    return tool;
}

} // namespace crew
