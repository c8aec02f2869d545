#pragma once

#include <functional>
#include <string>
#include <variant>

namespace crew {

// Incremental assistant text
struct text_fragment {
    std::string text;

    bool operator==(const text_fragment& other) const { return text == other.text; }
};

// The child started invoking a tool
struct tool_start {
    std::string name;

    bool operator==(const tool_start& other) const { return name == other.name; }
};

// End-of-run marker written by the child
struct run_completed {
    int exit_status = 0;

    bool operator==(const run_completed& other) const { return exit_status == other.exit_status; }
};

using progress_event = std::variant<text_fragment, tool_start, run_completed>;

using progress_callback = std::function<void(const progress_event&)>;

// Short human-readable form, used in logs and test failure output
std::string describe_event(const progress_event& event);

} // namespace crew
