#include "command-handler.h"
#include "../strategies/dispatch-outcome.h"
#include "../tracking/status-projector.h"

#include <cstdio>

#include <spdlog/fmt/fmt.h>

namespace crew {

void command_dispatcher::register_command(const std::string& name, command_handler handler) {
    handlers_[name] = std::move(handler);
}

command_result command_dispatcher::dispatch(const std::string& input, command_context& ctx) {
    // Find matching command
    for (const auto& [cmd_name, handler] : handlers_) {
        if (input == cmd_name) {
            // Command with no arguments
            return handler("", ctx);
        }
        if (input.rfind(cmd_name + " ", 0) == 0) {
            // Command with arguments
            std::string args = trim(input.substr(cmd_name.length() + 1));
            return handler(args, ctx);
        }
    }

    // Not a recognized command
    return command_result::NOT_COMMAND;
}

std::vector<std::string> command_dispatcher::get_command_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, _] : handlers_) {
        names.push_back(name);
    }
    return names;
}

void print_outcome(const dispatch_outcome& outcome) {
    std::string who = outcome.role;
    if (outcome.step >= 0) {
        who = fmt::format("step {} ({})", outcome.step + 1, outcome.role);
    }

    if (outcome.success()) {
        fmt::print("\n[{}] done in {:.1f}s\n\n{}\n", who, outcome.elapsed_ms / 1000.0, outcome.text);
    } else {
        fmt::print("\n[{}] {}\n{}\n", who.empty() ? "pipeline" : who,
                   outcome_status_to_string(outcome.status), outcome.text);
    }
    fflush(stdout);
}

void print_status_rows(const std::vector<status_row>& rows) {
    if (rows.empty()) {
        fmt::print("\nNothing tracked.\n");
        return;
    }
    fmt::print("\n");
    for (const auto& row : rows) {
        if (!row.connector.empty()) {
            fmt::print("  {}\n", row.connector);
        }
        fmt::print("  {} {:<12} {:>4}s  {}\n", row.glyph, row.label, row.elapsed_seconds, row.preview);
    }
    fflush(stdout);
}

} // namespace crew
