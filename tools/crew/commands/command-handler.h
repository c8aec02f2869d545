#pragma once

// Command handler infrastructure for slash commands.
// Provides a map-based dispatch pattern for clean separation of concerns.

#include "../common/crew-common.h"

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace crew {

class host_session;
class profile_registry;
class continuation_store;
class dispatcher_strategy;
class pipeline_strategy;
struct dispatch_outcome;
struct status_row;

// Context passed to each command handler. Exactly one of dispatcher and
// pipeline is set, matching the active strategy.
struct command_context {
    host_session& host;
    const profile_registry& registry;
    continuation_store& store;
    dispatcher_strategy* dispatcher;
    pipeline_strategy* pipeline;
    std::atomic<bool>& is_interrupted;

    int in_flight = 0;          // async commands not yet resolved
    bool last_failed = false;   // outcome of the most recent resolved command
};

// Result of command execution
enum class command_result {
    CONTINUE,       // Continue main loop, get next input
    EXIT,           // Exit
    NOT_COMMAND,    // Input is not a registered command
};

// Command handler function signature
using command_handler = std::function<command_result(
    const std::string& args,
    command_context& ctx
)>;

// Command dispatcher with map-based routing
class command_dispatcher {
public:
    // Register a command handler
    void register_command(const std::string& name, command_handler handler);

    // Dispatch a command (input should include the leading /)
    // Returns NOT_COMMAND if input is not a registered command
    command_result dispatch(const std::string& input, command_context& ctx);

    // Get list of all registered command names
    std::vector<std::string> get_command_names() const;

private:
    std::map<std::string, command_handler> handlers_;
};

// Operator output helpers (stdout)
void print_outcome(const dispatch_outcome& outcome);
void print_status_rows(const std::vector<status_row>& rows);

// Registration functions - call these at startup
void register_exit_commands(command_dispatcher& dispatcher);
void register_info_commands(command_dispatcher& dispatcher);
void register_orchestration_commands(command_dispatcher& dispatcher);

} // namespace crew
