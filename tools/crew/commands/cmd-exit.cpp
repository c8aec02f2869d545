#include "command-handler.h"

#include <spdlog/fmt/fmt.h>

namespace crew {

static command_result exit_session(const std::string&, command_context& ctx) {
    if (ctx.in_flight > 0) {
        fmt::print("\nCancelling {} running {}.\n", ctx.in_flight,
                   ctx.in_flight == 1 ? "dispatch" : "dispatches");
    }
    return command_result::EXIT;
}

void register_exit_commands(command_dispatcher& dispatcher) {
    // Running children are cancelled by main on the way out
    dispatcher.register_command("/exit", exit_session);
    dispatcher.register_command("/quit", exit_session);
}

} // namespace crew
