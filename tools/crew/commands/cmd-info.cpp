#include "command-handler.h"
#include "../context/continuation-store.h"
#include "../profiles/profile-registry.h"
#include "../strategies/dispatcher-strategy.h"
#include "../strategies/host-session.h"
#include "../strategies/pipeline-strategy.h"

#include <spdlog/fmt/fmt.h>

namespace crew {

void register_info_commands(command_dispatcher& dispatcher) {
    // /agents - List registered roles
    dispatcher.register_command("/agents", [](const std::string&, command_context& ctx) {
        const auto& profiles = ctx.registry.list();
        if (profiles.empty()) {
            fmt::print("\nNo agent roles registered.\n");
            return command_result::CONTINUE;
        }
        fmt::print("\nAvailable agents:\n");
        for (const auto& profile : profiles) {
            fmt::print("  {}:\n", profile.name);
            fmt::print("    {}\n", profile.description);
            if (profile.capability_set.empty()) {
                fmt::print("    Tools: (none)\n");
            } else {
                fmt::print("    Tools: {}\n", join(profile.capability_set, ", "));
            }
            if (profile.full_identity_replace) {
                fmt::print("    Replaces default instructions\n");
            }
        }
        return command_result::CONTINUE;
    });

    // /status - Show tracked units
    dispatcher.register_command("/status", [](const std::string&, command_context& ctx) {
        if (ctx.dispatcher) {
            print_status_rows(ctx.dispatcher->status());
        } else if (ctx.pipeline) {
            print_status_rows(ctx.pipeline->status());
        }
        return command_result::CONTINUE;
    });

    // /tools - List the host session's active capabilities
    dispatcher.register_command("/tools", [](const std::string&, command_context& ctx) {
        fmt::print("\nActive tools:\n");
        for (const auto& name : ctx.host.active_tools()) {
            const tool_def* tool = ctx.host.tools().get_tool(name);
            if (!tool) {
                continue;
            }
            fmt::print("  {}\n", tool->signature.empty() ? tool->name : tool->signature);
        }
        return command_result::CONTINUE;
    });

    // /sessions - List continuation channels
    dispatcher.register_command("/sessions", [](const std::string&, command_context& ctx) {
        auto channels = ctx.store.list();
        if (channels.empty()) {
            fmt::print("\nNo continuation records in {}\n", ctx.store.base_path());
            return command_result::CONTINUE;
        }
        fmt::print("\nContinuation records:\n");
        for (const auto& ch : channels) {
            fmt::print("  {:<12} {} dispatches, last {}{}\n", ch.channel, ch.dispatch_count, ch.updated_at,
                       ch.has_record ? "" : " (no record yet)");
        }
        return command_result::CONTINUE;
    });

    // /help - Show commands
    dispatcher.register_command("/help", [](const std::string&, command_context& ctx) {
        fmt::print("\nCommands:\n");
        if (ctx.dispatcher) {
            fmt::print("  /delegate ROLE TASK   run a role on a task in the background\n");
        } else {
            fmt::print("  /pipeline TASK        run the pipeline in the background\n");
        }
        fmt::print("  /call TOOL [JSON]     call an active host tool\n");
        fmt::print("  /cancel [ROLE]        cancel running work\n");
        fmt::print("  /reset [ROLE]         reset tracked state (and forget a role's continuation)\n");
        fmt::print("  /status               show tracked units\n");
        fmt::print("  /agents               list agent roles\n");
        fmt::print("  /tools                list active host tools\n");
        fmt::print("  /sessions             list continuation records\n");
        fmt::print("  /exit, /quit          exit\n");
        return command_result::CONTINUE;
    });
}

} // namespace crew
