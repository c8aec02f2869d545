#include "command-handler.h"
#include "../context/continuation-store.h"
#include "../strategies/dispatcher-strategy.h"
#include "../strategies/host-session.h"
#include "../strategies/pipeline-strategy.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace crew {

// Split "<first> <rest>" on the first whitespace run
static std::pair<std::string, std::string> split_first_word(const std::string& args) {
    size_t end = args.find_first_of(" \t");
    if (end == std::string::npos) {
        return {args, ""};
    }
    return {args.substr(0, end), trim(args.substr(end + 1))};
}

static void on_async_outcome(command_context& ctx, const dispatch_outcome& outcome) {
    ctx.in_flight--;
    ctx.last_failed = !outcome.success();
    print_outcome(outcome);
}

void register_orchestration_commands(command_dispatcher& dispatcher) {
    // /delegate ROLE TASK - Start a delegation without blocking the prompt
    dispatcher.register_command("/delegate", [](const std::string& args, command_context& ctx) {
        if (!ctx.dispatcher) {
            fmt::print("\n/delegate is only available in dispatcher mode.\n");
            return command_result::CONTINUE;
        }
        auto [role, task] = split_first_word(args);
        if (role.empty() || task.empty()) {
            fmt::print("\nUsage: /delegate ROLE TASK\n");
            return command_result::CONTINUE;
        }

        ctx.in_flight++;
        command_context* c = &ctx;
        ctx.dispatcher->delegate_async({role, task}, [c](const dispatch_outcome& outcome) {
            on_async_outcome(*c, outcome);
        });
        if (ctx.dispatcher->is_running(role)) {
            fmt::print("\n[{}] started\n", role);
        }
        return command_result::CONTINUE;
    });

    // /pipeline TASK - Start a pipeline run without blocking the prompt
    dispatcher.register_command("/pipeline", [](const std::string& args, command_context& ctx) {
        if (!ctx.pipeline) {
            fmt::print("\n/pipeline is only available in pipeline mode.\n");
            return command_result::CONTINUE;
        }
        if (args.empty()) {
            fmt::print("\nUsage: /pipeline TASK\n");
            return command_result::CONTINUE;
        }

        ctx.in_flight++;
        command_context* c = &ctx;
        ctx.pipeline->run_async(args, [c](const dispatch_outcome& outcome) {
            on_async_outcome(*c, outcome);
        });
        if (ctx.pipeline->is_running()) {
            fmt::print("\n[pipeline] started\n");
        }
        return command_result::CONTINUE;
    });

    // /call TOOL [JSON] - Call an active host tool through the session boundary
    dispatcher.register_command("/call", [](const std::string& args, command_context& ctx) {
        auto [name, raw] = split_first_word(args);
        if (name.empty()) {
            fmt::print("\nUsage: /call TOOL [JSON]\n");
            return command_result::CONTINUE;
        }

        json call_args = json::object();
        if (!raw.empty()) {
            call_args = json::parse(raw, nullptr, false);
            if (call_args.is_discarded() || !call_args.is_object()) {
                fmt::print("\nArguments must be a JSON object.\n");
                return command_result::CONTINUE;
            }
        }

        tool_result result = ctx.host.execute(name, call_args);
        ctx.last_failed = !result.success;
        if (result.success) {
            fmt::print("\n{}\n", result.output);
        } else {
            fmt::print("\nError: {}\n", result.error);
        }
        return command_result::CONTINUE;
    });

    // /cancel [ROLE] - Kill running children
    dispatcher.register_command("/cancel", [](const std::string& args, command_context& ctx) {
        if (ctx.pipeline) {
            if (!ctx.pipeline->cancel()) {
                fmt::print("\nNo pipeline run in progress.\n");
            }
            return command_result::CONTINUE;
        }
        if (!args.empty()) {
            if (!ctx.dispatcher->cancel(args)) {
                fmt::print("\nRole '{}' is not running.\n", args);
            }
            return command_result::CONTINUE;
        }
        size_t n = ctx.dispatcher->cancel_all();
        if (n == 0) {
            fmt::print("\nNothing is running.\n");
        }
        return command_result::CONTINUE;
    });

    // /reset [ROLE] - Session reset, or forget one role's continuation
    dispatcher.register_command("/reset", [](const std::string& args, command_context& ctx) {
        if (!args.empty()) {
            if (ctx.dispatcher && ctx.dispatcher->is_running(args)) {
                fmt::print("\nRole '{}' is running; cancel it first.\n", args);
                return command_result::CONTINUE;
            }
            if (ctx.dispatcher) {
                ctx.dispatcher->reset(args);
            }
            if (ctx.store.remove(args)) {
                fmt::print("\nForgot continuation record for '{}'.\n", args);
            } else {
                fmt::print("\nNo continuation record for '{}'.\n", args);
            }
            return command_result::CONTINUE;
        }

        // Starting the session again cancels running work and returns every unit to IDLE
        if (ctx.dispatcher) {
            ctx.dispatcher->on_session_start(ctx.host);
        } else if (ctx.pipeline) {
            ctx.pipeline->on_session_start(ctx.host);
        }
        spdlog::info("session reset");
        fmt::print("\nSession reset.\n");
        return command_result::CONTINUE;
    });
}

} // namespace crew
