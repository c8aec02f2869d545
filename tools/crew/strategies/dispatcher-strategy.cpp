#include "dispatcher-strategy.h"

#include <spdlog/spdlog.h>

#include <optional>
#include <sstream>

namespace crew {

static const char* DELEGATE_TOOL = "delegate";

dispatcher_strategy::dispatcher_strategy(event_loop& loop,
                                         const profile_registry& registry,
                                         process_launcher& launcher,
                                         strategy_config config)
    : loop_(loop)
    , registry_(registry)
    , launcher_(launcher)
    , config_(std::move(config))
    , ticker_(loop, tracker_, config_.tick_interval_ms) {
    ticker_.set_callback([this]() { notify_change(); });
    sync_units();
}

dispatcher_strategy::~dispatcher_strategy() {
    cancel_all();
}

void dispatcher_strategy::sync_units() {
    for (const auto& profile : registry_.list()) {
        tracker_.add_unit(profile.name, profile.name);
    }
}

void dispatcher_strategy::notify_change() {
    if (on_change_) {
        on_change_();
    }
}

std::string dispatcher_strategy::resolve_model() const {
    return config_.model.empty() ? host_model_ : config_.model;
}

void dispatcher_strategy::on_session_start(host_session& host) {
    cancel_all();
    host_model_ = host.model();

    sync_units();
    tracker_.reset_all();

    tool_def tool;
    tool.name = DELEGATE_TOOL;
    tool.description = R"(Delegate a task to a specialized agent role and return its final answer.

Each role runs as an independent agent with its own capabilities and a fresh context.
It sees nothing of this conversation, so the task must be self-contained.

Single form: {"role": "...", "task": "..."}
Parallel form: {"tasks": [{"role": "...", "task": "..."}, ...]} runs different roles concurrently.)";
    tool.signature = "delegate(role: string, task: string) | delegate(tasks: [{role, task}])";
    tool.parameters = R"json({
        "type": "object",
        "properties": {
            "role": {
                "type": "string",
                "description": "Name of the agent role (see available agents)"
            },
            "task": {
                "type": "string",
                "description": "Complete, self-contained task for the agent"
            },
            "tasks": {
                "type": "array",
                "description": "Several delegations to run concurrently",
                "items": {
                    "type": "object",
                    "properties": {
                        "role": {"type": "string"},
                        "task": {"type": "string"}
                    },
                    "required": ["role", "task"]
                }
            }
        }
    })json";
    tool.execute = [this](const json& args, const tool_context& ctx) -> tool_result {
        if (args.contains("tasks")) {
            const json& tasks = args.at("tasks");
            if (!tasks.is_array() || tasks.empty()) {
                return {false, "", "tasks must be a non-empty array"};
            }
            std::vector<dispatch_request> requests;
            for (const auto& item : tasks) {
                dispatch_request req;
                req.role = item.value("role", "");
                req.task = item.value("task", "");
                if (req.role.empty() || req.task.empty()) {
                    return {false, "", "each entry of tasks needs a role and a task"};
                }
                requests.push_back(std::move(req));
            }

            auto outcomes = delegate_parallel(requests, ctx.is_interrupted);
            json results = json::array();
            bool all_ok = true;
            for (const auto& outcome : outcomes) {
                all_ok = all_ok && outcome.success();
                results.push_back(outcome.to_json());
            }
            if (all_ok) {
                return {true, dump_text(results), ""};
            }
            return {false, "", dump_text(results)};
        }

        std::string role = args.value("role", "");
        std::string task = args.value("task", "");
        if (role.empty()) {
            return {false, "", "role is required"};
        }
        if (task.empty()) {
            return {false, "", "task is required"};
        }
        return delegate(role, task, ctx.is_interrupted).to_tool_result();
    };

    host.add_tool(tool);
    host.set_active_tools({DELEGATE_TOOL});
    before_turn(host);

    spdlog::debug("dispatcher: session started with {} roles", registry_.size());
}

void dispatcher_strategy::before_turn(host_session& host) {
    host.set_system_prompt(build_instructions());
}

std::string dispatcher_strategy::build_instructions() const {
    std::ostringstream ss;
    ss << "You are a dispatcher coordinating specialized agents. You cannot read files, "
          "edit code or run commands yourself. Your only capability is `delegate`, which "
          "hands a task to one agent role and returns that agent's final answer.\n\n";

    ss << "## How to work\n\n";
    ss << "- Break the request into focused tasks and pick the role whose capabilities fit each one.\n";
    ss << "- Every agent starts with a fresh context. Put all needed context in the task.\n";
    ss << "- Independent tasks for different roles can be sent together with the `tasks` form and run concurrently.\n";
    ss << "- A role runs one task at a time. If a role is busy, wait for its result instead of retrying.\n";
    ss << "- When the work is done, summarize the agents' results for the user.\n\n";

    if (registry_.empty()) {
        ss << "No agent roles are registered. Tell the user that nothing can be delegated.\n";
        return ss.str();
    }

    ss << "## Available Agents\n\n";
    ss << registry_.generate_prompt_section();

    std::vector<std::string> busy;
    for (const auto& unit : tracker_.units()) {
        if (unit.status == unit_status::RUNNING) {
            busy.push_back(unit.id);
        }
    }
    if (!busy.empty()) {
        ss << "\nCurrently running: " << join(busy, ", ") << "\n";
    }
    return ss.str();
}

void dispatcher_strategy::delegate_async(const dispatch_request& request, outcome_callback cb) {
    const capability_profile* profile = registry_.lookup(request.role);
    if (!profile) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::ROLE_NOT_FOUND;
        outcome.role = request.role;
        auto names = registry_.names();
        outcome.text = "Unknown role: '" + request.role + "'. Available roles: " +
                       (names.empty() ? std::string("(none)") : join(names, ", "));
        spdlog::warn("delegate: unknown role '{}'", request.role);
        if (cb) {
            cb(outcome);
        }
        return;
    }

    sync_units();
    if (!tracker_.begin(request.role)) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::ROLE_BUSY;
        outcome.role = request.role;
        outcome.text = "Role '" + request.role + "' is already running a task. "
                       "Wait for it to finish before delegating to it again.";
        spdlog::info("delegate: role '{}' is busy", request.role);
        if (cb) {
            cb(outcome);
        }
        return;
    }

    launch_options options;
    options.model = resolve_model();
    options.timeout_ms = config_.dispatch_timeout_ms;
    if (config_.persist_sessions) {
        options.continuation_channel = request.role;
    }

    spdlog::info("delegate: starting '{}'", request.role);
    notify_change();
    ticker_.start();

    const std::string role = request.role;
    process_handle& handle = launcher_.launch(*profile, request.task, options);
    active_[role] = &handle;

    handle.subscribe([this, role](const progress_event& event) {
        tracker_.apply_event(role, event);
        notify_change();
    });

    handle.completion().then([this, role, cb](const launch_result& result) {
        active_.erase(role);
        tracker_.finish(role, result.success);

        dispatch_outcome outcome = dispatch_outcome::from_launch(result, role, outcome_status::CHILD_FAILURE);
        if (outcome.success()) {
            spdlog::info("delegate: '{}' finished in {:.0f} ms", role, result.elapsed_ms);
        } else {
            spdlog::warn("delegate: '{}' ended with {}", role, outcome_status_to_string(outcome.status));
        }

        ticker_.stop_if_idle();
        notify_change();
        if (cb) {
            cb(outcome);
        }
    });
}

dispatch_outcome dispatcher_strategy::delegate(const std::string& role,
                                               const std::string& task,
                                               const std::atomic<bool>* interrupted) {
    std::optional<dispatch_outcome> result;
    delegate_async({role, task}, [&result](const dispatch_outcome& outcome) {
        result = outcome;
    });

    loop_.run_until([&]() {
        if (!result && interrupted && interrupted->load()) {
            cancel(role);
        }
        return result.has_value();
    });

    if (!result) {
        // Nothing left on the loop that could resolve the child
        cancel(role);
    }
    if (!result) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::CHILD_FAILURE;
        outcome.role = role;
        outcome.text = "Child agent ended without a result";
        return outcome;
    }
    return *result;
}

std::vector<dispatch_outcome> dispatcher_strategy::delegate_parallel(const std::vector<dispatch_request>& requests,
                                                                     const std::atomic<bool>* interrupted) {
    std::vector<std::optional<dispatch_outcome>> results(requests.size());
    size_t pending = requests.size();

    for (size_t i = 0; i < requests.size(); i++) {
        delegate_async(requests[i], [&results, &pending, i](const dispatch_outcome& outcome) {
            results[i] = outcome;
            pending--;
        });
    }

    auto cancel_requested = [&]() {
        for (size_t i = 0; i < requests.size(); i++) {
            if (!results[i]) {
                cancel(requests[i].role);
            }
        }
    };

    loop_.run_until([&]() {
        if (pending > 0 && interrupted && interrupted->load()) {
            cancel_requested();
        }
        return pending == 0;
    });
    if (pending > 0) {
        cancel_requested();
    }

    std::vector<dispatch_outcome> outcomes;
    outcomes.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); i++) {
        if (results[i]) {
            outcomes.push_back(*results[i]);
        } else {
            dispatch_outcome outcome;
            outcome.status = outcome_status::CHILD_FAILURE;
            outcome.role = requests[i].role;
            outcome.text = "Child agent ended without a result";
            outcomes.push_back(outcome);
        }
    }
    return outcomes;
}

bool dispatcher_strategy::cancel(const std::string& role) {
    auto it = active_.find(role);
    if (it == active_.end()) {
        return false;
    }
    spdlog::info("delegate: cancelling '{}'", role);
    // kill() resolves synchronously; the continuation erases the entry
    it->second->kill();
    return true;
}

size_t dispatcher_strategy::cancel_all() {
    std::vector<std::string> roles;
    for (const auto& [role, handle] : active_) {
        roles.push_back(role);
    }
    size_t count = 0;
    for (const auto& role : roles) {
        if (cancel(role)) {
            count++;
        }
    }
    return count;
}

bool dispatcher_strategy::reset(const std::string& role) {
    if (!tracker_.contains(role) || tracker_.is_running(role)) {
        return false;
    }
    tracker_.reset(role);
    notify_change();
    return true;
}

std::vector<status_row> dispatcher_strategy::status() const {
    return project_status(tracker_.units(), projection_layout::LIST, config_.preview_width);
}

} // namespace crew
