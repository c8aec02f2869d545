#include "pipeline-strategy.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace crew {

static const char* PIPELINE_TOOL = "run_pipeline";

pipeline_strategy::pipeline_strategy(event_loop& loop,
                                     const profile_registry& registry,
                                     process_launcher& launcher,
                                     std::vector<pipeline_step> steps,
                                     strategy_config config)
    : loop_(loop)
    , registry_(registry)
    , launcher_(launcher)
    , steps_(std::move(steps))
    , config_(std::move(config))
    , ticker_(loop, tracker_, config_.tick_interval_ms) {
    ticker_.set_callback([this]() { notify_change(); });
    for (size_t i = 0; i < steps_.size(); i++) {
        tracker_.add_unit(step_id(i), steps_[i].role);
    }
}

pipeline_strategy::~pipeline_strategy() {
    cancel();
}

std::string pipeline_strategy::step_id(size_t index) {
    return "step-" + std::to_string(index);
}

std::string pipeline_strategy::resolve_instruction(const std::string& instruction_template,
                                                   const std::string& previous,
                                                   const std::string& task) {
    if (instruction_template.empty()) {
        return previous;
    }

    static const std::string PREVIOUS = "{previous}";
    static const std::string TASK = "{task}";

    // Single pass: substituted text is never scanned again
    std::string out;
    out.reserve(instruction_template.size() + previous.size() + task.size());
    size_t pos = 0;
    while (pos < instruction_template.size()) {
        if (instruction_template.compare(pos, PREVIOUS.size(), PREVIOUS) == 0) {
            out += previous;
            pos += PREVIOUS.size();
        } else if (instruction_template.compare(pos, TASK.size(), TASK) == 0) {
            out += task;
            pos += TASK.size();
        } else {
            out += instruction_template[pos++];
        }
    }
    return out;
}

void pipeline_strategy::notify_change() {
    if (on_change_) {
        on_change_();
    }
}

void pipeline_strategy::on_session_start(host_session& host) {
    cancel();
    host_model_ = host.model();
    tracker_.reset_all();

    tool_def tool;
    tool.name = PIPELINE_TOOL;
    tool.description = R"(Run the fixed agent pipeline on a task and return the final agent's output.

Each agent in the sequence receives the previous agent's output. The run stops
at the first failing step and reports which step failed.)";
    tool.signature = "run_pipeline(task: string)";
    tool.parameters = R"json({
        "type": "object",
        "properties": {
            "task": {
                "type": "string",
                "description": "The task to run through the pipeline"
            }
        },
        "required": ["task"]
    })json";
    tool.execute = [this](const json& args, const tool_context& ctx) -> tool_result {
        std::string task = args.value("task", "");
        if (task.empty()) {
            return {false, "", "task is required"};
        }
        return run(task, ctx.is_interrupted).to_tool_result();
    };

    host.add_tool(tool);
    host.activate_all_tools();
    before_turn(host);

    spdlog::debug("pipeline: session started with {} steps", steps_.size());
}

void pipeline_strategy::before_turn(host_session& host) {
    std::string prompt = host.default_system_prompt();
    if (!prompt.empty()) {
        prompt += "\n\n";
    }
    prompt += build_instructions_section();
    host.set_system_prompt(prompt);
}

std::string pipeline_strategy::build_instructions_section() const {
    std::ostringstream ss;
    ss << "## Agent Pipeline\n\n";

    if (steps_.empty()) {
        ss << "The `run_pipeline` capability has no steps configured. Work directly.\n";
        return ss.str();
    }

    std::vector<std::string> roles;
    for (const auto& step : steps_) {
        roles.push_back(step.role);
    }
    ss << "You can run a fixed sequence of specialized agents with `run_pipeline(task)`: "
       << join(roles, " → ") << ".\n";
    ss << "Each agent receives the previous agent's output and the last agent's output is returned.\n\n";
    ss << "Use the pipeline for larger changes that benefit from exploring and planning before editing. "
          "Handle small, well-understood tasks directly with your own tools.\n\n";

    ss << "Steps:\n";
    for (size_t i = 0; i < steps_.size(); i++) {
        ss << (i + 1) << ". " << steps_[i].role;
        const capability_profile* profile = registry_.lookup(steps_[i].role);
        if (profile && !profile->description.empty()) {
            ss << ": " << profile->description;
        } else if (!profile) {
            ss << " (not registered)";
        }
        ss << "\n";
    }
    return ss.str();
}

void pipeline_strategy::run_async(const std::string& task, outcome_callback cb) {
    if (run_) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::ROLE_BUSY;
        outcome.step = static_cast<int>(run_->current);
        outcome.role = steps_[run_->current].role;
        outcome.text = "A pipeline run is already in progress (step " +
                       std::to_string(run_->current + 1) + ", " + outcome.role + ")";
        spdlog::info("pipeline: rejected, run already in progress");
        if (cb) {
            cb(outcome);
        }
        return;
    }

    tracker_.reset_all();

    if (steps_.empty()) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::STEP_FAILURE;
        outcome.text = "Pipeline has no steps configured";
        notify_change();
        if (cb) {
            cb(outcome);
        }
        return;
    }

    pipeline_run state;
    state.task = task;
    state.previous = task;
    state.cb = std::move(cb);
    state.started_at = std::chrono::steady_clock::now();
    run_ = std::move(state);

    spdlog::info("pipeline: starting run with {} steps", steps_.size());
    start_step(0);
}

void pipeline_strategy::start_step(size_t index) {
    run_->current = index;
    const pipeline_step& step = steps_[index];

    const capability_profile* profile = registry_.lookup(step.role);
    if (!profile) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::ROLE_NOT_FOUND;
        outcome.role = step.role;
        outcome.step = static_cast<int>(index);
        auto names = registry_.names();
        outcome.text = "Step " + std::to_string(index + 1) + " (" + step.role + "): unknown role. Available roles: " +
                       (names.empty() ? std::string("(none)") : join(names, ", "));
        spdlog::warn("pipeline: step {} names unknown role '{}'", index + 1, step.role);
        finish_run(std::move(outcome));
        return;
    }

    const std::string id = step_id(index);
    tracker_.begin(id);

    launch_options options;
    options.model = config_.model.empty() ? host_model_ : config_.model;
    options.timeout_ms = config_.dispatch_timeout_ms;

    std::string instruction = resolve_instruction(step.instruction_template, run_->previous, run_->task);

    spdlog::info("pipeline: step {}/{} ({}) starting", index + 1, steps_.size(), step.role);
    notify_change();
    ticker_.start();

    process_handle& handle = launcher_.launch(*profile, instruction, options);
    run_->handle = &handle;

    handle.subscribe([this, id](const progress_event& event) {
        tracker_.apply_event(id, event);
        notify_change();
    });

    handle.completion().then([this, index](const launch_result& result) {
        on_step_finished(index, result);
    });
}

void pipeline_strategy::on_step_finished(size_t index, const launch_result& result) {
    run_->handle = nullptr;
    tracker_.finish(step_id(index), result.success);

    const std::string& role = steps_[index].role;
    if (!result.success) {
        dispatch_outcome outcome = dispatch_outcome::from_launch(result, role, outcome_status::STEP_FAILURE,
                                                                 static_cast<int>(index));
        std::string what;
        switch (outcome.status) {
            case outcome_status::CANCELLED:      what = "was cancelled"; break;
            case outcome_status::TIMED_OUT:      what = "timed out"; break;
            case outcome_status::LAUNCH_FAILURE: what = "could not start"; break;
            default:                             what = "failed"; break;
        }
        std::string prefix = "Step " + std::to_string(index + 1) + " (" + role + ") " + what;
        outcome.text = outcome.text.empty() ? prefix : prefix + ": " + outcome.text;

        spdlog::warn("pipeline: step {} ({}) {}, halting", index + 1, role, what);
        finish_run(std::move(outcome));
        return;
    }

    spdlog::info("pipeline: step {}/{} ({}) done in {:.0f} ms", index + 1, steps_.size(), role, result.elapsed_ms);

    if (index + 1 < steps_.size()) {
        run_->previous = result.output;
        start_step(index + 1);
        return;
    }

    dispatch_outcome outcome;
    outcome.status = outcome_status::SUCCESS;
    outcome.role = role;
    outcome.step = static_cast<int>(index);
    outcome.text = result.output;
    finish_run(std::move(outcome));
}

void pipeline_strategy::finish_run(dispatch_outcome outcome) {
    outcome.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - run_->started_at).count();

    outcome_callback cb = std::move(run_->cb);
    run_.reset();

    ticker_.stop_if_idle();
    notify_change();
    if (cb) {
        cb(outcome);
    }
}

dispatch_outcome pipeline_strategy::run(const std::string& task, const std::atomic<bool>* interrupted) {
    std::optional<dispatch_outcome> result;
    run_async(task, [&result](const dispatch_outcome& outcome) {
        result = outcome;
    });

    loop_.run_until([&]() {
        if (!result && interrupted && interrupted->load()) {
            cancel();
        }
        return result.has_value();
    });

    if (!result) {
        // Nothing left on the loop that could resolve the step
        cancel();
    }
    if (!result) {
        dispatch_outcome outcome;
        outcome.status = outcome_status::STEP_FAILURE;
        outcome.text = "Pipeline ended without a result";
        return outcome;
    }
    return *result;
}

bool pipeline_strategy::cancel() {
    if (!run_ || !run_->handle) {
        return false;
    }
    spdlog::info("pipeline: cancelling step {}", run_->current + 1);
    run_->handle->kill();
    return true;
}

std::vector<status_row> pipeline_strategy::status() const {
    return project_status(tracker_.units(), projection_layout::CHAIN, config_.preview_width);
}

} // namespace crew
