#pragma once

#include "dispatch-outcome.h"
#include "host-session.h"
#include "strategy-config.h"
#include "../process/event-loop.h"
#include "../process/process-launcher.h"
#include "../profiles/profile-registry.h"
#include "../tracking/elapsed-ticker.h"
#include "../tracking/status-projector.h"
#include "../tracking/unit-tracker.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace crew {

// One fixed step of the pipeline. The template may use {previous} (output
// of the step before, or the original task for the first step) and {task}
// (always the original task). An empty template means "{previous}".
struct pipeline_step {
    std::string role;
    std::string instruction_template;
};

/**
 * Pipeline strategy: a fixed linear sequence of roles.
 *
 * The parent keeps its full capability set and gains `run_pipeline`; its
 * instructions are augmented, never replaced. Steps run strictly in order,
 * each starting only from the completion continuation of the one before.
 * The first failing step halts the run and later steps stay IDLE.
 */
class pipeline_strategy {
public:
    pipeline_strategy(event_loop& loop,
                      const profile_registry& registry,
                      process_launcher& launcher,
                      std::vector<pipeline_step> steps,
                      strategy_config config = {});
    ~pipeline_strategy();

    pipeline_strategy(const pipeline_strategy&) = delete;
    pipeline_strategy& operator=(const pipeline_strategy&) = delete;

    void on_session_start(host_session& host);
    void before_turn(host_session& host);

    // Section appended to the parent's default instructions
    std::string build_instructions_section() const;

    // Start a run. A run already in flight is reported as ROLE_BUSY before
    // this returns; otherwise cb runs once the run resolves.
    void run_async(const std::string& task, outcome_callback cb);

    // Blocking form used by the run_pipeline capability
    dispatch_outcome run(const std::string& task,
                         const std::atomic<bool>* interrupted = nullptr);

    // Kill the in-flight step; the run resolves CANCELLED
    bool cancel();

    bool is_running() const { return run_.has_value(); }
    // Index of the in-flight step, -1 when idle
    int current_step() const { return run_ ? static_cast<int>(run_->current) : -1; }

    const std::vector<pipeline_step>& steps() const { return steps_; }
    const unit_tracker& tracker() const { return tracker_; }
    std::vector<status_row> status() const;

    void set_change_callback(std::function<void()> cb) { on_change_ = std::move(cb); }


    static std::string resolve_instruction(const std::string& instruction_template,
                                           const std::string& previous,
                                           const std::string& task);

    // Unit id of step i
    static std::string step_id(size_t index);

private:
    struct pipeline_run {
        std::string task;
        std::string previous;
        size_t current = 0;
        outcome_callback cb;
        process_handle* handle = nullptr;
        std::chrono::steady_clock::time_point started_at;
    };

    void start_step(size_t index);
    void on_step_finished(size_t index, const launch_result& result);
    void finish_run(dispatch_outcome outcome);
    void notify_change();

    event_loop& loop_;
    const profile_registry& registry_;
    process_launcher& launcher_;
    std::vector<pipeline_step> steps_;
    strategy_config config_;

    unit_tracker tracker_;
    elapsed_ticker ticker_;
    std::optional<pipeline_run> run_;
    std::string host_model_;
    std::function<void()> on_change_;
};

} // namespace crew
