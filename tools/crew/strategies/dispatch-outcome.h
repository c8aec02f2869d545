#pragma once

#include "../process/process-handle.h"
#include "../tool-registry.h"

#include <functional>
#include <string>

namespace crew {

// Outcome of one delegate() or run_pipeline() call
enum class outcome_status {
    SUCCESS,
    ROLE_BUSY,        // target role already RUNNING; nothing was started
    ROLE_NOT_FOUND,   // unknown role; nothing was started
    LAUNCH_FAILURE,   // the child could not be started
    CHILD_FAILURE,    // a dispatched child exited with failure
    STEP_FAILURE,     // a pipeline step exited with failure
    CANCELLED,
    TIMED_OUT,
};

const char* outcome_status_to_string(outcome_status status);

/**
 * Every orchestration error is recovered locally into one of these and
 * reaches the parent agent as an ordinary capability result.
 *
 * success() / is_busy() / is_not_found() / is_failure() give the coarse
 * Success | Busy | NotFound | Failure view.
 */
struct dispatch_outcome {
    outcome_status status = outcome_status::SUCCESS;
    std::string text;       // output on success, diagnostic otherwise
    std::string role;
    int step = -1;          // pipeline step index (0-based), -1 outside pipelines
    double elapsed_ms = 0;

    bool success() const { return status == outcome_status::SUCCESS; }
    bool is_busy() const { return status == outcome_status::ROLE_BUSY; }
    bool is_not_found() const { return status == outcome_status::ROLE_NOT_FOUND; }
    bool is_failure() const { return !success() && !is_busy() && !is_not_found(); }

    // Map a finished launch onto an outcome. failure_status is used for
    // FAILED results (CHILD_FAILURE or STEP_FAILURE).
    static dispatch_outcome from_launch(const launch_result& result,
                                        const std::string& role,
                                        outcome_status failure_status,
                                        int step = -1);

    tool_result to_tool_result() const;
    json to_json() const;
};

// Pretty-printed JSON that never throws on invalid UTF-8 in string values
std::string dump_text(const json& j);

using outcome_callback = std::function<void(const dispatch_outcome&)>;

} // namespace crew
