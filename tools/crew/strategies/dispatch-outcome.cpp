#include "dispatch-outcome.h"

namespace crew {

const char* outcome_status_to_string(outcome_status status) {
    switch (status) {
        case outcome_status::SUCCESS:        return "success";
        case outcome_status::ROLE_BUSY:      return "role_busy";
        case outcome_status::ROLE_NOT_FOUND: return "role_not_found";
        case outcome_status::LAUNCH_FAILURE: return "launch_failure";
        case outcome_status::CHILD_FAILURE:  return "child_failure";
        case outcome_status::STEP_FAILURE:   return "step_failure";
        case outcome_status::CANCELLED:      return "cancelled";
        case outcome_status::TIMED_OUT:      return "timed_out";
        default:                             return "unknown";
    }
}

dispatch_outcome dispatch_outcome::from_launch(const launch_result& result,
                                               const std::string& role,
                                               outcome_status failure_status,
                                               int step) {
    dispatch_outcome outcome;
    outcome.role = role;
    outcome.step = step;
    outcome.elapsed_ms = result.elapsed_ms;

    switch (result.status) {
        case launch_status::COMPLETED:
            outcome.status = outcome_status::SUCCESS;
            outcome.text = result.output;
            return outcome;
        case launch_status::SPAWN_ERROR:
            outcome.status = outcome_status::LAUNCH_FAILURE;
            break;
        case launch_status::CANCELLED:
            outcome.status = outcome_status::CANCELLED;
            break;
        case launch_status::TIMED_OUT:
            outcome.status = outcome_status::TIMED_OUT;
            break;
        case launch_status::FAILED:
        default:
            outcome.status = failure_status;
            break;
    }

    outcome.text = result.diagnostic;
    if (!result.output.empty()) {
        outcome.text += "\n\nPartial output:\n" + result.output;
    }
    return outcome;
}

json dispatch_outcome::to_json() const {
    json j;
    j["status"] = outcome_status_to_string(status);
    if (!role.empty()) {
        j["role"] = role;
    }
    if (step >= 0) {
        j["step"] = step + 1;
    }
    j[success() ? "result" : "error"] = text;
    if (elapsed_ms > 0) {
        j["elapsed_ms"] = static_cast<int64_t>(elapsed_ms);
    }
    return j;
}

std::string dump_text(const json& j) {
    // Child stderr is raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

tool_result dispatch_outcome::to_tool_result() const {
    if (success()) {
        return {true, text, ""};
    }
    return {false, "", dump_text(to_json())};
}

} // namespace crew
