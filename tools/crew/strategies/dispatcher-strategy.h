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
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace crew {

// One delegation: a role and the task handed to it
struct dispatch_request {
    std::string role;
    std::string task;
};

/**
 * Dispatcher strategy: the parent agent may only delegate.
 *
 * On session start every host tool except `delegate` is deactivated, and
 * before each turn the parent's instructions are fully replaced by dispatcher
 * instructions built from the current registry. Each role is one unit of
 * work; at most one child per role runs at a time, while different roles run
 * concurrently.
 */
class dispatcher_strategy {
public:
    dispatcher_strategy(event_loop& loop,
                        const profile_registry& registry,
                        process_launcher& launcher,
                        strategy_config config = {});
    ~dispatcher_strategy();

    dispatcher_strategy(const dispatcher_strategy&) = delete;
    dispatcher_strategy& operator=(const dispatcher_strategy&) = delete;

    void on_session_start(host_session& host);
    void before_turn(host_session& host);

    // Dispatcher instructions for the current registry contents
    std::string build_instructions() const;

    // Start a delegation. Unknown and busy roles are reported through cb
    // before this returns; otherwise cb runs when the child finishes.
    void delegate_async(const dispatch_request& request, outcome_callback cb);

    // Blocking form used by the delegate capability
    dispatch_outcome delegate(const std::string& role,
                              const std::string& task,
                              const std::atomic<bool>* interrupted = nullptr);

    // Start every request, then wait for all of them. Results keep request order.
    std::vector<dispatch_outcome> delegate_parallel(const std::vector<dispatch_request>& requests,
                                                    const std::atomic<bool>* interrupted = nullptr);

    // Kill the running child of a role; returns false if the role is not running
    bool cancel(const std::string& role);
    size_t cancel_all();

    // Return a finished role to IDLE. Running roles are left alone.
    bool reset(const std::string& role);

    const unit_tracker& tracker() const { return tracker_; }
    std::vector<status_row> status() const;
    bool is_running(const std::string& role) const { return tracker_.is_running(role); }

    // Invoked after every unit state change and ticker update
    void set_change_callback(std::function<void()> cb) { on_change_ = std::move(cb); }


private:
    void sync_units();
    void notify_change();
    std::string resolve_model() const;

    event_loop& loop_;
    const profile_registry& registry_;
    process_launcher& launcher_;
    strategy_config config_;

    unit_tracker tracker_;
    elapsed_ticker ticker_;
    std::map<std::string, process_handle*> active_;
    std::string host_model_;
    std::function<void()> on_change_;
};

} // namespace crew
