#pragma once

#include "event-loop.h"
#include "process-handle.h"
#include "../profiles/profile-registry.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace crew {

class continuation_store;

// Per-launch options
struct launch_options {
    std::string continuation_channel;  // empty = no continuation
    std::string model;                 // empty = launcher default
    int timeout_ms = 0;                // 0 = no deadline
};

/**
 * Starts child agents and owns their handles.
 *
 * launch() never throws and always returns a handle: when the process cannot
 * be started the handle's completion is already resolved with SPAWN_ERROR,
 * so callers await one uniform result shape either way.
 *
 * A handle stays valid until the loop turn after its completion
 * continuations ran; callers must not keep references past that point.
 */
class process_launcher {
public:
    explicit process_launcher(event_loop& loop);
    virtual ~process_launcher();

    process_launcher(const process_launcher&) = delete;
    process_launcher& operator=(const process_launcher&) = delete;

    process_handle& launch(const capability_profile& profile,
                           const std::string& task,
                           const launch_options& options = {});

    size_t running_count() const;

    // Cancel every running child
    void kill_all();

    event_loop& loop() { return loop_; }

protected:
    virtual std::unique_ptr<process_handle> start_process(uint64_t id,
                                                          const capability_profile& profile,
                                                          const std::string& task,
                                                          const launch_options& options) = 0;

    event_loop& loop_;

private:
    void retire(uint64_t id);

    std::map<uint64_t, std::unique_ptr<process_handle>> handles_;
    std::map<uint64_t, event_loop::timer_id> deadlines_;
    uint64_t next_id_ = 1;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);  // guards posted cleanup
};

// Drive the loop until the handle resolves and return its result.
// Raising *interrupted kills the handle (the result is then CANCELLED).
launch_result await_completion(event_loop& loop,
                               process_handle& handle,
                               const std::atomic<bool>* interrupted = nullptr);

// How the child agent binary is invoked
struct launcher_config {
    std::string agent_binary;              // resolved through PATH
    std::string default_model;             // empty = FALLBACK_MODEL
    std::string working_dir;               // empty = inherit
    bool suppress_extensions = true;       // children must not load spawning extensions
    std::vector<std::string> extra_args;   // inserted before the task
};

// Launches child agents as OS processes
class subprocess_launcher : public process_launcher {
public:
    subprocess_launcher(event_loop& loop,
                        launcher_config config,
                        continuation_store* store = nullptr);

    // Full argv for one dispatch. The task is always the last argument.
    std::vector<std::string> build_command(const capability_profile& profile,
                                           const std::string& task,
                                           const launch_options& options) const;

protected:
    std::unique_ptr<process_handle> start_process(uint64_t id,
                                                  const capability_profile& profile,
                                                  const std::string& task,
                                                  const launch_options& options) override;

private:
    launcher_config config_;
    continuation_store* store_ = nullptr;
};

} // namespace crew
