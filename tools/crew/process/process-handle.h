#pragma once

#include "completion.h"
#include "event-stream-decoder.h"
#include "progress-event.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace crew {

enum class launch_status {
    COMPLETED,     // exited 0
    FAILED,        // non-zero exit, signal, or failing end marker
    SPAWN_ERROR,   // the process could not be started at all
    CANCELLED,     // killed by the operator
    TIMED_OUT,     // killed by the dispatch deadline
};

const char* launch_status_to_string(launch_status status);

// Uniform result of every launch, whether or not a process actually ran
struct launch_result {
    launch_status status = launch_status::FAILED;
    bool success = false;
    std::string output;        // concatenated text fragments
    std::string diagnostic;    // error description plus stderr tail (empty on success)
    int exit_code = -1;
    double elapsed_ms = 0;
};

/**
 * A launched child. Owned by the launcher that created it.
 *
 * Subclasses feed raw stdout/stderr bytes and the exit status through the
 * protected hooks; this base decodes stdout, fans events out to
 * subscribers, collects the output text and resolves the completion slot
 * exactly once, whichever of exit, kill, timeout or spawn error comes first.
 */
class process_handle {
public:
    using clock = std::chrono::steady_clock;

    explicit process_handle(uint64_t id);
    virtual ~process_handle() = default;

    process_handle(const process_handle&) = delete;
    process_handle& operator=(const process_handle&) = delete;

    uint64_t id() const { return id_; }

    completion_slot<launch_result>& completion() { return completion_; }
    const completion_slot<launch_result>& completion() const { return completion_; }

    // Events are delivered in stream order to every subscriber
    void subscribe(progress_callback cb);

    // Terminate the child and resolve as CANCELLED. No-op once resolved.
    void kill();

    // Terminate the child and resolve as TIMED_OUT. No-op once resolved.
    void expire();

    bool is_running() const { return !completion_.is_ready(); }
    clock::time_point started_at() const { return started_at_; }
    double elapsed_ms() const;

    const std::string& output() const { return output_; }
    size_t discarded_lines() const { return decoder_.discarded_lines(); }

protected:
    // Force the child down; must end in a call to on_exit()
    virtual void terminate() = 0;

    void on_stdout(std::string_view chunk);
    void on_stderr(std::string_view chunk);
    void on_exit(int exit_code, bool signaled);
    void fail_to_start(const std::string& message);

private:
    enum class stop_reason { NONE, CANCELLED, TIMED_OUT };

    void dispatch_event(const progress_event& event);
    void resolve(launch_result result);

    uint64_t id_;
    clock::time_point started_at_;
    completion_slot<launch_result> completion_;
    event_stream_decoder decoder_;
    std::vector<progress_callback> subscribers_;
    std::string output_;
    std::string stderr_tail_;
    int stream_exit_status_ = 0;
    stop_reason stop_reason_ = stop_reason::NONE;
};

} // namespace crew
