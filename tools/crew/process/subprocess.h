#pragma once

#include "event-loop.h"
#include "process-handle.h"

#include <string>
#include <vector>

#include <sys/types.h>

namespace crew {

// Owning wrapper for a POSIX file descriptor
class unique_fd {
public:
    unique_fd() = default;
    explicit unique_fd(int fd) : fd_(fd) {}
    ~unique_fd() { reset(); }

    unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
    unique_fd& operator=(unique_fd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

/**
 * A child process started with fork/exec whose stdout and stderr are
 * non-blocking pipes serviced by the event loop.
 *
 * The child runs in its own process group so that terminate() also reaches
 * any tools the agent started itself.
 */
class subprocess_handle : public process_handle {
public:
    subprocess_handle(uint64_t id, event_loop& loop);
    ~subprocess_handle() override;

    // Start argv[0] (resolved through PATH). Never throws; on failure the
    // completion slot is already resolved with SPAWN_ERROR when this returns.
    bool start(const std::vector<std::string>& argv, const std::string& working_dir = "");

    pid_t pid() const { return pid_; }

protected:
    void terminate() override;

private:
    void on_readable(int fd, short revents);
    // Read until EAGAIN or EOF; returns false on EOF/error
    bool drain(int fd);
    void close_stream(unique_fd& stream);
    void try_reap();
    void finish(int wait_status);

    event_loop& loop_;
    pid_t pid_ = -1;
    unique_fd stdout_fd_;
    unique_fd stderr_fd_;
    event_loop::timer_id reap_timer_ = 0;
    bool reaped_ = false;
};

} // namespace crew
