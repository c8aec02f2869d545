#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace crew {

/**
 * Single-threaded cooperative event loop built on poll(2).
 *
 * Everything the orchestration core does (child output, completion
 * continuations, elapsed-time ticks) runs as a callback of this loop, so
 * tracker state never needs a lock.
 *
 * Callbacks may add or remove watchers, timers and tasks, and may drive the
 * loop recursively through run_until() (that is how a synchronous capability
 * call awaits a child while other children keep being serviced).
 */
class event_loop {
public:
    using clock = std::chrono::steady_clock;
    using fd_callback = std::function<void(short revents)>;
    using task = std::function<void()>;
    using timer_id = uint64_t;

    event_loop() = default;
    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    // Watch fd for readability (POLLIN); POLLHUP/POLLERR are always reported
    void watch_fd(int fd, fd_callback cb);
    void unwatch_fd(int fd);

    // Returns a non-zero id usable with cancel_timer()
    timer_id add_timer(int delay_ms, task cb, bool repeat = false);
    void cancel_timer(timer_id id);

    // Run cb on the next loop turn
    void post(task cb);

    // One turn: posted tasks, due timers, then at most one poll() of up to
    // max_wait_ms (-1 = until the next timer or MAX_POLL_WAIT_MS).
    // Returns true if any callback ran.
    bool run_once(int max_wait_ms = -1);

    // Turn the loop until done() is true, stop() is called or timeout_ms
    // elapses (-1 = no limit). Returns done().
    bool run_until(const std::function<bool()>& done, int timeout_ms = -1);

    // Turn the loop until stop() or no watchers, one-shot timers or tasks remain
    void run();
    void stop() { stopped_ = true; }

    // Watchers, one-shot timers or posted tasks outstanding.
    // Repeating timers alone do not count.
    bool has_pending_work() const;

    size_t watcher_count() const { return watchers_.size(); }

private:
    struct timer_entry {
        clock::time_point due;
        std::chrono::milliseconds interval;
        bool repeat = false;
        task cb;
    };

    bool run_posted();
    bool run_due_timers();
    int next_timer_wait_ms() const;

    std::map<int, fd_callback> watchers_;
    std::map<timer_id, timer_entry> timers_;
    std::vector<task> posted_;
    timer_id next_timer_id_ = 1;
    bool stopped_ = false;
};

} // namespace crew
