#include "event-loop.h"
#include "../common/constants.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <poll.h>

#include <spdlog/spdlog.h>

namespace crew {

void event_loop::watch_fd(int fd, fd_callback cb) {
    watchers_[fd] = std::move(cb);
}

void event_loop::unwatch_fd(int fd) {
    watchers_.erase(fd);
}

event_loop::timer_id event_loop::add_timer(int delay_ms, task cb, bool repeat) {
    timer_id id = next_timer_id_++;
    timer_entry entry;
    entry.interval = std::chrono::milliseconds(std::max(delay_ms, 0));
    entry.due = clock::now() + entry.interval;
    entry.repeat = repeat;
    entry.cb = std::move(cb);
    timers_.emplace(id, std::move(entry));
    return id;
}

void event_loop::cancel_timer(timer_id id) {
    timers_.erase(id);
}

void event_loop::post(task cb) {
    posted_.push_back(std::move(cb));
}

bool event_loop::has_pending_work() const {
    if (!watchers_.empty() || !posted_.empty()) {
        return true;
    }
    for (const auto& [id, timer] : timers_) {
        if (!timer.repeat) {
            return true;
        }
    }
    return false;
}

bool event_loop::run_posted() {
    if (posted_.empty()) {
        return false;
    }
    // Tasks posted while running wait for the next turn
    auto batch = std::move(posted_);
    posted_.clear();
    for (auto& cb : batch) {
        cb();
    }
    return true;
}

bool event_loop::run_due_timers() {
    const auto now = clock::now();

    std::vector<timer_id> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.due <= now) {
            due.push_back(id);
        }
    }

    for (timer_id id : due) {
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue;  // cancelled by an earlier callback
        }
        task cb = it->second.cb;
        if (it->second.repeat) {
            it->second.due = now + it->second.interval;
        } else {
            timers_.erase(it);
        }
        cb();
    }
    return !due.empty();
}

int event_loop::next_timer_wait_ms() const {
    if (timers_.empty()) {
        return config::MAX_POLL_WAIT_MS;
    }
    auto next = clock::time_point::max();
    for (const auto& [id, timer] : timers_) {
        next = std::min(next, timer.due);
    }
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next - clock::now()).count();
    if (wait < 0) return 0;
    return static_cast<int>(std::min<long long>(wait, config::MAX_POLL_WAIT_MS));
}

bool event_loop::run_once(int max_wait_ms) {
    bool did_work = run_posted();
    did_work = run_due_timers() || did_work;

    int wait_ms = next_timer_wait_ms();
    if (max_wait_ms >= 0) {
        wait_ms = std::min(wait_ms, max_wait_ms);
    }
    if (did_work || !posted_.empty()) {
        wait_ms = 0;
    }

    if (watchers_.empty()) {
        if (wait_ms > 0 && !timers_.empty()) {
            ::poll(nullptr, 0, wait_ms);
            did_work = run_due_timers() || did_work;
        }
        return did_work;
    }

    std::vector<pollfd> fds;
    fds.reserve(watchers_.size());
    for (const auto& [fd, cb] : watchers_) {
        fds.push_back(pollfd{fd, POLLIN, 0});
    }

    int ready = ::poll(fds.data(), fds.size(), wait_ms);
    if (ready < 0) {
        if (errno != EINTR) {
            spdlog::warn("poll failed: {}", std::strerror(errno));
        }
        return did_work;
    }

    for (const auto& pfd : fds) {
        if (pfd.revents == 0) {
            continue;
        }
        // The watcher may have been removed by an earlier callback this turn
        auto it = watchers_.find(pfd.fd);
        if (it == watchers_.end()) {
            continue;
        }
        fd_callback cb = it->second;
        cb(pfd.revents);
        did_work = true;
    }

    return did_work;
}

bool event_loop::run_until(const std::function<bool()>& done, int timeout_ms) {
    stopped_ = false;
    const auto deadline = timeout_ms < 0
        ? clock::time_point::max()
        : clock::now() + std::chrono::milliseconds(timeout_ms);

    while (!done()) {
        if (stopped_) {
            break;
        }
        if (!has_pending_work() && timers_.empty()) {
            // Nothing left that could ever make done() true
            break;
        }
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (left <= 0) {
                break;
            }
            wait_ms = static_cast<int>(left);
        }
        run_once(wait_ms);
    }
    return done();
}

void event_loop::run() {
    stopped_ = false;
    while (!stopped_ && has_pending_work()) {
        run_once();
    }
}

} // namespace crew
