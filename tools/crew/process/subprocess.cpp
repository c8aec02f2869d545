#include "subprocess.h"
#include "../common/constants.h"
#include "../common/crew-common.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <spdlog/spdlog.h>

namespace crew {

void unique_fd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

namespace {

struct pipe_pair {
    unique_fd read_end;
    unique_fd write_end;
};

bool make_pipe(pipe_pair& out) {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) < 0) {
        return false;
    }
    out.read_end.reset(fds[0]);
    out.write_end.reset(fds[1]);
    return true;
}

bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

} // namespace

subprocess_handle::subprocess_handle(uint64_t id, event_loop& loop)
    : process_handle(id)
    , loop_(loop) {
}

subprocess_handle::~subprocess_handle() {
    if (reap_timer_ != 0) {
        loop_.cancel_timer(reap_timer_);
    }
    close_stream(stdout_fd_);
    close_stream(stderr_fd_);
    if (pid_ > 0 && !reaped_) {
        // Never leave a zombie or an orphaned agent behind
        if (::kill(-pid_, SIGKILL) != 0) {
            ::kill(pid_, SIGKILL);
        }
        int status = 0;
        ::waitpid(pid_, &status, 0);
    }
}

bool subprocess_handle::start(const std::vector<std::string>& argv, const std::string& working_dir) {
    if (argv.empty()) {
        fail_to_start(format_error("launch", "empty command line"));
        return false;
    }

    // Everything the child needs is prepared before fork()
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pipe_pair out_pipe, err_pipe, exec_status;
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_status)) {
        fail_to_start(format_error("launch", std::strerror(errno), "pipe"));
        return false;
    }

    const pid_t parent_pid = ::getpid();
    pid_ = ::fork();
    if (pid_ < 0) {
        pid_ = -1;
        fail_to_start(format_error("launch", std::strerror(errno), "fork"));
        return false;
    }

    if (pid_ == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
#ifdef __linux__
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (::getppid() != parent_pid) {
            ::_exit(1);
        }
#endif
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(exec_status.write_end.get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ::execvp(c_argv[0], c_argv.data());

        // exec failed: report errno through the close-on-exec pipe
        int err = errno;
        ssize_t ignored = ::write(exec_status.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent. setpgid on both sides closes the race with an early kill()
    (void)parent_pid;
    ::setpgid(pid_, pid_);
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_status.write_end.reset();

    // EOF here means exec succeeded (the pipe closed on exec)
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid_, &status, 0);
        reaped_ = true;
        spdlog::warn("failed to start {}: {}", argv[0], std::strerror(child_errno));
        fail_to_start(format_error("launch", std::strerror(child_errno), argv[0]));
        return false;
    }

    stdout_fd_ = std::move(out_pipe.read_end);
    stderr_fd_ = std::move(err_pipe.read_end);
    set_nonblocking(stdout_fd_.get());
    set_nonblocking(stderr_fd_.get());

    const int out_fd = stdout_fd_.get();
    const int err_fd = stderr_fd_.get();
    loop_.watch_fd(out_fd, [this, out_fd](short revents) { on_readable(out_fd, revents); });
    loop_.watch_fd(err_fd, [this, err_fd](short revents) { on_readable(err_fd, revents); });

    spdlog::debug("process #{} started: pid {} ({})", id(), pid_, argv[0]);
    return true;
}

bool subprocess_handle::drain(int fd) {
    std::array<char, config::READ_CHUNK_SIZE> buf{};
    while (true) {
        ssize_t len = ::read(fd, buf.data(), buf.size());
        if (len > 0) {
            std::string_view chunk(buf.data(), static_cast<size_t>(len));
            if (fd == stdout_fd_.get()) {
                on_stdout(chunk);
            } else {
                on_stderr(chunk);
            }
            continue;
        }
        if (len < 0 && errno == EINTR) {
            continue;
        }
        if (len < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        return false;  // EOF or hard error
    }
}

void subprocess_handle::close_stream(unique_fd& stream) {
    if (stream.valid()) {
        loop_.unwatch_fd(stream.get());
        stream.reset();
    }
}

void subprocess_handle::on_readable(int fd, short revents) {
    bool open = true;
    if (revents & (POLLIN | POLLHUP | POLLERR)) {
        open = drain(fd);
    }
    if (revents & POLLNVAL) {
        open = false;
    }
    if (open) {
        return;
    }

    close_stream(fd == stdout_fd_.get() ? stdout_fd_ : stderr_fd_);
    if (!stdout_fd_.valid() && !stderr_fd_.valid()) {
        try_reap();
    }
}

void subprocess_handle::try_reap() {
    if (reaped_) {
        return;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        finish(status);
        return;
    }
    if (r < 0 && errno != EINTR) {
        reaped_ = true;
        on_exit(-1, false);
        return;
    }
    // Pipes closed but the child is still around: poll until it exits
    if (reap_timer_ == 0) {
        reap_timer_ = loop_.add_timer(config::REAP_POLL_INTERVAL_MS, [this]() { try_reap(); }, true);
    }
}

void subprocess_handle::finish(int wait_status) {
    reaped_ = true;
    if (reap_timer_ != 0) {
        loop_.cancel_timer(reap_timer_);
        reap_timer_ = 0;
    }
    if (WIFSIGNALED(wait_status)) {
        on_exit(WTERMSIG(wait_status), true);
    } else {
        on_exit(WEXITSTATUS(wait_status), false);
    }
}

void subprocess_handle::terminate() {
    if (pid_ <= 0 || reaped_) {
        on_exit(-1, false);
        return;
    }

    if (::kill(-pid_, SIGKILL) != 0) {
        ::kill(pid_, SIGKILL);
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    // Pick up anything the child wrote before it died
    if (stdout_fd_.valid()) drain(stdout_fd_.get());
    if (stderr_fd_.valid()) drain(stderr_fd_.get());
    close_stream(stdout_fd_);
    close_stream(stderr_fd_);

    spdlog::info("process #{} (pid {}) killed", id(), pid_);
    finish(status);
}

} // namespace crew
