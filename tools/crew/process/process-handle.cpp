#include "process-handle.h"
#include "../common/constants.h"
#include "../common/crew-common.h"

#include <spdlog/spdlog.h>

namespace crew {

const char* launch_status_to_string(launch_status status) {
    switch (status) {
        case launch_status::COMPLETED:   return "completed";
        case launch_status::FAILED:      return "failed";
        case launch_status::SPAWN_ERROR: return "spawn_error";
        case launch_status::CANCELLED:   return "cancelled";
        case launch_status::TIMED_OUT:   return "timed_out";
        default:                         return "unknown";
    }
}

process_handle::process_handle(uint64_t id)
    : id_(id)
    , started_at_(clock::now())
    , decoder_([this](const progress_event& event) { dispatch_event(event); }) {
}

void process_handle::subscribe(progress_callback cb) {
    subscribers_.push_back(std::move(cb));
}

double process_handle::elapsed_ms() const {
    if (completion_.is_ready()) {
        return completion_.value().elapsed_ms;
    }
    return std::chrono::duration<double, std::milli>(clock::now() - started_at_).count();
}

void process_handle::kill() {
    if (!is_running()) {
        return;
    }
    stop_reason_ = stop_reason::CANCELLED;
    terminate();
}

void process_handle::expire() {
    if (!is_running()) {
        return;
    }
    stop_reason_ = stop_reason::TIMED_OUT;
    terminate();
}

void process_handle::dispatch_event(const progress_event& event) {
    spdlog::trace("process #{}: {}", id_, describe_event(event));
    if (const auto* text = std::get_if<text_fragment>(&event)) {
        output_ += text->text;
    } else if (const auto* done = std::get_if<run_completed>(&event)) {
        stream_exit_status_ = done->exit_status;
    }
    for (const auto& cb : subscribers_) {
        cb(event);
    }
}

void process_handle::on_stdout(std::string_view chunk) {
    decoder_.feed(chunk);
}

void process_handle::on_stderr(std::string_view chunk) {
    stderr_tail_.append(chunk.data(), chunk.size());
    if (stderr_tail_.size() > config::MAX_DIAGNOSTIC_BYTES) {
        size_t cut = stderr_tail_.size() - config::MAX_DIAGNOSTIC_BYTES;
        // Never start the tail inside a UTF-8 sequence
        while (cut < stderr_tail_.size() && (static_cast<unsigned char>(stderr_tail_[cut]) & 0xC0) == 0x80) {
            cut++;
        }
        stderr_tail_.erase(0, cut);
    }
}

void process_handle::on_exit(int exit_code, bool signaled) {
    if (completion_.is_ready()) {
        return;
    }

    // Whatever is still buffered gets its last chance before the result is built
    decoder_.finish();

    launch_result result;
    result.exit_code = exit_code;
    result.output = output_;

    if (stop_reason_ == stop_reason::CANCELLED) {
        result.status = launch_status::CANCELLED;
        result.diagnostic = "cancelled by operator";
    } else if (stop_reason_ == stop_reason::TIMED_OUT) {
        result.status = launch_status::TIMED_OUT;
        result.diagnostic = "deadline exceeded";
    } else if (!signaled && exit_code == 0 && stream_exit_status_ == 0) {
        result.status = launch_status::COMPLETED;
        result.success = true;
    } else {
        result.status = launch_status::FAILED;
        if (signaled) {
            result.diagnostic = "terminated by signal " + std::to_string(exit_code);
        } else if (exit_code != 0) {
            result.diagnostic = "exited with status " + std::to_string(exit_code);
        } else {
            result.diagnostic = "run ended with status " + std::to_string(stream_exit_status_);
        }
    }

    std::string tail = trim(stderr_tail_);
    if (!result.success && !tail.empty()) {
        result.diagnostic += "\n" + tail;
    }

    resolve(std::move(result));
}

void process_handle::fail_to_start(const std::string& message) {
    if (completion_.is_ready()) {
        return;
    }
    decoder_.finish();

    launch_result result;
    result.status = launch_status::SPAWN_ERROR;
    result.diagnostic = message;
    resolve(std::move(result));
}

void process_handle::resolve(launch_result result) {
    result.elapsed_ms = std::chrono::duration<double, std::milli>(clock::now() - started_at_).count();
    spdlog::debug("process #{} {} after {:.0f}ms", id_, launch_status_to_string(result.status),
                  result.elapsed_ms);
    completion_.resolve(std::move(result));
}

} // namespace crew
