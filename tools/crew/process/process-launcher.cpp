#include "process-launcher.h"
#include "subprocess.h"
#include "../common/constants.h"
#include "../context/continuation-store.h"

#include <optional>

#include <spdlog/spdlog.h>

namespace crew {

// process_launcher

process_launcher::process_launcher(event_loop& loop)
    : loop_(loop) {
}

process_launcher::~process_launcher() {
    for (const auto& [id, timer] : deadlines_) {
        loop_.cancel_timer(timer);
    }
    deadlines_.clear();
    kill_all();
}

process_handle& process_launcher::launch(const capability_profile& profile,
                                         const std::string& task,
                                         const launch_options& options) {
    const uint64_t id = next_id_++;
    spdlog::info("launching '{}' as process #{}", profile.name, id);

    std::unique_ptr<process_handle> handle = start_process(id, profile, task, options);
    process_handle& ref = *handle;
    handles_.emplace(id, std::move(handle));

    if (options.timeout_ms > 0 && ref.is_running()) {
        deadlines_[id] = loop_.add_timer(options.timeout_ms, [this, id]() {
            deadlines_.erase(id);
            auto it = handles_.find(id);
            if (it != handles_.end() && it->second->is_running()) {
                spdlog::warn("process #{} exceeded its deadline", id);
                it->second->expire();
            }
        });
    }

    // Registered first, so it runs before any caller continuation;
    // destruction itself is deferred to the next loop turn.
    ref.completion().then([this, id](const launch_result&) { retire(id); });
    return ref;
}

size_t process_launcher::running_count() const {
    size_t count = 0;
    for (const auto& [id, handle] : handles_) {
        if (handle->is_running()) {
            count++;
        }
    }
    return count;
}

void process_launcher::kill_all() {
    // kill() resolves synchronously and may re-enter retire()
    std::vector<process_handle*> running;
    for (const auto& [id, handle] : handles_) {
        if (handle->is_running()) {
            running.push_back(handle.get());
        }
    }
    for (auto* handle : running) {
        handle->kill();
    }
}

void process_launcher::retire(uint64_t id) {
    auto deadline = deadlines_.find(id);
    if (deadline != deadlines_.end()) {
        loop_.cancel_timer(deadline->second);
        deadlines_.erase(deadline);
    }
    std::weak_ptr<int> alive = lifetime_;
    loop_.post([this, id, alive]() {
        if (!alive.expired()) {
            handles_.erase(id);
        }
    });
}

launch_result await_completion(event_loop& loop,
                               process_handle& handle,
                               const std::atomic<bool>* interrupted) {
    std::optional<launch_result> result;
    handle.completion().then([&result](const launch_result& r) { result = r; });

    loop.run_until([&]() {
        if (!result && interrupted != nullptr && interrupted->load()) {
            handle.kill();
        }
        return result.has_value();
    });

    if (!result) {
        // The loop ran dry without the handle resolving
        handle.kill();
    }
    return *result;
}

// subprocess_launcher

subprocess_launcher::subprocess_launcher(event_loop& loop,
                                         launcher_config config,
                                         continuation_store* store)
    : process_launcher(loop)
    , config_(std::move(config))
    , store_(store) {
    if (config_.agent_binary.empty()) {
        config_.agent_binary = config::DEFAULT_AGENT_BINARY;
    }
}

std::vector<std::string> subprocess_launcher::build_command(const capability_profile& profile,
                                                            const std::string& task,
                                                            const launch_options& options) const {
    std::vector<std::string> argv;
    argv.push_back(config_.agent_binary);
    argv.insert(argv.end(), {"--mode", "json", "-p"});

    if (config_.suppress_extensions) {
        argv.push_back("--no-extensions");
    }

    std::string model = options.model;
    if (model.empty()) model = config_.default_model;
    if (model.empty()) model = config::FALLBACK_MODEL;
    argv.insert(argv.end(), {"--model", model});

    if (profile.capability_set.empty()) {
        argv.push_back("--no-tools");
    } else {
        argv.insert(argv.end(), {"--tools", join(profile.capability_set, ",")});
    }

    if (!profile.instructions.empty()) {
        argv.push_back(profile.full_identity_replace ? "--system-prompt" : "--append-system-prompt");
        argv.push_back(profile.instructions);
    }

    if (!options.continuation_channel.empty() && store_ != nullptr) {
        argv.insert(argv.end(), {"--session", store_->record_path(options.continuation_channel)});
        if (store_->has_record(options.continuation_channel)) {
            argv.push_back("--continue");
        }
    } else {
        argv.push_back("--no-session");
    }

    argv.insert(argv.end(), config_.extra_args.begin(), config_.extra_args.end());
    if (!task.empty() && task[0] == '-') {
        // End of options, so the child does not read the task as a flag
        argv.push_back("--");
    }
    argv.push_back(task);
    return argv;
}

std::unique_ptr<process_handle> subprocess_launcher::start_process(uint64_t id,
                                                                   const capability_profile& profile,
                                                                   const std::string& task,
                                                                   const launch_options& options) {
    if (!options.continuation_channel.empty() && store_ == nullptr) {
        spdlog::warn("continuation requested for '{}' but no store is configured", profile.name);
    }

    auto argv = build_command(profile, task, options);

    if (!options.continuation_channel.empty() && store_ != nullptr) {
        store_->touch(options.continuation_channel, profile.name);
    }

    auto handle = std::make_unique<subprocess_handle>(id, loop_);
    handle->start(argv, config_.working_dir);
    return handle;
}

} // namespace crew
