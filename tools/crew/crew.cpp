#include "commands/command-handler.h"
#include "common/config.h"
#include "common/constants.h"
#include "common/crew-common.h"
#include "common/logging.h"
#include "context/continuation-store.h"
#include "process/event-loop.h"
#include "process/process-launcher.h"
#include "profiles/embedded-profiles.h"
#include "profiles/profile-registry.h"
#include "strategies/dispatcher-strategy.h"
#include "strategies/host-session.h"
#include "strategies/pipeline-strategy.h"
#include "tools/host-tools.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <signal.h>
#include <unistd.h>

namespace fs = crew::fs;

static const char* HOST_SYSTEM_PROMPT =
    "You are a coding assistant working in the user's repository. "
    "Use your tools to inspect the code before answering.";

static std::atomic<bool> g_is_interrupted = false;

static void signal_handler(int) {
  if (g_is_interrupted.load()) {
    fprintf(stdout, "\n");
    fflush(stdout);
    std::exit(130);
  }
  g_is_interrupted.store(true);
}

static void print_prompt() {
  fmt::print("> ");
  fflush(stdout);
}

int main(int argc, char **argv) {
  crew::crew_config cfg;
  std::string error;

  if (!crew::parse_cli_args(argc, argv, cfg, error)) {
    fprintf(stderr, "%s\n", error.c_str());
    crew::print_usage(argv[0]);
    return 1;
  }
  if (cfg.show_help) {
    crew::print_usage(argv[0]);
    return 0;
  }

  // File values first, then flags again so they win
  std::string config_path = cfg.config_path.empty() ? crew::default_config_path(cfg) : cfg.config_path;
  std::error_code ec;
  if (!cfg.config_path.empty() || fs::exists(config_path, ec)) {
    if (!crew::load_config_file(config_path, cfg, error) ||
        !crew::apply_config_json(cfg.cli_overrides, cfg, error)) {
      fprintf(stderr, "%s\n", error.c_str());
      return 1;
    }
  }

  crew::init_logging(cfg.verbose ? "debug" : cfg.log_level, cfg.verbose);

  if (cfg.model.empty()) {
    if (const char *env = std::getenv("CREW_MODEL")) {
      cfg.model = env;
    }
  }

  // Built-ins first so config profiles cannot shadow them
  crew::profile_registry registry;
  crew::register_builtin_profiles(registry);
  for (const auto &profile : cfg.profiles) {
    auto status = registry.register_profile(profile);
    if (status != crew::registry_status::OK) {
      spdlog::warn("profile '{}' not registered: {}", profile.name, crew::registry_status_to_string(status));
    }
  }

  const std::string working_dir = fs::current_path(ec).string();

  crew::event_loop loop;
  crew::continuation_store store(cfg.data_dir);

  crew::launcher_config launch_cfg;
  launch_cfg.agent_binary = cfg.agent_binary;
  launch_cfg.default_model = cfg.model;
  launch_cfg.working_dir = working_dir;
  crew::subprocess_launcher launcher(loop, launch_cfg, cfg.persist_sessions ? &store : nullptr);

  crew::host_session host(HOST_SYSTEM_PROMPT, cfg.model);
  host.context().working_dir = working_dir;
  host.context().is_interrupted = &g_is_interrupted;
  crew::register_host_tools(host);

  crew::strategy_config strategy_cfg;
  strategy_cfg.model = cfg.model;
  strategy_cfg.dispatch_timeout_ms = cfg.dispatch_timeout_ms;
  strategy_cfg.tick_interval_ms = cfg.tick_interval_ms;
  strategy_cfg.persist_sessions = cfg.persist_sessions;
  strategy_cfg.preview_width = cfg.preview_width;

  std::unique_ptr<crew::dispatcher_strategy> dispatcher;
  std::unique_ptr<crew::pipeline_strategy> pipeline;
  if (cfg.mode == crew::strategy_mode::DISPATCHER) {
    dispatcher = std::make_unique<crew::dispatcher_strategy>(loop, registry, launcher, strategy_cfg);
    dispatcher->on_session_start(host);
  } else {
    auto steps = cfg.pipeline.empty() ? crew::embedded::default_pipeline() : cfg.pipeline;
    pipeline = std::make_unique<crew::pipeline_strategy>(loop, registry, launcher, steps, strategy_cfg);
    pipeline->on_session_start(host);
  }

  spdlog::debug("mode={} agent_binary={} model={} data_dir={} roles={}",
                crew::strategy_mode_to_string(cfg.mode), cfg.agent_binary,
                cfg.model.empty() ? crew::config::FALLBACK_MODEL : cfg.model, cfg.data_dir, registry.size());

  crew::command_dispatcher commands;
  crew::register_exit_commands(commands);
  crew::register_info_commands(commands);
  crew::register_orchestration_commands(commands);

  crew::command_context ctx{host, registry, store, dispatcher.get(), pipeline.get(), g_is_interrupted};

  struct sigaction sigint_action;
  sigint_action.sa_handler = signal_handler;
  sigemptyset(&sigint_action.sa_mask);
  sigint_action.sa_flags = 0;
  sigaction(SIGINT, &sigint_action, NULL);
  sigaction(SIGTERM, &sigint_action, NULL);

  auto cancel_everything = [&]() {
    if (dispatcher) {
      dispatcher->cancel_all();
    }
    if (pipeline) {
      pipeline->cancel();
    }
    launcher.kill_all();
  };

  // Returns false when the operator asked to exit
  auto run_line = [&](const std::string &line) -> bool {
    std::string input = crew::trim(line);
    if (input.empty()) {
      return true;
    }
    if (input[0] != '/') {
      if (!pipeline) {
        fmt::print("\nName a role: /delegate ROLE TASK (see /agents)\n");
        return true;
      }
      // Plain text is a pipeline task
      input = "/pipeline " + input;
    }

    auto result = commands.dispatch(input, ctx);
    if (result == crew::command_result::NOT_COMMAND) {
      fmt::print("\nUnknown command: {} (try /help)\n", input);
      ctx.last_failed = true;
    }
    return result != crew::command_result::EXIT;
  };

  // One-shot mode: run the command, wait for what it started, exit
  if (!cfg.prompt.empty()) {
    run_line(cfg.prompt);
    loop.run_until([&]() {
      if (ctx.in_flight > 0 && g_is_interrupted.load()) {
        cancel_everything();
        g_is_interrupted.store(false);
      }
      return ctx.in_flight == 0;
    });
    cancel_everything();
    return ctx.last_failed ? 1 : 0;
  }

  fmt::print("\ncrew ({} mode, {} roles). Type /help for commands.\n\n",
             crew::strategy_mode_to_string(cfg.mode), registry.size());

  bool quit = false;
  bool exit_armed = false;
  std::string input_buffer;

  std::function<void()> watch_stdin;
  watch_stdin = [&]() {
    loop.watch_fd(STDIN_FILENO, [&](short) {
      char buf[crew::config::READ_CHUNK_SIZE];
      ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n < 0) {
        if (errno != EINTR && errno != EAGAIN) {
          spdlog::error("stdin read failed: {}", std::strerror(errno));
          quit = true;
        }
        return;
      }
      if (n == 0) {
        quit = true;
        return;
      }
      input_buffer.append(buf, static_cast<size_t>(n));

      // Commands may drive the loop themselves; stdin stays unwatched meanwhile
      loop.unwatch_fd(STDIN_FILENO);
      size_t pos;
      while (!quit && (pos = input_buffer.find('\n')) != std::string::npos) {
        std::string line = input_buffer.substr(0, pos);
        input_buffer.erase(0, pos + 1);

        g_is_interrupted.store(false);
        exit_armed = false;
        if (!run_line(line)) {
          quit = true;
        } else {
          print_prompt();
        }
      }
      if (!quit) {
        watch_stdin();
      }
    });
  };

  watch_stdin();
  print_prompt();

  while (!quit) {
    loop.run_once();

    if (g_is_interrupted.load() && !exit_armed) {
      if (ctx.in_flight > 0 || launcher.running_count() > 0) {
        cancel_everything();
        g_is_interrupted.store(false);
        fmt::print("\nCancelled.\n");
      } else {
        // Flag stays raised: the next Ctrl+C exits from the handler
        exit_armed = true;
        fmt::print("\n(Press Ctrl+C again to exit)\n");
      }
      print_prompt();
    }
  }

  loop.unwatch_fd(STDIN_FILENO);
  cancel_everything();
  fmt::print("\n");
  return 0;
}
