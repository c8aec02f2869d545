#include <catch2/catch.hpp>

#include "commands/command-handler.h"
#include "context/continuation-store.h"
#include "strategies/dispatcher-strategy.h"
#include "strategies/host-session.h"
#include "strategies/pipeline-strategy.h"
#include "tools/host-tools.h"
#include "test-helpers.h"

#include <algorithm>
#include <atomic>

using namespace crew;

namespace {

struct command_fixture {
    event_loop loop;
    profile_registry registry = testing::builtin_registry();
    testing::scripted_launcher launcher{loop};
    testing::temp_dir dir;
    continuation_store store{dir.path.string()};
    host_session host{"default prompt"};
    dispatcher_strategy dispatcher{loop, registry, launcher};
    command_dispatcher commands;
    std::atomic<bool> interrupted{false};
    command_context ctx{host, registry, store, &dispatcher, nullptr, interrupted};

    command_fixture() {
        register_host_tools(host);
        dispatcher.on_session_start(host);
        register_exit_commands(commands);
        register_info_commands(commands);
        register_orchestration_commands(commands);
    }

    ~command_fixture() {
        // Async outcomes refer to ctx
        dispatcher.cancel_all();
    }
};

} // namespace

TEST_CASE_METHOD(command_fixture, "Command routing", "[commands]") {
    CHECK(commands.dispatch("/exit", ctx) == command_result::EXIT);
    CHECK(commands.dispatch("/quit", ctx) == command_result::EXIT);
    CHECK(commands.dispatch("/status", ctx) == command_result::CONTINUE);
    CHECK(commands.dispatch("/nope", ctx) == command_result::NOT_COMMAND);
    CHECK(commands.dispatch("/exitnow", ctx) == command_result::NOT_COMMAND);

    auto names = commands.get_command_names();
    for (const char* expected : {"/agents", "/call", "/cancel", "/delegate", "/exit", "/help",
                                 "/pipeline", "/quit", "/reset", "/sessions", "/status", "/tools"}) {
        CHECK(std::find(names.begin(), names.end(), expected) != names.end());
    }
}

TEST_CASE_METHOD(command_fixture, "/delegate runs in the background", "[commands]") {
    REQUIRE(commands.dispatch("/delegate scout   find the config loader  ", ctx) == command_result::CONTINUE);
    REQUIRE(launcher.launches.size() == 1);
    CHECK(launcher.launches[0].role == "scout");
    CHECK(launcher.launches[0].task == "find the config loader");
    CHECK(ctx.in_flight == 1);
    CHECK(dispatcher.is_running("scout"));

    launcher.last().complete("it is in common/config.cpp");
    CHECK(ctx.in_flight == 0);
    CHECK_FALSE(ctx.last_failed);
}

TEST_CASE_METHOD(command_fixture, "/delegate failures resolve immediately", "[commands]") {
    commands.dispatch("/delegate ghost do things", ctx);
    CHECK(ctx.in_flight == 0);
    CHECK(ctx.last_failed);
    CHECK(launcher.launches.empty());

    ctx.last_failed = false;
    commands.dispatch("/delegate scout", ctx);
    CHECK(ctx.in_flight == 0);
    CHECK(launcher.launches.empty());
}

TEST_CASE_METHOD(command_fixture, "/cancel kills a running role", "[commands]") {
    commands.dispatch("/delegate builder add a flag", ctx);
    REQUIRE(ctx.in_flight == 1);
    testing::scripted_handle& handle = launcher.last();

    commands.dispatch("/cancel builder", ctx);
    CHECK(handle.terminations == 1);
    CHECK(ctx.in_flight == 0);
    CHECK(ctx.last_failed);
    CHECK(dispatcher.tracker().get("builder")->status == unit_status::FAILED);
}

TEST_CASE_METHOD(command_fixture, "/call goes through the active tool whitelist", "[commands]") {
    // The dispatcher left only delegate active
    commands.dispatch("/call ls", ctx);
    CHECK(ctx.last_failed);

    ctx.last_failed = false;
    commands.dispatch("/call delegate {not json", ctx);
    CHECK(launcher.launches.empty());

    // The blocking tool needs the child to finish while it drives the loop
    loop.add_timer(1, [this]() { launcher.complete_all("answer from "); }, true);
    commands.dispatch(R"(/call delegate {"role": "reviewer", "task": "review the diff"})", ctx);
    CHECK_FALSE(ctx.last_failed);
    REQUIRE(launcher.launches.size() == 1);
    CHECK(launcher.launches[0].role == "reviewer");
}

TEST_CASE_METHOD(command_fixture, "/reset forgets a role's continuation record", "[commands]") {
    commands.dispatch("/delegate scout look around", ctx);
    launcher.last().complete("done");
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::DONE);

    dir.write("sessions/scout.jsonl", "{}\n");
    REQUIRE(store.has_record("scout"));

    commands.dispatch("/reset scout", ctx);
    CHECK_FALSE(store.has_record("scout"));
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::IDLE);
}

TEST_CASE_METHOD(command_fixture, "Pipeline commands are refused in dispatcher mode", "[commands]") {
    commands.dispatch("/pipeline build it", ctx);
    CHECK(ctx.in_flight == 0);
    CHECK(launcher.launches.empty());
}
