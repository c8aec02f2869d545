#include <catch2/catch.hpp>

#include "common/constants.h"
#include "strategies/dispatcher-strategy.h"
#include "strategies/host-session.h"
#include "tools/host-tools.h"
#include "test-helpers.h"

#include <atomic>
#include <chrono>
#include <optional>

using namespace crew;
using testing::scripted_launcher;

namespace {

struct dispatcher_fixture {
    event_loop loop;
    profile_registry registry = testing::builtin_registry();
    scripted_launcher launcher{loop};
};

} // namespace

TEST_CASE_METHOD(dispatcher_fixture, "Second delegation to a running role is rejected as busy", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);

    std::optional<dispatch_outcome> first;
    std::optional<dispatch_outcome> second;
    dispatcher.delegate_async({"scout", "summarize X"}, [&](const dispatch_outcome& o) { first = o; });
    REQUIRE(launcher.launches.size() == 1);
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::RUNNING);

    dispatcher.delegate_async({"scout", "summarize Y"}, [&](const dispatch_outcome& o) { second = o; });

    // Rejected before returning; no second process for the role
    REQUIRE(second.has_value());
    CHECK(second->is_busy());
    CHECK(second->role == "scout");
    CHECK(launcher.launches.size() == 1);
    CHECK_FALSE(first.has_value());

    launcher.last().emit(testing::text_record("summary "));
    launcher.last().emit(testing::text_record("of X"));
    launcher.last().emit(testing::end_record(0));
    launcher.last().exit_with(0);

    REQUIRE(first.has_value());
    CHECK(first->success());
    CHECK(first->text == "summary of X");
    CHECK(launcher.launches[0].task == "summarize X");
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::DONE);
    CHECK(dispatcher.tracker().get("scout")->accumulated_text == "summary of X");
}

TEST_CASE_METHOD(dispatcher_fixture, "Different roles run concurrently", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);

    int done = 0;
    auto count = [&](const dispatch_outcome& o) { done += o.success() ? 1 : 0; };
    dispatcher.delegate_async({"scout", "look"}, count);
    dispatcher.delegate_async({"builder", "build"}, count);

    CHECK(launcher.running().size() == 2);
    CHECK(dispatcher.is_running("scout"));
    CHECK(dispatcher.is_running("builder"));

    launcher.complete_all();
    CHECK(done == 2);
    CHECK_FALSE(dispatcher.tracker().any_running());
}

TEST_CASE_METHOD(dispatcher_fixture, "Unknown role lists the valid names", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);

    std::optional<dispatch_outcome> outcome;
    dispatcher.delegate_async({"wizard", "do magic"}, [&](const dispatch_outcome& o) { outcome = o; });

    REQUIRE(outcome.has_value());
    CHECK(outcome->is_not_found());
    CHECK(outcome->text.find("wizard") != std::string::npos);
    CHECK(outcome->text.find("builder, planner, reviewer, scout") != std::string::npos);
    CHECK(launcher.launches.empty());
    CHECK_FALSE(dispatcher.tracker().any_running());
}

TEST_CASE_METHOD(dispatcher_fixture, "Child failures become failure outcomes", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);
    std::optional<dispatch_outcome> outcome;
    dispatcher.delegate_async({"builder", "build it"}, [&](const dispatch_outcome& o) { outcome = o; });

    SECTION("non-zero exit") {
        launcher.last().emit(testing::text_record("partial work"));
        launcher.last().emit_stderr("compiler exploded\n");
        launcher.last().exit_with(2);

        REQUIRE(outcome.has_value());
        CHECK(outcome->status == outcome_status::CHILD_FAILURE);
        CHECK(outcome->is_failure());
        CHECK(outcome->text.find("exited with status 2") != std::string::npos);
        CHECK(outcome->text.find("compiler exploded") != std::string::npos);
        CHECK(outcome->text.find("partial work") != std::string::npos);
    }

    SECTION("end marker with a failing status") {
        launcher.last().emit(testing::end_record(1));
        launcher.last().exit_with(0);

        REQUIRE(outcome.has_value());
        CHECK(outcome->status == outcome_status::CHILD_FAILURE);
    }

    CHECK(dispatcher.tracker().get("builder")->status == unit_status::FAILED);

    // An errored role accepts new work
    std::optional<dispatch_outcome> retry;
    dispatcher.delegate_async({"builder", "try again"}, [&](const dispatch_outcome& o) { retry = o; });
    CHECK(dispatcher.is_running("builder"));
    launcher.last().complete("fixed");
    REQUIRE(retry.has_value());
    CHECK(retry->success());
}

TEST_CASE_METHOD(dispatcher_fixture, "Invalid UTF-8 on child stderr still reaches the parent as a failure", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);
    host_session host("default");
    dispatcher.on_session_start(host);

    loop.add_timer(1, [&]() {
        for (auto* handle : launcher.running()) {
            handle->emit_stderr("bad byte \xff here\n");
            handle->exit_with(3);
        }
    });

    SECTION("single form") {
        tool_result result = host.execute("delegate", json{{"role", "scout"}, {"task", "x"}});
        REQUIRE_FALSE(result.success);

        json parsed = json::parse(result.error);
        CHECK(parsed["status"] == "child_failure");
        CHECK(parsed["role"] == "scout");
        std::string error = parsed["error"];
        CHECK(error.find("exited with status 3") != std::string::npos);
        CHECK(error.find("bad byte \xEF\xBF\xBD here") != std::string::npos);
    }

    SECTION("parallel form") {
        json args;
        args["tasks"] = json::array({json{{"role", "scout"}, {"task", "x"}}});
        tool_result result = host.execute("delegate", args);
        REQUIRE_FALSE(result.success);

        json parsed = json::parse(result.error);
        REQUIRE(parsed.size() == 1);
        CHECK(parsed[0]["status"] == "child_failure");
    }
}

TEST_CASE_METHOD(dispatcher_fixture, "The stderr tail never starts inside a UTF-8 sequence", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);
    std::optional<dispatch_outcome> outcome;
    dispatcher.delegate_async({"builder", "build it"}, [&](const dispatch_outcome& o) { outcome = o; });

    // Two-byte characters, one more than fits, then an ASCII byte: the
    // oldest bytes are dropped and the raw cut lands mid-character
    std::string noise;
    for (size_t i = 0; i < config::MAX_DIAGNOSTIC_BYTES / 2 + 1; i++) {
        noise += "\xC3\xA9";
    }
    noise += "x";
    launcher.last().emit_stderr(noise);
    launcher.last().exit_with(1);

    REQUIRE(outcome.has_value());
    const std::string prefix = "exited with status 1\n";
    REQUIRE(outcome->text.rfind(prefix, 0) == 0);
    const std::string tail = outcome->text.substr(prefix.size());
    REQUIRE_FALSE(tail.empty());
    CHECK(static_cast<unsigned char>(tail[0]) == 0xC3);
    CHECK(tail.size() == config::MAX_DIAGNOSTIC_BYTES - 1);
    CHECK(tail.back() == 'x');

    CHECK_NOTHROW(json::parse(outcome->to_tool_result().error));
}

TEST_CASE_METHOD(dispatcher_fixture, "A child that cannot start is a launch failure", "[dispatcher]") {
    launcher.unstartable_roles.insert("scout");
    dispatcher_strategy dispatcher(loop, registry, launcher);

    std::optional<dispatch_outcome> outcome;
    dispatcher.delegate_async({"scout", "look"}, [&](const dispatch_outcome& o) { outcome = o; });

    REQUIRE(outcome.has_value());
    CHECK(outcome->status == outcome_status::LAUNCH_FAILURE);
    CHECK(outcome->text.find("cannot start scout") != std::string::npos);
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::FAILED);
}

TEST_CASE_METHOD(dispatcher_fixture, "Cancelling a role kills its child", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);

    std::optional<dispatch_outcome> outcome;
    dispatcher.delegate_async({"scout", "look"}, [&](const dispatch_outcome& o) { outcome = o; });
    testing::scripted_handle& handle = launcher.last();

    CHECK_FALSE(dispatcher.cancel("builder"));
    REQUIRE(dispatcher.cancel("scout"));

    REQUIRE(outcome.has_value());
    CHECK(outcome->status == outcome_status::CANCELLED);
    CHECK(handle.terminations == 1);
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::FAILED);
    CHECK_FALSE(dispatcher.cancel("scout"));
}

TEST_CASE_METHOD(dispatcher_fixture, "A dispatch deadline yields a timed out outcome", "[dispatcher]") {
    strategy_config cfg;
    cfg.dispatch_timeout_ms = 10;
    dispatcher_strategy dispatcher(loop, registry, launcher, cfg);

    std::optional<dispatch_outcome> outcome;
    dispatcher.delegate_async({"reviewer", "review"}, [&](const dispatch_outcome& o) { outcome = o; });
    CHECK(launcher.launches[0].options.timeout_ms == 10);

    CHECK(loop.run_until([&]() { return outcome.has_value(); }, 5000));
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == outcome_status::TIMED_OUT);
    CHECK(dispatcher.tracker().get("reviewer")->status == unit_status::FAILED);
}

TEST_CASE_METHOD(dispatcher_fixture, "Launch options follow the session", "[dispatcher]") {
    strategy_config cfg;
    cfg.persist_sessions = true;
    dispatcher_strategy dispatcher(loop, registry, launcher, cfg);

    host_session host("default prompt", "model-a");
    dispatcher.on_session_start(host);

    dispatcher.delegate_async({"planner", "plan"}, nullptr);
    REQUIRE(launcher.launches.size() == 1);
    CHECK(launcher.launches[0].options.model == "model-a");
    CHECK(launcher.launches[0].options.continuation_channel == "planner");
    launcher.complete_all();

    SECTION("configured model wins over the session's") {
        strategy_config fixed;
        fixed.model = "model-b";
        dispatcher_strategy other(loop, registry, launcher, fixed);
        other.on_session_start(host);
        other.delegate_async({"planner", "plan"}, nullptr);
        CHECK(launcher.launches.back().options.model == "model-b");
        CHECK(launcher.launches.back().options.continuation_channel.empty());
        launcher.complete_all();
    }
}

TEST_CASE_METHOD(dispatcher_fixture, "Session start leaves the parent only the delegate capability", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);
    host_session host("You are a helpful coding assistant.");
    register_host_tools(host);
    REQUIRE(host.is_tool_active("read"));

    dispatcher.on_session_start(host);

    CHECK(host.active_tools() == std::vector<std::string>{"delegate"});
    CHECK_FALSE(host.is_tool_active("read"));
    CHECK_FALSE(host.execute("read", json{{"path", "README.md"}}).success);

    // Instructions are replaced, not augmented
    CHECK(host.system_prompt().find("helpful coding assistant") == std::string::npos);
    CHECK(host.system_prompt().find("dispatcher") != std::string::npos);
    CHECK(host.system_prompt().find("<name>scout</name>") != std::string::npos);

    SECTION("instructions are rebuilt from the current registry before each turn") {
        capability_profile extra;
        extra.name = "documenter";
        extra.description = "Writes documentation";
        extra.capability_set = {"read", "write"};
        REQUIRE(registry.register_profile(extra) == registry_status::OK);

        CHECK(host.system_prompt().find("documenter") == std::string::npos);
        dispatcher.before_turn(host);
        CHECK(host.system_prompt().find("<name>documenter</name>") != std::string::npos);

        // New roles become dispatchable without a new session
        dispatcher.delegate_async({"documenter", "document"}, nullptr);
        CHECK(dispatcher.is_running("documenter"));
        launcher.complete_all();
    }

    SECTION("units start idle for every role") {
        auto rows = dispatcher.status();
        REQUIRE(rows.size() == registry.size());
        for (const auto& row : rows) {
            CHECK(row.glyph == "○");
        }
    }
}

TEST_CASE_METHOD(dispatcher_fixture, "The delegate capability blocks until the child resolves", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);
    host_session host("default");
    dispatcher.on_session_start(host);

    // The child answers on a later loop turn
    loop.add_timer(1, [&]() { launcher.complete_all("answer from "); });

    SECTION("single form") {
        tool_result result = host.execute("delegate", json{{"role", "scout"}, {"task", "find it"}});
        CHECK(result.success);
        CHECK(result.output == "answer from scout");
    }

    SECTION("parallel form") {
        json args;
        args["tasks"] = json::array({
            json{{"role", "scout"}, {"task", "look"}},
            json{{"role", "reviewer"}, {"task", "review"}},
        });
        tool_result result = host.execute("delegate", args);
        REQUIRE(result.success);

        json parsed = json::parse(result.output);
        REQUIRE(parsed.size() == 2);
        CHECK(parsed[0]["role"] == "scout");
        CHECK(parsed[0]["result"] == "answer from scout");
        CHECK(parsed[1]["result"] == "answer from reviewer");
    }

    SECTION("duplicate roles in one parallel call") {
        json args;
        args["tasks"] = json::array({
            json{{"role", "scout"}, {"task", "one"}},
            json{{"role", "scout"}, {"task", "two"}},
        });
        tool_result result = host.execute("delegate", args);
        CHECK_FALSE(result.success);

        json parsed = json::parse(result.error);
        REQUIRE(parsed.size() == 2);
        CHECK(parsed[0]["status"] == "success");
        CHECK(parsed[1]["status"] == "role_busy");
        CHECK(launcher.launches.size() == 1);
    }

    SECTION("missing arguments") {
        CHECK_FALSE(host.execute("delegate", json{{"task", "x"}}).success);
        CHECK_FALSE(host.execute("delegate", json{{"role", "scout"}}).success);
        CHECK(launcher.launches.empty());
        loop.run_until([]() { return false; }, 20);
    }
}

TEST_CASE_METHOD(dispatcher_fixture, "Raising the interrupt flag cancels a blocking delegation", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);

    std::atomic<bool> interrupted{false};
    loop.add_timer(1, [&]() { interrupted.store(true); });

    dispatch_outcome outcome = dispatcher.delegate("builder", "long task", &interrupted);
    CHECK(outcome.status == outcome_status::CANCELLED);
    CHECK_FALSE(dispatcher.is_running("builder"));
}

TEST_CASE_METHOD(dispatcher_fixture, "Elapsed time ticks only while a role runs", "[dispatcher]") {
    strategy_config cfg;
    cfg.tick_interval_ms = 2;
    dispatcher_strategy dispatcher(loop, registry, launcher, cfg);

    int changes = 0;
    dispatcher.set_change_callback([&]() { changes++; });

    dispatcher.delegate_async({"scout", "look"}, nullptr);
    const int after_start = changes;
    CHECK(after_start >= 1);

    loop.run_until([]() { return false; }, 30);
    CHECK(changes > after_start);
    CHECK(dispatcher.tracker().get("scout")->elapsed_ms > 0);

    launcher.complete_all();

    // With nothing running there is no ticker left to keep the loop busy
    auto start = std::chrono::steady_clock::now();
    loop.run_until([]() { return false; }, 5000);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
}

TEST_CASE_METHOD(dispatcher_fixture, "Reset returns a finished role to idle", "[dispatcher]") {
    dispatcher_strategy dispatcher(loop, registry, launcher);
    dispatcher.delegate_async({"scout", "look"}, nullptr);
    CHECK_FALSE(dispatcher.reset("scout"));

    launcher.last().exit_with(1);
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::FAILED);
    CHECK(dispatcher.reset("scout"));
    CHECK(dispatcher.tracker().get("scout")->status == unit_status::IDLE);
}
