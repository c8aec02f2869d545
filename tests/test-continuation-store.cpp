#include <catch2/catch.hpp>

#include "context/continuation-store.h"
#include "test-helpers.h"

#include <chrono>
#include <fstream>
#include <thread>

using namespace crew;

TEST_CASE("Channel names are made filesystem-safe", "[continuation]") {
    CHECK(continuation_store::sanitize_channel("scout") == "scout");
    CHECK(continuation_store::sanitize_channel("code-reviewer_2.v1") == "code-reviewer_2.v1");
    CHECK(continuation_store::sanitize_channel("../etc/passwd") == "_._etc_passwd");
    CHECK(continuation_store::sanitize_channel(".hidden") == "_hidden");
    CHECK(continuation_store::sanitize_channel("a b/c") == "a_b_c");
    CHECK(continuation_store::sanitize_channel("") == "_");
}

TEST_CASE("Records live under the sessions directory", "[continuation]") {
    testing::temp_dir dir;
    continuation_store store(dir.path.string());

    CHECK(fs::is_directory(dir.path / "sessions"));
    CHECK(store.record_path("scout") == (dir.path / "sessions" / "scout.jsonl").string());

    CHECK_FALSE(store.has_record("scout"));

    // An empty file is not a usable record
    std::ofstream(store.record_path("scout")).close();
    CHECK_FALSE(store.has_record("scout"));

    std::ofstream(store.record_path("scout")) << "{\"role\":\"user\"}\n";
    CHECK(store.has_record("scout"));
}

TEST_CASE("Index tracks dispatches per channel", "[continuation]") {
    testing::temp_dir dir;
    continuation_store store(dir.path.string());

    CHECK(store.list().empty());

    REQUIRE(store.touch("scout", "scout"));
    REQUIRE(store.touch("scout", "scout"));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE(store.touch("builder", "builder"));

    auto channels = store.list();
    REQUIRE(channels.size() == 2);

    // Most recently used first
    CHECK(channels[0].channel == "builder");
    CHECK(channels[0].dispatch_count == 1);
    CHECK(channels[1].channel == "scout");
    CHECK(channels[1].role == "scout");
    CHECK(channels[1].dispatch_count == 2);
    CHECK_FALSE(channels[1].created_at.empty());
    CHECK(channels[1].updated_at >= channels[1].created_at);
    CHECK_FALSE(channels[1].has_record);

    SECTION("index survives a new store instance") {
        continuation_store reopened(dir.path.string());
        CHECK(reopened.list().size() == 2);
    }

    SECTION("remove drops the record and the entry") {
        std::ofstream(store.record_path("scout")) << "{}\n";
        CHECK(store.list()[1].has_record);

        CHECK(store.remove("scout"));
        CHECK_FALSE(fs::exists(store.record_path("scout")));
        auto remaining = store.list();
        REQUIRE(remaining.size() == 1);
        CHECK(remaining[0].channel == "builder");

        CHECK_FALSE(store.remove("scout"));
    }
}

TEST_CASE("A corrupt index is treated as empty", "[continuation]") {
    testing::temp_dir dir;
    continuation_store store(dir.path.string());

    std::ofstream(dir.path / "sessions" / "index.json") << "{ not json";
    CHECK(store.list().empty());

    REQUIRE(store.touch("scout", "scout"));
    auto channels = store.list();
    REQUIRE(channels.size() == 1);
    CHECK(channels[0].dispatch_count == 1);
}
