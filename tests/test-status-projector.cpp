#include <catch2/catch.hpp>

#include "tracking/status-projector.h"
#include "tracking/unit-tracker.h"

#include <chrono>

using namespace crew;
using namespace std::chrono_literals;

TEST_CASE("List projection of tracked roles", "[projector]") {
    unit_tracker tracker;
    tracker.add_unit("scout", "scout");
    tracker.add_unit("builder", "builder");
    tracker.add_unit("reviewer", "reviewer");

    const auto t0 = unit_tracker::clock::now();
    tracker.begin("scout", t0);
    tracker.apply_event("scout", text_fragment{"Scanning src/"});
    tracker.tick(t0 + 2500ms);
    tracker.begin("builder", t0);
    tracker.finish("builder", false, t0 + 4s);

    auto rows = project_status(tracker.units(), projection_layout::LIST);
    REQUIRE(rows.size() == 3);

    CHECK(rows[0].label == "scout");
    CHECK(rows[0].glyph == "●");
    CHECK(rows[0].elapsed_seconds == 2);
    CHECK(rows[0].preview == "Scanning src/");

    CHECK(rows[1].glyph == "✗");
    CHECK(rows[1].elapsed_seconds == 4);

    CHECK(rows[2].glyph == "○");
    CHECK(rows[2].preview.empty());

    for (const auto& row : rows) {
        CHECK(row.connector.empty());
    }
}

TEST_CASE("Chain projection connects pipeline steps", "[projector]") {
    unit_tracker tracker;
    tracker.add_unit("step-0", "scout");
    tracker.add_unit("step-1", "planner");

    tracker.begin("step-0");
    tracker.finish("step-0", true);

    auto rows = project_status(tracker.units(), projection_layout::CHAIN);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].connector.empty());
    CHECK(rows[1].connector == "→");
    CHECK(rows[0].glyph == "✓");
    CHECK(rows[1].label == "planner");
}

TEST_CASE("Previews are truncated on a UTF-8 boundary", "[projector]") {
    unit_tracker tracker;
    tracker.add_unit("scout", "scout");
    tracker.begin("scout");
    tracker.apply_event("scout", text_fragment{"ééééééééééééé"});   // 26 bytes

    auto rows = project_status(tracker.units(), projection_layout::LIST, 10);
    REQUIRE(rows.size() == 1);
    // 7 bytes of content fit; the last whole character ends at byte 6
    CHECK(rows[0].preview == "ééé...");
}

TEST_CASE("Projection is idempotent without intervening mutation", "[projector]") {
    unit_tracker tracker;
    tracker.add_unit("scout", "scout");
    tracker.add_unit("builder", "builder");
    tracker.begin("scout");
    tracker.apply_event("scout", tool_start{"grep"});

    auto first = project_status(tracker.units(), projection_layout::LIST);
    auto second = project_status(tracker.units(), projection_layout::LIST);
    CHECK(first == second);

    auto chain_first = project_status(tracker.units(), projection_layout::CHAIN);
    auto chain_second = project_status(tracker.units(), projection_layout::CHAIN);
    CHECK(chain_first == chain_second);
}
