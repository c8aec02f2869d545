#include <catch2/catch.hpp>

#include "process/event-stream-decoder.h"
#include "test-helpers.h"

#include <string>
#include <vector>

using namespace crew;

namespace {

struct collector {
    std::vector<progress_event> events;

    progress_callback callback() {
        return [this](const progress_event& e) { events.push_back(e); };
    }
};

std::vector<progress_event> decode_in_chunks(const std::string& stream, const std::vector<size_t>& cuts) {
    collector c;
    event_stream_decoder decoder(c.callback());
    size_t start = 0;
    for (size_t cut : cuts) {
        decoder.feed(std::string_view(stream).substr(start, cut - start));
        start = cut;
    }
    decoder.feed(std::string_view(stream).substr(start));
    decoder.finish();
    return c.events;
}

} // namespace

TEST_CASE("Record split across two chunks yields two text events", "[decoder]") {
    collector c;
    event_stream_decoder decoder(c.callback());

    decoder.feed("{\"type\":\"text\",\"delta\":\"a\"}\n{\"type\":\"text\"");
    REQUIRE(c.events.size() == 1);
    decoder.feed(",\"delta\":\"b\"}\n");

    REQUIRE(c.events.size() == 2);
    CHECK(c.events[0] == progress_event{text_fragment{"a"}});
    CHECK(c.events[1] == progress_event{text_fragment{"b"}});
    CHECK(decoder.discarded_lines() == 0);
    CHECK(decoder.pending_bytes() == 0);
}

TEST_CASE("Event sequence does not depend on chunk boundaries", "[decoder]") {
    const std::string stream =
        testing::text_record("Looking at the code") +
        "warning: something on stdout that is not a record\n" +
        testing::tool_record("read") +
        testing::text_record("héllo wörld\nsecond line") +
        "{\"type\":\"mystery\"}\n" +
        testing::end_record(0);

    const auto whole = decode_in_chunks(stream, {});
    REQUIRE(whole.size() == 4);
    CHECK(whole[0] == progress_event{text_fragment{"Looking at the code"}});
    CHECK(whole[1] == progress_event{tool_start{"read"}});
    CHECK(whole[2] == progress_event{text_fragment{"héllo wörld\nsecond line"}});
    CHECK(whole[3] == progress_event{run_completed{0}});

    SECTION("every single split point") {
        for (size_t cut = 1; cut < stream.size(); cut++) {
            INFO("cut at " << cut);
            CHECK(decode_in_chunks(stream, {cut}) == whole);
        }
    }

    SECTION("one byte at a time") {
        std::vector<size_t> cuts;
        for (size_t i = 1; i < stream.size(); i++) {
            cuts.push_back(i);
        }
        CHECK(decode_in_chunks(stream, cuts) == whole);
    }

    SECTION("irregular chunk sizes") {
        CHECK(decode_in_chunks(stream, {3, 17, 18, 60, 61, 100}) == whole);
    }
}

TEST_CASE("Unparsable lines are discarded and counted", "[decoder]") {
    collector c;
    event_stream_decoder decoder(c.callback());

    decoder.feed("not json\n");
    decoder.feed("{\"type\":\"text\"}\n");              // missing delta
    decoder.feed("[1,2,3]\n");                          // not an object
    decoder.feed("{\"type\":\"unknown\",\"x\":1}\n");   // unknown type
    decoder.feed("\n   \n");                            // blank lines are not noise
    decoder.feed(testing::text_record("ok"));

    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0] == progress_event{text_fragment{"ok"}});
    CHECK(decoder.discarded_lines() == 4);
}

TEST_CASE("Remainder gets one last parse attempt at finish", "[decoder]") {
    collector c;
    event_stream_decoder decoder(c.callback());

    SECTION("complete record without trailing newline") {
        decoder.feed("{\"type\":\"end\",\"exit_status\":3}");
        CHECK(c.events.empty());
        decoder.finish();
        REQUIRE(c.events.size() == 1);
        CHECK(c.events[0] == progress_event{run_completed{3}});
    }

    SECTION("truncated record is dropped") {
        decoder.feed("{\"type\":\"text\",\"del");
        decoder.finish();
        CHECK(c.events.empty());
        CHECK(decoder.discarded_lines() == 1);
        CHECK(decoder.pending_bytes() == 0);
    }

    SECTION("feeding after finish is ignored") {
        decoder.finish();
        decoder.feed(testing::text_record("late"));
        CHECK(c.events.empty());
        CHECK(decoder.is_finished());
    }
}

TEST_CASE("CRLF line endings are tolerated", "[decoder]") {
    collector c;
    event_stream_decoder decoder(c.callback());

    decoder.feed("{\"type\":\"tool_start\",\"name\":\"grep\"}\r\n");
    decoder.feed("\r\n");

    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0] == progress_event{tool_start{"grep"}});
    CHECK(decoder.discarded_lines() == 0);
}

TEST_CASE("Native agent json records map onto progress events", "[decoder]") {
    auto text = event_stream_decoder::parse_line(
        R"({"type":"message_update","assistantMessageEvent":{"type":"text_delta","delta":"hi"}})");
    REQUIRE(text.has_value());
    CHECK(*text == progress_event{text_fragment{"hi"}});

    auto thinking = event_stream_decoder::parse_line(
        R"({"type":"message_update","assistantMessageEvent":{"type":"thinking_delta","delta":"hmm"}})");
    CHECK_FALSE(thinking.has_value());

    auto tool = event_stream_decoder::parse_line(R"({"type":"tool_execution_start","toolName":"bash"})");
    REQUIRE(tool.has_value());
    CHECK(*tool == progress_event{tool_start{"bash"}});

    auto end = event_stream_decoder::parse_line(R"({"type":"agent_end","messages":[]})");
    REQUIRE(end.has_value());
    CHECK(*end == progress_event{run_completed{0}});
}
