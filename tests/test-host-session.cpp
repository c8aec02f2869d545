#include <catch2/catch.hpp>

#include "strategies/host-session.h"
#include "tools/host-tools.h"
#include "test-helpers.h"

using namespace crew;

namespace {

tool_def echo_tool(const std::string& name) {
    tool_def tool;
    tool.name = name;
    tool.description = "Echo the text argument";
    tool.signature = name + "(text: string)";
    tool.parameters = R"json({"type":"object","properties":{"text":{"type":"string"}}})json";
    tool.execute = [](const json& args, const tool_context&) -> tool_result {
        return {true, args.value("text", ""), ""};
    };
    return tool;
}

} // namespace

TEST_CASE("Active tool whitelist", "[host]") {
    host_session host("You are a helpful assistant.", "host-model");
    host.add_tool(echo_tool("alpha"));
    host.add_tool(echo_tool("beta"));

    CHECK(host.model() == "host-model");
    CHECK(host.active_tools() == std::vector<std::string>{"alpha", "beta"});

    SECTION("inactive tools are refused") {
        host.set_active_tools({"beta", "missing"});
        CHECK(host.active_tools() == std::vector<std::string>{"beta"});
        CHECK_FALSE(host.is_tool_active("alpha"));

        tool_result refused = host.execute("alpha", json{{"text", "hi"}});
        CHECK_FALSE(refused.success);
        CHECK(refused.error == "Tool not available in this session: alpha");

        tool_result ok = host.execute("beta", json{{"text", "hi"}});
        CHECK(ok.success);
        CHECK(ok.output == "hi");
    }

    SECTION("unknown tools are reported as such") {
        tool_result r = host.execute("gamma", json::object());
        CHECK_FALSE(r.success);
        CHECK(r.error == "Unknown tool: gamma");
    }

    SECTION("activate_all restores everything registered") {
        host.set_active_tools({});
        CHECK(host.active_tools().empty());
        host.activate_all_tools();
        CHECK(host.active_tools().size() == 2);
    }
}

TEST_CASE("System prompt override keeps the default", "[host]") {
    host_session host("default prompt");
    CHECK(host.system_prompt() == "default prompt");

    host.set_system_prompt("replaced");
    CHECK(host.system_prompt() == "replaced");
    CHECK(host.default_system_prompt() == "default prompt");
}

TEST_CASE("read tool", "[host][tools]") {
    testing::temp_dir dir;
    dir.write("notes.txt", "first\nsecond\nthird\nfourth\n");

    host_session host("prompt");
    register_host_tools(host);
    host.context().working_dir = dir.path.string();

    SECTION("numbers every line") {
        tool_result r = host.execute("read", json{{"path", "notes.txt"}});
        REQUIRE(r.success);
        CHECK(r.output == "1\tfirst\n2\tsecond\n3\tthird\n4\tfourth\n");
    }

    SECTION("offset and limit") {
        tool_result r = host.execute("read", json{{"path", "notes.txt"}, {"offset", 2}, {"limit", 2}});
        REQUIRE(r.success);
        CHECK(r.output == "2\tsecond\n3\tthird\n... (truncated at 2 lines)\n");
    }

    SECTION("errors") {
        tool_result missing = host.execute("read", json{{"path", "absent.txt"}});
        CHECK_FALSE(missing.success);
        CHECK(missing.error.find("file not found") != std::string::npos);

        tool_result directory = host.execute("read", json{{"path", "."}});
        CHECK_FALSE(directory.success);
        CHECK(directory.error.find("path is a directory") != std::string::npos);

        tool_result no_path = host.execute("read", json::object());
        CHECK_FALSE(no_path.success);
        CHECK(no_path.error == "path is required");
    }
}

TEST_CASE("ls tool", "[host][tools]") {
    testing::temp_dir dir;
    dir.write("src/main.cpp", "int main() {}\n");
    dir.write("README.md", "# readme\n");
    fs::create_directories(dir.path / "empty");

    host_session host("prompt");
    register_host_tools(host);
    host.context().working_dir = dir.path.string();

    tool_result root = host.execute("ls", json::object());
    REQUIRE(root.success);
    CHECK(root.output == "README.md\nempty/\nsrc/\n");

    tool_result empty = host.execute("ls", json{{"path", "empty"}});
    REQUIRE(empty.success);
    CHECK(empty.output == "(empty directory)\n");

    tool_result bad = host.execute("ls", json{{"path", "README.md"}});
    CHECK_FALSE(bad.success);
    CHECK(bad.error.find("not a directory") != std::string::npos);
}
