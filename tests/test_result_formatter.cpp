#include <catch2/catch_test_macros.hpp>
#include "recording_sink.hpp"
#include "result_formatter.hpp"

using namespace mcp_tap;

namespace {

std::vector<std::string> summarize(const std::string& method, const std::string& result_json) {
    RecordingSink sink;
    FormatterContext ctx(sink, Palette::plain());
    Json result = Json::parse(result_json);
    format_result(method, &result, ctx);
    return sink.plain();
}

} // namespace

TEST_CASE("classify_result", "[result]") {
    REQUIRE(classify_result("tools/list") == ResultKind::ToolsList);
    REQUIRE(classify_result("resources/list") == ResultKind::ResourcesList);
    REQUIRE(classify_result("prompts/list") == ResultKind::PromptsList);
    REQUIRE(classify_result("tools/call") == ResultKind::ToolCall);
    REQUIRE(classify_result("initialize") == ResultKind::Initialize);
    REQUIRE(classify_result("unknown") == ResultKind::Generic);
}

TEST_CASE("List summaries", "[result]") {
    SECTION("Few tools are all named") {
        auto lines = summarize("tools/list", R"({"tools":[{"name":"echo"},{"name":"add"}]})");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0] == "    (2 tools: echo, add)");
    }

    SECTION("Many tools show six names and a count") {
        Json tools = Json::array();
        for (int i = 1; i <= 10; ++i) {
            tools.push_back({{"name", "t" + std::to_string(i)}});
        }
        auto lines = summarize("tools/list", Json{{"tools", tools}}.dump());
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0] == "    (10 tools: t1, t2, t3, t4, t5, t6, ... +4 more)");
    }

    SECTION("Resources fall back to their uri") {
        auto lines = summarize("resources/list",
                               R"({"resources":[{"uri":"file:///a"},{"name":"b","uri":"x"}]})");
        REQUIRE(lines[0] == "    (2 resources: file:///a, b)");
    }

    SECTION("Prompts") {
        auto lines = summarize("prompts/list", R"({"prompts":[{"name":"greet"}]})");
        REQUIRE(lines[0] == "    (1 prompts: greet)");
    }

    SECTION("Wrong shape falls back to the generic dump") {
        auto lines = summarize("tools/list", R"({"tools":"oops"})");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0] == R"(    {"tools":"oops"})");
    }
}

TEST_CASE("tools/call summaries", "[result]") {
    SECTION("Plain text block") {
        auto lines = summarize("tools/call", R"({"content":[{"type":"text","text":"hello\nworld"}]})");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0] == "    [text] hello");
        REQUIRE(lines[1] == "    [text] world");
    }

    SECTION("JSON text is pretty-printed") {
        auto lines = summarize("tools/call", R"({"content":[{"type":"text","text":"{\"a\":1}"}]})");
        REQUIRE(lines.size() == 4);
        REQUIRE(lines[0] == "    [text]");
        REQUIRE(lines[1] == "        {");
        REQUIRE(lines[2] == "          \"a\": 1");
        REQUIRE(lines[3] == "        }");
    }

    SECTION("Image size in KB") {
        std::string data(4096, 'A');
        auto lines = summarize("tools/call",
            R"({"content":[{"type":"image","mimeType":"image/png","data":")" + data + R"("}]})");
        REQUIRE(lines[0] == "    [image image/png] 3KB");
    }

    SECTION("Image without data") {
        auto lines = summarize("tools/call", R"({"content":[{"type":"image"}]})");
        REQUIRE(lines[0] == "    [image ?] ?");
    }

    SECTION("Resource block") {
        auto lines = summarize("tools/call",
            R"({"content":[{"type":"resource","resource":{"uri":"file:///x.txt"}}]})");
        REQUIRE(lines[0] == "    [resource] file:///x.txt");
    }

    SECTION("Unknown block type") {
        auto lines = summarize("tools/call", R"({"content":[{"type":"audio","x":1}]})");
        REQUIRE(lines[0] == R"(    [audio] {"type":"audio","x":1})");
    }

    SECTION("Error flag") {
        auto lines = summarize("tools/call",
            R"({"content":[{"type":"text","text":"bad"}],"isError":true})");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[1] == "    (isError: true)");
    }
}

TEST_CASE("initialize summary", "[result]") {
    auto lines = summarize("initialize",
        R"({"serverInfo":{"name":"demo","version":"1.2.0"},"capabilities":{"tools":{},"logging":{}}})");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "    demo v1.2.0  capabilities: tools, logging");

    auto anonymous = summarize("initialize", R"({"capabilities":{"tools":{}}})");
    REQUIRE(anonymous[0] == "    ? v?  capabilities: tools");
}

TEST_CASE("Generic results", "[result]") {
    SECTION("Empty objects print nothing") {
        REQUIRE(summarize("ping", "{}").empty());
    }

    SECTION("Long results are cut at 300 characters") {
        Json big = {{"data", std::string(500, 'z')}};
        auto lines = summarize("custom/op", big.dump());
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].size() == 4 + 300);
    }

    SECTION("Null results print nothing") {
        RecordingSink sink;
        FormatterContext ctx(sink, Palette::plain());
        format_result("ping", nullptr, ctx);
        Json null_result;
        format_result("ping", &null_result, ctx);
        REQUIRE(sink.size() == 0);
    }
}
