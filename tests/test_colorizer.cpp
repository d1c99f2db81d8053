#include <catch2/catch_test_macros.hpp>
#include "colorizer.hpp"

using namespace mcp_tap;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TEST_CASE("Colorizer disabled", "[colorizer]") {
    std::string line = "12:34:56.100 → CLIENT  request  tools/list  #1";
    REQUIRE(colorize(line, false) == line);
}

TEST_CASE("Colorizer tokens", "[colorizer]") {
    SECTION("Timestamps are dimmed") {
        REQUIRE(contains(colorize("12:34:56.100 x", true), "\x1b[2m12:34:56.100\x1b[0m"));
    }

    SECTION("Directions") {
        REQUIRE(contains(colorize("→ CLIENT", true), "\x1b[36m\x1b[1m→ CLIENT\x1b[0m"));
        REQUIRE(contains(colorize("← SERVER", true), "\x1b[32m\x1b[1m← SERVER\x1b[0m"));
    }

    SECTION("Message kinds") {
        REQUIRE(contains(colorize("x  ERROR  y", true), "\x1b[31m\x1b[1mERROR\x1b[0m"));
        REQUIRE(contains(colorize("x notification y", true), "\x1b[34mnotification\x1b[0m"));
        REQUIRE(contains(colorize("x request y", true), "\x1b[37mrequest\x1b[0m"));
        REQUIRE(contains(colorize("x response y", true), "\x1b[37mresponse\x1b[0m"));
    }

    SECTION("Method families") {
        REQUIRE(contains(colorize("initialize", true), "\x1b[35minitialize\x1b[0m"));
        REQUIRE(contains(colorize("tools/list", true), "\x1b[32mtools/list\x1b[0m"));
        REQUIRE(contains(colorize("resources/read", true), "\x1b[36mresources/read\x1b[0m"));
        REQUIRE(contains(colorize("prompts/get", true), "\x1b[33mprompts/get\x1b[0m"));
        REQUIRE(contains(colorize("notifications/initialized", true), "\x1b[34mnotifications/"));
    }

    SECTION("Ids and elapsed times are dimmed") {
        REQUIRE(contains(colorize("#1", true), "\x1b[2m#1\x1b[0m"));
        REQUIRE(contains(colorize("50ms", true), "\x1b[2m50ms\x1b[0m"));
    }
}

TEST_CASE("Colorizer whole-line rules", "[colorizer]") {
    SECTION("Indented detail lines are dimmed") {
        std::string out = colorize(R"(    {"key":"value"})", true);
        REQUIRE(starts_with(out, "\x1b[2m"));
        REQUIRE(ends_with(out, "\x1b[0m"));
    }

    SECTION("Server stderr lines are dimmed") {
        std::string out = colorize("[server stderr] Listening on stdio", true);
        REQUIRE(starts_with(out, "\x1b[2m"));
        REQUIRE(ends_with(out, "\x1b[0m"));
    }

    SECTION("Indentation wins over the error detail rule") {
        std::string out = colorize("    [-32601] Method not found", true);
        REQUIRE(starts_with(out, "\x1b[2m"));
    }

    SECTION("Shallow error details are red") {
        std::string out = colorize("  [-32601] Method not found", true);
        REQUIRE(starts_with(out, "\x1b[31m"));
    }
}

TEST_CASE("Colorizer full records", "[colorizer]") {
    SECTION("Notification") {
        std::string out = colorize("12:34:56.100 → CLIENT  notification  notifications/initialized", true);
        REQUIRE(contains(out, "\x1b[2m12:34:56.100\x1b[0m"));
        REQUIRE(contains(out, "\x1b[36m\x1b[1m→ CLIENT\x1b[0m"));
        REQUIRE(contains(out, "\x1b[34mnotification\x1b[0m"));
        REQUIRE(contains(out, "\x1b[34mnotifications/"));
    }

    SECTION("Request") {
        std::string out = colorize("12:34:56.200 → CLIENT  request  tools/list  #2", true);
        REQUIRE(contains(out, "\x1b[37mrequest\x1b[0m"));
        REQUIRE(contains(out, "\x1b[32mtools/list\x1b[0m"));
        REQUIRE(contains(out, "\x1b[2m#2\x1b[0m"));
    }

    SECTION("Response") {
        std::string out = colorize("12:34:56.250 ← SERVER  response  initialize  #1  50ms", true);
        REQUIRE(contains(out, "\x1b[32m\x1b[1m← SERVER\x1b[0m"));
        REQUIRE(contains(out, "\x1b[37mresponse\x1b[0m"));
        REQUIRE(contains(out, "\x1b[35minitialize\x1b[0m"));
        REQUIRE(contains(out, "\x1b[2m#1\x1b[0m"));
        REQUIRE(contains(out, "\x1b[2m50ms\x1b[0m"));
    }
}

TEST_CASE("Colorizer handles very long tokens", "[colorizer]") {
    SECTION("Long method-like token") {
        std::string line = "    [text] see tools/" + std::string(200000, 'a');
        std::string out = colorize(line, true);
        REQUIRE(starts_with(out, "\x1b[2m"));
        REQUIRE(contains(out, "\x1b[32mtools/aaaa"));
    }

    SECTION("Long digit run") {
        std::string line = "    [text] " + std::string(200000, '7') + "ms #" + std::string(1000, '1');
        std::string out = colorize(line, true);
        REQUIRE(contains(out, "\x1b[2m" + std::string(200000, '7') + "ms\x1b[0m"));
        REQUIRE(contains(out, "\x1b[2m#" + std::string(1000, '1') + "\x1b[0m"));
    }

    SECTION("Long whitespace before an error detail") {
        std::string line = "\t" + std::string(200000, ' ') + "[-1] x";
        REQUIRE(starts_with(colorize(line, true), "\x1b[31m"));
    }
}

TEST_CASE("Colorizer word boundaries", "[colorizer]") {
    REQUIRE(colorize("ERRORS requested", true) == "ERRORS requested");
    REQUIRE(colorize("mytools/list", true) == "mytools/list");
    REQUIRE(colorize("tools/ x", true) == "tools/ x");
    REQUIRE(colorize("a request and a request", true) ==
            "a \x1b[37mrequest\x1b[0m and a request");
}
