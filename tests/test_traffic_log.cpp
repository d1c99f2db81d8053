#include <catch2/catch_test_macros.hpp>
#include "server_log.hpp"
#include "traffic_log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace mcp_tap;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("TrafficLog", "[traffic]") {
    fs::path path = fs::temp_directory_path() / "mcp_tap_traffic.log";
    fs::remove(path);

    SECTION("Plain records go to the file, styled ones to the echo") {
        std::ostringstream echo;
        {
            TrafficLog log(path.string(), &echo);
            log.write("\x1b[2mstyled\x1b[0m", "plain one");
            log.write("two", "plain two");
        }
        REQUIRE(read_file(path) == "plain one\nplain two\n");
        REQUIRE(echo.str() == "\x1b[2mstyled\x1b[0m\ntwo\n");
    }

    SECTION("Existing content is kept") {
        std::ofstream(path) << "earlier\n";
        {
            TrafficLog log(path.string());
            log.write("x", "later");
        }
        REQUIRE(read_file(path) == "earlier\nlater\n");
    }

    SECTION("Subscribers receive queued plain lines") {
        TrafficLog log(path.string());
        auto id = log.subscribe();
        std::vector<std::string> lines;

        log.write("styled", "first");
        log.write("styled", "second");
        REQUIRE(log.take(id, lines));
        REQUIRE(lines == std::vector<std::string>{"first\n", "second\n"});

        REQUIRE(log.take(id, lines));
        REQUIRE(lines.empty());

        log.unsubscribe(id);
        log.write("styled", "third");
        REQUIRE_FALSE(log.take(id, lines));
        REQUIRE(log.subscriber_count() == 0);
    }

    SECTION("A reader that falls behind is dropped without blocking writes") {
        TrafficLog log(path.string(), nullptr, 2);
        auto slow = log.subscribe();
        auto fast = log.subscribe();
        std::vector<std::string> lines;

        log.write("a", "a");
        log.write("b", "b");
        REQUIRE(log.take(fast, lines));
        log.write("c", "c");

        REQUIRE_FALSE(log.is_subscribed(slow));
        REQUIRE_FALSE(log.take(slow, lines));
        REQUIRE(log.take(fast, lines));
        REQUIRE(lines == std::vector<std::string>{"c\n"});
        REQUIRE(read_file(path) == "a\nb\nc\n");
    }

    SECTION("Announces the log path") {
        std::vector<std::string> messages;
        ServerLog::set_sink([&](const std::string& component, const std::string& message, bool) {
            messages.push_back(component + ": " + message);
        });
        { TrafficLog log(path.string()); }
        ServerLog::set_sink(nullptr);

        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0] == "mcp-tap: logging to " + path.string());
    }

    SECTION("Unwritable path throws") {
        REQUIRE_THROWS_AS(TrafficLog("/nonexistent/dir/x.log"), std::runtime_error);
    }

    fs::remove(path);
}
