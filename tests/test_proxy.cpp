#include <catch2/catch_test_macros.hpp>
#include "proxy.hpp"
#include "recording_sink.hpp"
#include <fcntl.h>
#include <unistd.h>

using namespace mcp_tap;

namespace {

struct PipePair {
    UniqueFd read;
    UniqueFd write;
};

PipePair make_pipe() {
    int fds[2];
    REQUIRE(::pipe2(fds, O_CLOEXEC) == 0);
    return {UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::string read_all(int fd) {
    std::string out;
    char buf[512];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// Runs a proxy session with `input` already queued on the client side.
// Returns the exit code; `output` receives what the client would read.
int run_session(const std::string& command, const std::vector<std::string>& args,
                const std::string& input, RecordingSink& sink, std::string& output) {
    PipePair client_in = make_pipe();
    PipePair client_out = make_pipe();

    if (!input.empty()) {
        REQUIRE(::write(client_in.write.get(), input.data(), input.size()) ==
                static_cast<ssize_t>(input.size()));
    }
    client_in.write.reset();

    int code = 0;
    {
        asio::io_context io;
        FormatterContext ctx(sink, Palette::plain());
        ProxyConfig config{command, args};
        config.kill_grace = std::chrono::milliseconds(500);

        Proxy proxy(io, ctx, config, client_in.read.get(), client_out.write.get());
        code = proxy.run();
    }

    client_out.write.reset();
    output = read_all(client_out.read.get());
    return code;
}

} // namespace

TEST_CASE("Proxy relays traffic through an echo server", "[proxy]") {
    RecordingSink sink;
    std::string output;

    std::string request = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    std::string response = R"({"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"echo"}]}})";

    // The unterminated last line is still delivered at end of input
    int code = run_session("cat", {}, request + "\n" + response, sink, output);

    REQUIRE(code == 0);
    REQUIRE(output == request + "\n" + response + "\n");

    REQUIRE(sink.contains("→ CLIENT  request  tools/list  #1"));
    REQUIRE(sink.contains("← SERVER  request  tools/list  #1"));
    REQUIRE(sink.contains("← SERVER  response  tools/list  #1"));
    REQUIRE(sink.contains("    (1 tools: echo)"));
    REQUIRE(sink.plain().back() == "[mcp-tap] server exited with code 0");
}

TEST_CASE("Proxy records server stderr and exit codes", "[proxy]") {
    RecordingSink sink;
    std::string output;

    int code = run_session("sh", {"-c", "echo booting >&2; echo '  ' >&2; exit 3"}, "", sink, output);

    REQUIRE(code == 3);
    REQUIRE(output.empty());
    REQUIRE(sink.contains("[server stderr] booting"));
    REQUIRE(sink.size() == 2);
    REQUIRE(sink.plain().back() == "[mcp-tap] server exited with code 3");
}

TEST_CASE("Proxy reports a server killed by a signal", "[proxy]") {
    RecordingSink sink;
    std::string output;

    int code = run_session("sh", {"-c", "kill -TERM $$"}, "", sink, output);

    REQUIRE(code == 1);
    REQUIRE(sink.plain().back() == "[mcp-tap] server exited with signal SIGTERM");
}

TEST_CASE("Proxy reports a server that cannot start", "[proxy]") {
    RecordingSink sink;
    std::string output;

    int code = run_session("mcp-tap-no-such-server", {}, "", sink, output);

    REQUIRE(code == 1);
    REQUIRE(sink.size() == 1);
    REQUIRE(sink.plain()[0].rfind("[mcp-tap] failed to start server: mcp-tap-no-such-server", 0) == 0);
}

TEST_CASE("Proxy passes raw lines through untouched", "[proxy]") {
    RecordingSink sink;
    std::string output;

    int code = run_session("cat", {}, "hello there\n\n", sink, output);

    REQUIRE(code == 0);
    REQUIRE(output == "hello there\n");
    REQUIRE(sink.contains("→ CLIENT  [raw] hello there"));
    REQUIRE(sink.contains("← SERVER  [raw] hello there"));
}
