#pragma once

#include "formatter_context.hpp"
#include "line_buffer.hpp"
#include "process.hpp"
#include <asio.hpp>
#include <array>
#include <chrono>
#include <deque>
#include <string>
#include <vector>
#include <unistd.h>

namespace mcp_tap {

struct ProxyConfig {
    std::string command;
    std::vector<std::string> args;

    // Time between forwarding a termination signal and SIGKILL
    std::chrono::milliseconds kill_grace{3000};

    // Time allowed for output still buffered in the pipes after the child exits
    std::chrono::milliseconds drain_grace{1000};
};

// Relays the client's stdio to a child process line by line, logging every
// line through the formatter. All I/O is asynchronous on one io_context, so
// the formatter and its pending-request table are only used from one thread.
class Proxy {
public:
    // client_in/client_out are duplicated; the caller keeps its descriptors
    Proxy(asio::io_context& io, FormatterContext& ctx, ProxyConfig config,
          int client_in = STDIN_FILENO, int client_out = STDOUT_FILENO);

    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    // Spawns the child and runs until it exits or is killed. Returns the exit
    // code for the proxy: the child's code, 1 when it died from a signal or
    // could not be started.
    int run();

private:
    struct Channel {
        explicit Channel(asio::io_context& io) : stream(io) {}

        asio::posix::stream_descriptor stream;
        std::deque<std::string> queue;
        bool writing = false;
        bool close_when_drained = false;
    };

    using ReadBuffer = std::array<char, 65536>;

    void read_client();
    void read_child_stdout();
    void read_child_stderr();

    void on_client_line(const std::string& line);
    void on_server_line(const std::string& line);
    void on_stderr_line(const std::string& line);

    void enqueue(Channel& channel, std::string data);
    void write_next(Channel& channel);
    void close_when_drained(Channel& channel);
    void on_write_error(Channel& channel, const asio::error_code& ec);

    void wait_for_termination();
    void wait_for_child();
    void check_child();
    void shutdown(int signo);
    void finish(const ExitStatus& status);

    void lifecycle(const std::string& message);
    void lifecycle_error(const std::string& message);

    asio::io_context& io_;
    FormatterContext& ctx_;
    ProxyConfig config_;
    Process child_;

    asio::posix::stream_descriptor client_in_;
    Channel client_out_;
    Channel child_in_;
    asio::posix::stream_descriptor child_out_;
    asio::posix::stream_descriptor child_err_;

    asio::signal_set termination_signals_;
    asio::signal_set child_signals_;
    asio::steady_timer kill_timer_;
    asio::steady_timer drain_timer_;

    ReadBuffer client_buf_{};
    ReadBuffer stdout_buf_{};
    ReadBuffer stderr_buf_{};

    LineBuffer client_lines_;
    LineBuffer server_lines_;
    LineBuffer stderr_lines_;

    bool finished_ = false;
    bool draining_ = false;
    int exit_code_ = 0;
};

} // namespace mcp_tap
