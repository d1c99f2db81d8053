#include "proxy.hpp"
#include "colorizer.hpp"
#include "message_formatter.hpp"
#include "server_log.hpp"
#include <csignal>
#include <fcntl.h>
#include <stdexcept>
#include <utility>

namespace mcp_tap {

namespace {

// Private copy that the child does not inherit
int duplicate(int fd) {
    int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0) {
        throw std::runtime_error("Failed to duplicate descriptor " + std::to_string(fd));
    }
    return copy;
}

} // namespace

Proxy::Proxy(asio::io_context& io, FormatterContext& ctx, ProxyConfig config,
             int client_in, int client_out)
    : io_(io)
    , ctx_(ctx)
    , config_(std::move(config))
    , client_in_(io, duplicate(client_in))
    , client_out_(io)
    , child_in_(io)
    , child_out_(io)
    , child_err_(io)
    , termination_signals_(io, SIGINT, SIGTERM)
    , child_signals_(io, SIGCHLD)
    , kill_timer_(io)
    , drain_timer_(io)
    , client_lines_([this](const std::string& line) { on_client_line(line); })
    , server_lines_([this](const std::string& line) { on_server_line(line); })
    , stderr_lines_([this](const std::string& line) { on_stderr_line(line); })
{
    client_out_.stream.assign(duplicate(client_out));
}

int Proxy::run() {
    // Broken pipes are reported as write errors instead
    std::signal(SIGPIPE, SIG_IGN);

    try {
        child_.spawn(config_.command, config_.args);
    } catch (const std::exception& e) {
        lifecycle_error(std::string("failed to start server: ") + e.what());
        return 1;
    }

    child_in_.stream.assign(child_.take_stdin().release());
    child_out_.assign(child_.take_stdout().release());
    child_err_.assign(child_.take_stderr().release());

    wait_for_termination();
    wait_for_child();
    read_client();
    read_child_stdout();
    read_child_stderr();

    io_.run();
    return exit_code_;
}

void Proxy::read_client() {
    client_in_.async_read_some(asio::buffer(client_buf_),
        [this](const asio::error_code& ec, std::size_t n) {
            if (n > 0) {
                client_lines_.feed(client_buf_.data(), n);
            }
            if (ec) {
                // Client closed stdin: pass the EOF on once queued lines are out
                client_lines_.flush();
                client_in_.close();
                close_when_drained(child_in_);
                return;
            }
            read_client();
        });
}

void Proxy::read_child_stdout() {
    child_out_.async_read_some(asio::buffer(stdout_buf_),
        [this](const asio::error_code& ec, std::size_t n) {
            if (n > 0) {
                server_lines_.feed(stdout_buf_.data(), n);
            }
            if (ec) {
                server_lines_.flush();
                child_out_.close();
                check_child();
                return;
            }
            read_child_stdout();
        });
}

void Proxy::read_child_stderr() {
    child_err_.async_read_some(asio::buffer(stderr_buf_),
        [this](const asio::error_code& ec, std::size_t n) {
            if (n > 0) {
                stderr_lines_.feed(stderr_buf_.data(), n);
            }
            if (ec) {
                stderr_lines_.flush();
                child_err_.close();
                check_child();
                return;
            }
            read_child_stderr();
        });
}

void Proxy::on_client_line(const std::string& line) {
    format_message(line, Direction::Client, ctx_);
    enqueue(child_in_, line + "\n");
}

void Proxy::on_server_line(const std::string& line) {
    format_message(line, Direction::Server, ctx_);
    enqueue(client_out_, line + "\n");
}

void Proxy::on_stderr_line(const std::string& line) {
    const auto& c = ctx_.colors;
    ctx_.emit(c.dim + kStderrPrefix + c.reset + " " + line, kStderrPrefix + " " + line);
}

void Proxy::enqueue(Channel& channel, std::string data) {
    if (!channel.stream.is_open() || channel.close_when_drained) return;

    channel.queue.push_back(std::move(data));
    if (!channel.writing) {
        write_next(channel);
    }
}

void Proxy::write_next(Channel& channel) {
    if (channel.queue.empty()) {
        channel.writing = false;
        if (channel.close_when_drained && channel.stream.is_open()) {
            channel.stream.close();
        }
        return;
    }

    channel.writing = true;
    asio::async_write(channel.stream, asio::buffer(channel.queue.front()),
        [this, &channel](const asio::error_code& ec, std::size_t) {
            if (ec) {
                channel.queue.clear();
                channel.writing = false;
                on_write_error(channel, ec);
                return;
            }
            channel.queue.pop_front();
            write_next(channel);
        });
}

void Proxy::close_when_drained(Channel& channel) {
    channel.close_when_drained = true;
    if (!channel.writing && channel.stream.is_open()) {
        channel.stream.close();
    }
}

void Proxy::on_write_error(Channel& channel, const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted) return;

    if (channel.stream.is_open()) {
        channel.stream.close();
    }

    if (&channel == &client_out_) {
        if (ec == asio::error::broken_pipe) {
            lifecycle("client disconnected (EPIPE)");
        } else {
            ServerLog::error("Proxy", "Write to client failed: " + ec.message());
        }
        child_.terminate();
        return;
    }

    ServerLog::error("Proxy", "Write to server failed: " + ec.message());
}

void Proxy::wait_for_termination() {
    termination_signals_.async_wait([this](const asio::error_code& ec, int signo) {
        if (ec) return;
        shutdown(signo);
        wait_for_termination();
    });
}

void Proxy::wait_for_child() {
    child_signals_.async_wait([this](const asio::error_code& ec, int) {
        if (ec) return;
        check_child();
        if (!finished_) wait_for_child();
    });
}

void Proxy::check_child() {
    if (finished_) return;

    auto status = child_.try_wait();
    if (!status) return;

    if (!child_out_.is_open() && !child_err_.is_open()) {
        finish(*status);
        return;
    }

    // Exited with output still in flight, e.g. a grandchild holding the pipes
    if (!draining_) {
        draining_ = true;
        ExitStatus exited = *status;
        drain_timer_.expires_after(config_.drain_grace);
        drain_timer_.async_wait([this, exited](const asio::error_code& ec) {
            if (ec || finished_) return;
            finish(exited);
        });
    }
}

void Proxy::shutdown(int signo) {
    lifecycle("received " + signal_name(signo) + ", shutting down");
    child_.signal(signo);

    kill_timer_.expires_after(config_.kill_grace);
    kill_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || finished_) return;
        child_.kill();
        child_.wait();
        finished_ = true;
        exit_code_ = 1;
        io_.stop();
    });
}

void Proxy::finish(const ExitStatus& status) {
    finished_ = true;

    if (status.signaled()) {
        lifecycle("server exited with signal " + signal_name(status.signal));
        exit_code_ = 1;
    } else {
        lifecycle("server exited with code " + std::to_string(status.code));
        exit_code_ = status.code;
    }

    // Stop everything except the last writes to the client
    asio::error_code ignored;
    termination_signals_.cancel(ignored);
    child_signals_.cancel(ignored);
    kill_timer_.cancel();
    drain_timer_.cancel();
    client_in_.close(ignored);
    child_out_.close(ignored);
    child_err_.close(ignored);
    child_in_.queue.clear();
    child_in_.stream.close(ignored);
    close_when_drained(client_out_);
}

void Proxy::lifecycle(const std::string& message) {
    const auto& c = ctx_.colors;
    std::string text = "[mcp-tap] " + message;
    ctx_.emit(c.dim + text + c.reset, text);
}

void Proxy::lifecycle_error(const std::string& message) {
    const auto& c = ctx_.colors;
    std::string text = "[mcp-tap] " + message;
    ctx_.emit(c.red + text + c.reset, text);
}

} // namespace mcp_tap
