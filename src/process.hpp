#pragma once

#include <optional>
#include <utility>
#include <string>
#include <vector>
#include <sys/types.h>

namespace mcp_tap {

// Owns a file descriptor, closes it on destruction
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    int get() const { return fd_; }
    int release();
    void reset(int fd = -1);
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

struct ExitStatus {
    int code = 0;     // exit code, valid when signal == 0
    int signal = 0;   // terminating signal, 0 for a normal exit

    bool signaled() const { return signal != 0; }
};

// Child process with piped stdin, stdout and stderr (POSIX)
class Process {
public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Starts executable (searched in PATH) with args. Throws
    // std::runtime_error when the pipes cannot be created, fork fails or the
    // executable cannot be run.
    void spawn(const std::string& executable, const std::vector<std::string>& args);

    // Pipe ends for the parent. The caller takes ownership.
    UniqueFd take_stdin() { return std::move(stdin_); }
    UniqueFd take_stdout() { return std::move(stdout_); }
    UniqueFd take_stderr() { return std::move(stderr_); }

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !status_; }

    // Non-blocking reap; the status once the child is gone
    std::optional<ExitStatus> try_wait();
    ExitStatus wait();

    // Returns false when the child is already gone
    bool signal(int signo);
    bool terminate();
    bool kill();

private:
    pid_t pid_ = -1;
    std::optional<ExitStatus> status_;
    UniqueFd stdin_;
    UniqueFd stdout_;
    UniqueFd stderr_;
};

// Name like "SIGTERM" for logging
std::string signal_name(int signo);

} // namespace mcp_tap
