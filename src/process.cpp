// POSIX process spawning with piped stdio

#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp_tap {

namespace {

std::string errno_message(int err) {
    return std::strerror(err);
}

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Pipe make_pipe(const char* what) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create ") + what + " pipe: " +
                                 errno_message(errno));
    }
    return {UniqueFd(fds[0]), UniqueFd(fds[1])};
}

ExitStatus decode_status(int raw) {
    ExitStatus status;
    if (WIFEXITED(raw)) {
        status.code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status.signal = WTERMSIG(raw);
        status.code = 1;
    }
    return status;
}

} // namespace

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int UniqueFd::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

Process::~Process() {
    if (running()) {
        terminate();
        wait();
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args) {
    if (pid_ > 0) {
        throw std::runtime_error("Process already spawned");
    }

    Pipe in = make_pipe("stdin");
    Pipe out = make_pipe("stdout");
    Pipe err = make_pipe("stderr");

    // Close-on-exec: stays silent on a successful exec, carries errno otherwise
    Pipe exec_status = make_pipe("exec status");

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("Failed to fork: " + errno_message(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (::dup2(in.read.get(), STDIN_FILENO) < 0 ||
            ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.write.get(), STDERR_FILENO) < 0) {
            int e = errno;
            (void)!::write(exec_status.write.get(), &e, sizeof(e));
            ::_exit(127);
        }

        // The parent may ignore SIGPIPE; the child starts with defaults
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(executable.c_str(), argv.data());

        int e = errno;
        (void)!::write(exec_status.write.get(), &e, sizeof(e));
        ::_exit(127);
    }

    pid_ = pid;
    exec_status.write.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        wait();
        throw std::runtime_error(executable + ": " + errno_message(child_errno));
    }

    stdin_ = std::move(in.write);
    stdout_ = std::move(out.read);
    stderr_ = std::move(err.read);
}

std::optional<ExitStatus> Process::try_wait() {
    if (status_ || pid_ <= 0) return status_;

    int raw = 0;
    pid_t r = ::waitpid(pid_, &raw, WNOHANG);
    if (r == pid_) {
        status_ = decode_status(raw);
    } else if (r < 0 && errno == ECHILD) {
        status_ = ExitStatus{};
    }
    return status_;
}

ExitStatus Process::wait() {
    if (status_ || pid_ <= 0) return status_.value_or(ExitStatus{});

    int raw = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &raw, 0);
    } while (r < 0 && errno == EINTR);

    status_ = r == pid_ ? decode_status(raw) : ExitStatus{};
    return *status_;
}

bool Process::signal(int signo) {
    if (!running()) return false;
    return ::kill(pid_, signo) == 0;
}

bool Process::terminate() {
    return signal(SIGTERM);
}

bool Process::kill() {
    return signal(SIGKILL);
}

std::string signal_name(int signo) {
    switch (signo) {
        case SIGHUP: return "SIGHUP";
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGABRT: return "SIGABRT";
        case SIGKILL: return "SIGKILL";
        case SIGSEGV: return "SIGSEGV";
        case SIGPIPE: return "SIGPIPE";
        case SIGTERM: return "SIGTERM";
        default: return "signal " + std::to_string(signo);
    }
}

} // namespace mcp_tap
