#include "server_log.hpp"
#include <iostream>
#include <utility>

namespace mcp_tap {

ServerLog::Sink ServerLog::sink_ = ServerLog::stderr_sink;
std::mutex ServerLog::mutex_;

void ServerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : stderr_sink;
}

void ServerLog::log(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, false);
    }
}

void ServerLog::error(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, true);
    }
}

void ServerLog::stderr_sink(const std::string& component,
                            const std::string& message, bool is_error) {
    std::cerr << "[" << component << "] " << (is_error ? "error: " : "") << message << std::endl;
}

} // namespace mcp_tap
