#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace mcp_tap {

// Diagnostics of the tools themselves (not protocol traffic). Printed as
// "[component] message"; stdout is never used because the proxy's stdout
// carries the protocol.
class ServerLog {
public:
    using Sink = std::function<void(const std::string& component,
                                     const std::string& message,
                                     bool is_error)>;

    static void set_sink(Sink sink);
    static void log(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Default sink: everything to stderr
    static void stderr_sink(const std::string& component,
                            const std::string& message, bool is_error);

private:
    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace mcp_tap
