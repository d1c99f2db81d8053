#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcp_tap {

constexpr const char* kVersion = "0.1.0";

// mcp-tap [options] <command> [args...]
struct ProxyOptions {
    std::optional<std::string> log_file;
    std::optional<uint16_t> http_port;
    std::string command;
    std::vector<std::string> command_args;
    bool show_help = false;
    bool show_version = false;

    // Command line as typed, for the HTTP stream banner
    std::string command_line() const;
};

// mcp-tap-watch [options]
struct WatchOptions {
    std::string dir;
    std::optional<std::string> file;
    bool no_color = false;
    bool show_help = false;
};

// Arguments exclude the program name. Throws std::invalid_argument on a bad
// port number or an unknown option.
ProxyOptions parse_proxy_args(const std::vector<std::string>& args);
WatchOptions parse_watch_args(const std::vector<std::string>& args);

std::string proxy_usage(const std::string& program);
std::string watch_usage(const std::string& program);

} // namespace mcp_tap
