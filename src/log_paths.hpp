#pragma once

#include <string>

namespace mcp_tap {

// $HOME/.mcp-tap/logs, or ./.mcp-tap/logs without HOME
std::string default_log_dir();

// <dir>/<command basename without extension>-<pid>.log
std::string default_log_file(const std::string& dir, const std::string& command, long pid);

// Creates dir and its parents. Throws std::runtime_error on failure.
void ensure_dir(const std::string& dir);

} // namespace mcp_tap
