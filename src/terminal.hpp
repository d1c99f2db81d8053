#pragma once

namespace mcp_tap {

// True when fd is a terminal that can show ANSI colors
bool supports_color(int fd);

} // namespace mcp_tap
