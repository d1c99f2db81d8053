#pragma once

#include <string>

namespace mcp_tap {

// Prefix of child stderr passthrough records
inline const std::string kStderrPrefix = "[server stderr]";

// ANSI highlighting for one plain log record. The passes run in a fixed order
// on the progressively rewritten line; an indented "[-32601] ..." detail line
// is therefore dimmed rather than reddened. Returns line untouched when
// enabled is false.
std::string colorize(std::string line, bool enabled);

} // namespace mcp_tap
