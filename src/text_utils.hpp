#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mcp_tap {

// Local wall-clock time as HH:MM:SS.mmm
std::string timestamp();

// Cut to at most max_chars UTF-8 characters, ending in "..." when shortened
std::string truncate(const std::string& str, std::size_t max_chars = 200);

// Number of UTF-8 code points in str
std::size_t utf8_length(const std::string& str);

std::string trim(const std::string& str);

// Split on '\n'; a trailing newline yields a final empty element
std::vector<std::string> split_lines(const std::string& text);

} // namespace mcp_tap
