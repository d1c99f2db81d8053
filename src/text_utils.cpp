#include "text_utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_tap {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte offset where the code point with index `chars` starts
std::size_t byte_offset_of(const std::string& str, std::size_t chars) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (is_continuation_byte(static_cast<unsigned char>(str[i]))) continue;
        if (seen == chars) return i;
        ++seen;
    }
    return str.size();
}

} // namespace

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

std::size_t utf8_length(const std::string& str) {
    std::size_t count = 0;
    for (unsigned char c : str) {
        if (!is_continuation_byte(c)) ++count;
    }
    return count;
}

std::string truncate(const std::string& str, std::size_t max_chars) {
    if (utf8_length(str) <= max_chars) return str;
    std::size_t keep = max_chars > 3 ? max_chars - 3 : 0;
    return str.substr(0, byte_offset_of(str, keep)) + "...";
}

std::string trim(const std::string& str) {
    const char* ws = " \t\r\n\f\v";
    auto first = str.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = str.find_last_not_of(ws);
    return str.substr(first, last - first + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace mcp_tap
