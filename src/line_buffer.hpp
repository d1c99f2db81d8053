#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace mcp_tap {

// Reassembles newline-delimited records from arbitrary chunks. Blank
// (whitespace-only) lines are skipped.
class LineBuffer {
public:
    using LineHandler = std::function<void(const std::string&)>;

    explicit LineBuffer(LineHandler on_line);

    void feed(const char* data, std::size_t size);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Hands over an unterminated remainder, e.g. at end of stream
    void flush();

    const std::string& pending() const { return buffer_; }

private:
    void deliver(const std::string& line);

    LineHandler on_line_;
    std::string buffer_;
};

} // namespace mcp_tap
