#include "line_buffer.hpp"
#include "text_utils.hpp"
#include <utility>

namespace mcp_tap {

LineBuffer::LineBuffer(LineHandler on_line)
    : on_line_(std::move(on_line))
{
}

void LineBuffer::feed(const char* data, std::size_t size) {
    buffer_.append(data, size);

    std::string::size_type start = 0;
    std::string::size_type nl;
    while ((nl = buffer_.find('\n', start)) != std::string::npos) {
        deliver(buffer_.substr(start, nl - start));
        start = nl + 1;
    }
    buffer_.erase(0, start);
}

void LineBuffer::flush() {
    std::string rest;
    rest.swap(buffer_);
    deliver(rest);
}

void LineBuffer::deliver(const std::string& line) {
    if (trim(line).empty()) return;
    on_line_(line);
}

} // namespace mcp_tap
