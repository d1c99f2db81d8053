#pragma once

#include <string>

namespace mcp_tap {

// Receives every formatted record in two renderings carrying the same text
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const std::string& styled, const std::string& plain) = 0;
};

} // namespace mcp_tap
