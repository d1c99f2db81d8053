#pragma once

#include "log_sink.hpp"
#include "palette.hpp"
#include "pending_requests.hpp"
#include <string>
#include <utility>

namespace mcp_tap {

// State of one proxy session shared by the message and result formatters
struct FormatterContext {
    FormatterContext(LogSink& sink, Palette colors)
        : sink(sink), colors(std::move(colors)) {}

    void emit(const std::string& styled, const std::string& plain) {
        sink.write(styled, plain);
    }

    LogSink& sink;
    Palette colors;
    PendingRequests pending;
};

} // namespace mcp_tap
