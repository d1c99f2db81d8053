#pragma once

#include "formatter_context.hpp"
#include <string>

namespace mcp_tap {

enum class Direction {
    Client,   // client -> server, read from our stdin
    Server    // server -> client, read from the child's stdout
};

enum class MessageKind {
    Notification,
    Request,
    Response,
    ErrorResponse,
    Unparsable,   // valid JSON that is none of the above
    Raw           // not JSON at all
};

// Classifies one JSON-RPC line, updates the pending-request table and emits
// its records through ctx. Never throws on bad input.
MessageKind format_message(const std::string& line, Direction direction, FormatterContext& ctx);

// "#<id>" rendering: strings unquoted, everything else as compact JSON
std::string id_to_string(const Json& id);

} // namespace mcp_tap
