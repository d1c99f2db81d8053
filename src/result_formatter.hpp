#pragma once

#include "formatter_context.hpp"
#include "json_tree.hpp"
#include <string>

namespace mcp_tap {

enum class ResultKind {
    ToolsList,
    ResourcesList,
    PromptsList,
    ToolCall,
    Initialize,
    Generic
};

ResultKind classify_result(const std::string& method);

// Emits the summary records for the result of `method`. A null pointer or a
// falsy result emits nothing. Results whose shape does not fit the method fall
// back to a truncated JSON dump.
void format_result(const std::string& method, const Json* result, FormatterContext& ctx);

} // namespace mcp_tap
