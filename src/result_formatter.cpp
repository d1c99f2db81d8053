#include "result_formatter.hpp"
#include "text_utils.hpp"
#include <cmath>
#include <vector>

namespace mcp_tap {

namespace {

const std::string kIndent = "    ";

std::string join(const std::vector<std::string>& items, std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count && i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

// All names up to 8, otherwise the first 6 and a "+N more" marker
std::string summarize_names(const std::vector<std::string>& names) {
    if (names.size() <= 8) return join(names, names.size());
    return join(names, 6) + ", ... +" + std::to_string(names.size() - 6) + " more";
}

bool summarize_list(const Json& result, const char* field, const char* kind,
                    const std::string& color, bool uri_fallback, FormatterContext& ctx) {
    const Json* items = find_member(result, field);
    if (!items || !items->is_array()) return false;

    std::vector<std::string> names;
    names.reserve(items->size());
    for (const auto& item : *items) {
        std::string name = string_or(item, "name", "");
        if (name.empty() && uri_fallback) name = string_or(item, "uri", "");
        names.push_back(name);
    }

    std::string text = "(" + std::to_string(items->size()) + " " + kind + ": " +
                       summarize_names(names) + ")";
    ctx.emit(kIndent + color + text + ctx.colors.reset, kIndent + text);
    return true;
}

void write_text_block(const Json& block, FormatterContext& ctx) {
    const auto& c = ctx.colors;
    std::string text = string_or(block, "text", "");

    if (auto formatted = try_format_json(text)) {
        ctx.emit(kIndent + c.dim + "[text]" + c.reset, kIndent + "[text]");
        for (const auto& line : split_lines(*formatted)) {
            ctx.emit(kIndent + c.dim + kIndent + line + c.reset, kIndent + kIndent + line);
        }
        return;
    }

    for (const auto& line : split_lines(text)) {
        ctx.emit(kIndent + c.dim + "[text]" + c.reset + " " + line, kIndent + "[text] " + line);
    }
}

void write_content_block(const Json& block, FormatterContext& ctx) {
    const auto& c = ctx.colors;
    std::string type = string_or(block, "type", "");

    if (type == "text") {
        write_text_block(block, ctx);
        return;
    }

    std::string label;
    std::string body;

    if (type == "image") {
        label = "[image " + string_or(block, "mimeType", "?") + "]";
        std::string data = string_or(block, "data", "");
        if (data.empty()) {
            body = "?";
        } else {
            double kb = static_cast<double>(data.size()) * 3 / 4 / 1024;
            body = std::to_string(std::lround(kb)) + "KB";
        }
    } else if (type == "resource") {
        label = "[resource]";
        const Json* resource = find_member(block, "resource");
        body = truncate(resource ? string_or(*resource, "uri", "?") : "?");
    } else {
        label = "[" + (type.empty() ? std::string("?") : type) + "]";
        body = truncate(dump_compact(block), 200);
    }

    ctx.emit(kIndent + c.dim + label + c.reset + " " + body, kIndent + label + " " + body);
}

bool summarize_tool_call(const Json& result, FormatterContext& ctx) {
    const Json* content = find_member(result, "content");
    if (!content || !content->is_array()) return false;

    for (const auto& block : *content) {
        write_content_block(block, ctx);
    }

    const Json* is_error = find_member(result, "isError");
    if (is_error && is_truthy(*is_error)) {
        ctx.emit(kIndent + ctx.colors.red + "(isError: true)" + ctx.colors.reset,
                 kIndent + "(isError: true)");
    }
    return true;
}

bool summarize_initialize(const Json& result, FormatterContext& ctx) {
    const Json* caps = find_member(result, "capabilities");
    if (!caps || !is_truthy(*caps)) return false;

    std::vector<std::string> keys;
    if (caps->is_object()) {
        for (auto it = caps->begin(); it != caps->end(); ++it) {
            keys.push_back(it.key());
        }
    }

    std::string name = "?";
    std::string version = "?";
    if (const Json* info = find_member(result, "serverInfo")) {
        name = string_or(*info, "name", "?");
        version = string_or(*info, "version", "?");
    }

    std::string server = name + " v" + version;
    std::string tail = "  capabilities: " + join(keys, keys.size());
    ctx.emit(kIndent + ctx.colors.magenta + server + ctx.colors.reset + tail,
             kIndent + server + tail);
    return true;
}

void summarize_generic(const Json& result, FormatterContext& ctx) {
    std::string raw = dump_compact(result);
    if (utf8_length(raw) <= 2) return;

    std::string display = truncate(raw, 300);
    ctx.emit(kIndent + ctx.colors.dim + display + ctx.colors.reset, kIndent + display);
}

} // namespace

ResultKind classify_result(const std::string& method) {
    if (method == "tools/list") return ResultKind::ToolsList;
    if (method == "resources/list") return ResultKind::ResourcesList;
    if (method == "prompts/list") return ResultKind::PromptsList;
    if (method == "tools/call") return ResultKind::ToolCall;
    if (method == "initialize") return ResultKind::Initialize;
    return ResultKind::Generic;
}

void format_result(const std::string& method, const Json* result, FormatterContext& ctx) {
    if (!result || !is_truthy(*result)) return;

    const auto& c = ctx.colors;
    bool handled = false;

    switch (classify_result(method)) {
        case ResultKind::ToolsList:
            handled = summarize_list(*result, "tools", "tools", c.green, false, ctx);
            break;
        case ResultKind::ResourcesList:
            handled = summarize_list(*result, "resources", "resources", c.cyan, true, ctx);
            break;
        case ResultKind::PromptsList:
            handled = summarize_list(*result, "prompts", "prompts", c.yellow, false, ctx);
            break;
        case ResultKind::ToolCall:
            handled = summarize_tool_call(*result, ctx);
            break;
        case ResultKind::Initialize:
            handled = summarize_initialize(*result, ctx);
            break;
        case ResultKind::Generic:
            break;
    }

    if (!handled) {
        summarize_generic(*result, ctx);
    }
}

} // namespace mcp_tap
