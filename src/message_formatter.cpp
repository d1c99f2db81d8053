#include "message_formatter.hpp"
#include "result_formatter.hpp"
#include "text_utils.hpp"
#include <chrono>

namespace mcp_tap {

namespace {

struct Header {
    std::string styled;
    std::string plain;
};

// "<ts> <arrow> <ACTOR>" in both renderings
Header make_header(Direction direction, const Palette& c) {
    bool client = direction == Direction::Client;
    std::string who = client ? "→ CLIENT" : "← SERVER";
    const std::string& dir_color = client ? c.cyan : c.green;
    std::string ts = timestamp();

    return {c.dim + ts + c.reset + " " + dir_color + who + c.reset, ts + " " + who};
}

void emit_params(const Json& params, FormatterContext& ctx) {
    std::string text = truncate(dump_compact(params), 200);
    ctx.emit("    " + ctx.colors.dim + text + ctx.colors.reset, "    " + text);
}

void format_notification(const Header& h, const std::string& method, const Json& msg,
                         FormatterContext& ctx) {
    const auto& c = ctx.colors;
    ctx.emit(h.styled + "  " + c.blue + "notification" + c.reset + "  " +
                 method_color(method, c) + method + c.reset,
             h.plain + "  notification  " + method);

    const Json* params = find_member(msg, "params");
    if (params && has_content(*params)) {
        emit_params(*params, ctx);
    }
}

void format_request(const Header& h, const std::string& method, const Json& id,
                    const Json& msg, FormatterContext& ctx) {
    const auto& c = ctx.colors;
    const Json* params = find_member(msg, "params");
    bool tool_call = method == "tools/call";

    PendingRequest pending;
    pending.method = method;
    pending.started = std::chrono::steady_clock::now();
    if (tool_call && params) {
        std::string name = string_or(*params, "name", "");
        if (!name.empty()) pending.tool_name = name;
    }

    std::string extra_styled;
    std::string extra_plain;
    if (pending.tool_name) {
        extra_styled = "  " + c.bold + *pending.tool_name + c.reset;
        extra_plain = "  " + *pending.tool_name;
    }

    ctx.pending.add(id, pending);

    std::string id_text = "#" + id_to_string(id);
    ctx.emit(h.styled + "  " + c.white + "request" + c.reset + "  " +
                 method_color(method, c) + method + c.reset + extra_styled + "  " +
                 c.dim + id_text + c.reset,
             h.plain + "  request  " + method + extra_plain + "  " + id_text);

    const Json* arguments = params ? find_member(*params, "arguments") : nullptr;
    if (tool_call && arguments && is_truthy(*arguments)) {
        for (const auto& line : split_lines(dump_pretty(*arguments))) {
            ctx.emit("    " + c.dim + line + c.reset, "    " + line);
        }
    } else if (params && has_content(*params)) {
        emit_params(*params, ctx);
    }
}

MessageKind format_response(const Header& h, const Json& id, const Json& msg,
                            FormatterContext& ctx) {
    const auto& c = ctx.colors;
    auto pending = ctx.pending.find(id);

    std::string req_method = pending ? pending->method : "unknown";
    std::string elapsed;
    if (pending) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pending->started).count();
        elapsed = std::to_string(ms) + "ms";
    }

    const std::string& mc = method_color(req_method, c);
    std::string id_text = "#" + id_to_string(id);

    const Json* error = find_member(msg, "error");
    if (error && is_truthy(*error)) {
        ctx.emit(h.styled + "  " + c.red + c.bold + "ERROR" + c.reset + "  " + mc + "(" +
                     req_method + " " + id_text + ")" + c.reset + "  " + c.dim + elapsed + c.reset,
                 h.plain + "  ERROR  (" + req_method + " " + id_text + ")  " + elapsed);

        std::string code = "?";
        if (const Json* code_value = find_member(*error, "code")) {
            if (is_truthy(*code_value)) {
                code = code_value->is_string() ? code_value->get<std::string>()
                                               : dump_compact(*code_value);
            }
        }
        std::string detail = "[" + code + "] " + string_or(*error, "message", "Unknown error");
        ctx.emit("    " + c.red + detail + c.reset, "    " + detail);

        ctx.pending.remove(id);
        return MessageKind::ErrorResponse;
    }

    ctx.emit(h.styled + "  " + c.white + "response" + c.reset + "  " + mc + req_method +
                 c.reset + "  " + c.dim + id_text + "  " + elapsed + c.reset,
             h.plain + "  response  " + req_method + "  " + id_text + "  " + elapsed);

    format_result(req_method, find_member(msg, "result"), ctx);

    ctx.pending.remove(id);
    return MessageKind::Response;
}

} // namespace

std::string id_to_string(const Json& id) {
    if (id.is_string()) return id.get<std::string>();
    return dump_compact(id);
}

MessageKind format_message(const std::string& line, Direction direction, FormatterContext& ctx) {
    const auto& c = ctx.colors;
    Header h = make_header(direction, c);

    Json msg = parse_bounded(line);
    if (msg.is_discarded() || msg.is_null()) {
        std::string raw = truncate(trim(line), 200);
        ctx.emit(h.styled + "  " + c.yellow + "[raw]" + c.reset + " " + raw,
                 h.plain + "  [raw] " + raw);
        return MessageKind::Raw;
    }

    std::string method = string_or(msg, "method", "");
    const Json* id = find_member(msg, "id");

    if (!method.empty() && !id) {
        format_notification(h, method, msg, ctx);
        return MessageKind::Notification;
    }

    if (!method.empty() && id) {
        format_request(h, method, *id, msg, ctx);
        return MessageKind::Request;
    }

    if (id) {
        return format_response(h, *id, msg, ctx);
    }

    std::string raw = truncate(trim(line), 200);
    ctx.emit(h.styled + "  " + c.dim + raw + c.reset, h.plain + "  " + raw);
    return MessageKind::Unparsable;
}

} // namespace mcp_tap
