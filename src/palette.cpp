#include "palette.hpp"

namespace mcp_tap {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

Palette Palette::ansi() {
    Palette p;
    p.reset = "\x1b[0m";
    p.bold = "\x1b[1m";
    p.dim = "\x1b[2m";
    p.red = "\x1b[31m";
    p.green = "\x1b[32m";
    p.yellow = "\x1b[33m";
    p.blue = "\x1b[34m";
    p.magenta = "\x1b[35m";
    p.cyan = "\x1b[36m";
    p.white = "\x1b[37m";
    return p;
}

Palette Palette::plain() {
    return Palette{};
}

const std::string& method_color(const std::string& method, const Palette& colors) {
    if (starts_with(method, "initialize")) return colors.magenta;
    if (starts_with(method, "tools/")) return colors.green;
    if (starts_with(method, "resources/")) return colors.cyan;
    if (starts_with(method, "prompts/")) return colors.yellow;
    if (starts_with(method, "notifications/")) return colors.blue;
    return colors.white;
}

} // namespace mcp_tap
