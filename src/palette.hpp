#pragma once

#include <string>

namespace mcp_tap {

// ANSI escape sequences, or empty strings when color is off
struct Palette {
    std::string reset;
    std::string bold;
    std::string dim;
    std::string red;
    std::string green;
    std::string yellow;
    std::string blue;
    std::string magenta;
    std::string cyan;
    std::string white;

    static Palette ansi();
    static Palette plain();
    static Palette make(bool enabled) { return enabled ? ansi() : plain(); }
};

// Color for a method family: initialize*, tools/, resources/, prompts/,
// notifications/, white otherwise
const std::string& method_color(const std::string& method, const Palette& colors);

} // namespace mcp_tap
