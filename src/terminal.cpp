#include "terminal.hpp"
#include <ftxui/screen/terminal.hpp>
#include <unistd.h>

namespace mcp_tap {

bool supports_color(int fd) {
    if (!::isatty(fd)) return false;
    return ftxui::Terminal::ColorSupport() != ftxui::Terminal::Color::Palette1;
}

} // namespace mcp_tap
