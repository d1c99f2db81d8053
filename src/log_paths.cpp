#include "log_paths.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mcp_tap {

std::string default_log_dir() {
    const char* home = std::getenv("HOME");
    fs::path base = (home && *home) ? fs::path(home) : fs::path(".");
    return (base / ".mcp-tap" / "logs").string();
}

std::string default_log_file(const std::string& dir, const std::string& command, long pid) {
    std::string name = fs::path(command).filename().string();
    auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name.erase(dot);
    }
    return (fs::path(dir) / (name + "-" + std::to_string(pid) + ".log")).string();
}

void ensure_dir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create " + dir + ": " + ec.message());
    }
}

} // namespace mcp_tap
