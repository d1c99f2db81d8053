#include "options.hpp"
#include "log_paths.hpp"
#include <sstream>
#include <stdexcept>

namespace mcp_tap {

namespace {

uint16_t parse_port(const std::string& text) {
    std::size_t used = 0;
    int port = 0;
    try {
        port = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    if (used != text.size() || port <= 0 || port > 65535) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    return static_cast<uint16_t>(port);
}

} // namespace

std::string ProxyOptions::command_line() const {
    std::string line = command;
    for (const auto& arg : command_args) {
        line += " " + arg;
    }
    return line;
}

ProxyOptions parse_proxy_args(const std::vector<std::string>& args) {
    ProxyOptions opts;

    for (std::size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if ((arg == "--log" || arg == "-l") && i + 1 < args.size()) {
            opts.log_file = args[++i];
        }
        else if ((arg == "--port" || arg == "-p") && i + 1 < args.size()) {
            opts.http_port = parse_port(args[++i]);
        }
        else if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            return opts;
        }
        else if (arg == "--version" || arg == "-v") {
            opts.show_version = true;
            return opts;
        }
        else {
            // First positional argument starts the server command line
            opts.command = arg;
            opts.command_args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        }
    }

    return opts;
}

WatchOptions parse_watch_args(const std::vector<std::string>& args) {
    WatchOptions opts;
    opts.dir = default_log_dir();

    for (std::size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--dir") {
            if (i + 1 < args.size()) opts.dir = args[++i];
        }
        else if (arg == "--file") {
            if (i + 1 < args.size()) opts.file = args[++i];
        }
        else if (arg == "--no-color") {
            opts.no_color = true;
        }
        else if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            return opts;
        }
        else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    return opts;
}

std::string proxy_usage(const std::string& program) {
    std::ostringstream out;
    out << "mcp-tap - transparent MCP stdio proxy with logging\n\n";
    out << "Usage: " << program << " [options] <command> [args...]\n\n";
    out << "Options:\n";
    out << "  --log, -l PATH    Write logs to a specific file\n";
    out << "                    (default: " << default_log_dir() << "/<command>-<pid>.log)\n";
    out << "  --port, -p PORT   Stream logs over HTTP on 127.0.0.1:PORT\n";
    out << "  --help, -h        Show this help message\n";
    out << "  --version, -v     Show version\n\n";
    out << "Examples:\n";
    out << "  " << program << " node ./my-server.js\n";
    out << "  " << program << " --log /tmp/tap.log python server.py\n";
    out << "  " << program << " --port 3456 npx ts-node ./server.ts\n";
    return out.str();
}

std::string watch_usage(const std::string& program) {
    std::ostringstream out;
    out << "mcp-tap-watch - stream MCP logs with colors\n\n";
    out << "Usage: " << program << " [options]\n\n";
    out << "Options:\n";
    out << "  --dir PATH    Log directory to follow (default: " << default_log_dir() << ")\n";
    out << "  --file PATH   Watch a specific file instead of auto-detecting\n";
    out << "  --no-color    Disable colors\n";
    out << "  --help, -h    Show this help message\n";
    return out.str();
}

} // namespace mcp_tap
