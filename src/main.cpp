#include "formatter_context.hpp"
#include "http_server.hpp"
#include "log_paths.hpp"
#include "options.hpp"
#include "palette.hpp"
#include "proxy.hpp"
#include "server_log.hpp"
#include "terminal.hpp"
#include "traffic_log.hpp"

#include <asio.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace mcp_tap;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        ProxyOptions options = parse_proxy_args(args);

        if (options.show_help) {
            std::cerr << proxy_usage(argv[0]);
            return 0;
        }
        if (options.show_version) {
            std::cerr << kVersion << std::endl;
            return 0;
        }
        if (options.command.empty()) {
            std::cerr << proxy_usage(argv[0]);
            return 1;
        }

        std::string log_path;
        if (options.log_file) {
            log_path = *options.log_file;
        } else {
            std::string dir = default_log_dir();
            ensure_dir(dir);
            log_path = default_log_file(dir, options.command, static_cast<long>(::getpid()));
        }

        bool interactive = supports_color(STDERR_FILENO);
        TrafficLog log(log_path, interactive ? &std::cerr : nullptr);
        FormatterContext ctx(log, Palette::make(interactive));

        std::unique_ptr<HttpServer> http;
        if (options.http_port) {
            http = std::make_unique<HttpServer>(log, options.command_line(), *options.http_port);
            if (http->start()) {
                ServerLog::log("mcp-tap", "streaming logs at http://127.0.0.1:" +
                               std::to_string(http->port()));
            }
        }

        asio::io_context io;
        Proxy proxy(io, ctx, ProxyConfig{options.command, options.command_args});
        int code = proxy.run();

        if (http) {
            http->stop();
        }
        log.close();
        return code;

    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << proxy_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
