#include "file_tailer.hpp"
#include "options.hpp"
#include "terminal.hpp"

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace mcp_tap;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        WatchOptions options = parse_watch_args(args);

        if (options.show_help) {
            std::cout << watch_usage(argv[0]);
            return 0;
        }

        TailOptions tail;
        tail.color = !options.no_color && supports_color(STDOUT_FILENO);

        asio::io_context io;
        FileTailer tailer(io, std::cout, tail);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int) {
            if (ec) return;
            tailer.stop();
            std::cout << std::endl;
        });

        if (options.file) {
            tailer.stream_file(*options.file);
        } else {
            tailer.watch_directory(options.dir);
        }

        io.run();

    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << watch_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
