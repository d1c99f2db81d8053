#pragma once

#include "traffic_log.hpp"
#include <httplib.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace mcp_tap {

// Streams the traffic log as plain text to any number of HTTP clients
class HttpServer {
public:
    // description is announced to each client before the stream starts
    HttpServer(TrafficLog& log, std::string description,
               uint16_t port, std::string host = "127.0.0.1");
    ~HttpServer();

    // Binds and starts serving on a background thread. Port 0 picks a free
    // port. Returns false when the address cannot be bound.
    bool start();
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return port_; }

private:
    void setup_routes();

    TrafficLog& log_;
    std::string description_;
    std::string host_;
    uint16_t port_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace mcp_tap
