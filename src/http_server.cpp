#include "http_server.hpp"
#include "server_log.hpp"
#include <chrono>
#include <sstream>
#include <utility>
#include <vector>

namespace mcp_tap {

HttpServer::HttpServer(TrafficLog& log, std::string description,
                       uint16_t port, std::string host)
    : log_(log)
    , description_(std::move(description))
    , host_(std::move(host))
    , port_(port)
    , server_(std::make_unique<httplib::Server>())
{
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::setup_routes() {
    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::stringstream msg;
        msg << res.status << " " << req.method << " " << req.path << " from " << req.remote_addr;
        ServerLog::log("HTTP", msg.str());
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    // Every other GET is a live log stream
    server_->Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        ServerLog::log("HTTP", "Log stream client connected: " + req.remote_addr + ":" +
                                   std::to_string(req.remote_port));

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");

        res.set_chunked_content_provider(
            "text/plain; charset=utf-8",
            [this](size_t, httplib::DataSink& sink) -> bool {
                std::string greeting =
                    "[mcp-tap] streaming logs for: " + description_ + "\n\n";
                if (!sink.write(greeting.data(), greeting.size())) {
                    return false;
                }

                // Records queue up in the traffic log; this thread does the
                // (possibly slow) socket writes.
                auto id = log_.subscribe();
                std::vector<std::string> lines;

                while (running_ && sink.is_writable() && log_.take(id, lines)) {
                    bool ok = true;
                    for (const auto& line : lines) {
                        if (!sink.write(line.data(), line.size())) {
                            ok = false;
                            break;
                        }
                    }
                    if (!ok) break;

                    if (lines.empty()) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    }
                }

                log_.unsubscribe(id);
                ServerLog::log("HTTP", "Log stream client disconnected");
                return false;
            });
    });
}

bool HttpServer::start() {
    if (running_) return true;

    if (port_ == 0) {
        int bound = server_->bind_to_any_port(host_);
        if (bound <= 0) {
            ServerLog::error("HTTP", "Failed to bind " + host_);
            return false;
        }
        port_ = static_cast<uint16_t>(bound);
    } else if (!server_->bind_to_port(host_, port_)) {
        ServerLog::error("HTTP", "Failed to bind " + host_ + ":" + std::to_string(port_));
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        server_->listen_after_bind();
    });

    ServerLog::log("HTTP", "log server listening on http://" + host_ + ":" + std::to_string(port_));
    return true;
}

void HttpServer::stop() {
    if (!running_) return;
    running_ = false;
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace mcp_tap
