#include "traffic_log.hpp"
#include "server_log.hpp"
#include <iterator>
#include <stdexcept>
#include <utility>

namespace mcp_tap {

TrafficLog::TrafficLog(const std::string& path, std::ostream* echo, std::size_t max_queued)
    : path_(path)
    , echo_(echo)
    , max_queued_(max_queued)
{
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + path);
    }
    ServerLog::log("mcp-tap", "logging to " + path);
}

TrafficLog::~TrafficLog() {
    close();
}

void TrafficLog::write(const std::string& styled, const std::string& plain) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (echo_) {
        *echo_ << styled << '\n';
        echo_->flush();
    }

    if (file_.is_open()) {
        file_ << plain << '\n';
        file_.flush();
    }

    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (it->second.size() >= max_queued_) {
            ServerLog::log("mcp-tap", "dropping log stream subscriber " +
                                          std::to_string(it->first) + " (not keeping up)");
            it = subscribers_.erase(it);
            continue;
        }
        it->second.push_back(plain + "\n");
        ++it;
    }
}

std::uint64_t TrafficLog::subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t id = next_id_++;
    subscribers_[id];
    return id;
}

bool TrafficLog::take(std::uint64_t id, std::vector<std::string>& lines) {
    lines.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(id);
    if (it == subscribers_.end()) return false;

    lines.assign(std::make_move_iterator(it->second.begin()),
                 std::make_move_iterator(it->second.end()));
    it->second.clear();
    return true;
}

void TrafficLog::unsubscribe(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

bool TrafficLog::is_subscribed(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.count(id) > 0;
}

std::size_t TrafficLog::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void TrafficLog::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.clear();
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace mcp_tap
