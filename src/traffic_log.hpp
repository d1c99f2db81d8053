#pragma once

#include "log_sink.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace mcp_tap {

// The proxy's record sink: plain text to the log file, styled text to an
// interactive echo stream, plain text queued for every subscriber.
//
// write() runs on the protocol path and never blocks on a subscriber: each
// one has its own bounded queue, drained by its reader's thread. A subscriber
// that falls more than max_queued records behind is dropped.
class TrafficLog : public LogSink {
public:
    static constexpr std::size_t kDefaultMaxQueued = 10000;

    // Opens path for appending. Throws std::runtime_error when it cannot.
    // With echo set, styled lines are also written to it.
    TrafficLog(const std::string& path, std::ostream* echo = nullptr,
               std::size_t max_queued = kDefaultMaxQueued);
    ~TrafficLog() override;

    // Non-copyable
    TrafficLog(const TrafficLog&) = delete;
    TrafficLog& operator=(const TrafficLog&) = delete;

    void write(const std::string& styled, const std::string& plain) override;

    std::uint64_t subscribe();
    void unsubscribe(std::uint64_t id);

    // Moves the queued plain records (each ending in a newline) into lines,
    // replacing its contents. Returns false once id is no longer subscribed.
    bool take(std::uint64_t id, std::vector<std::string>& lines);

    bool is_subscribed(std::uint64_t id) const;
    std::size_t subscriber_count() const;

    const std::string& path() const { return path_; }
    void close();

private:
    std::string path_;
    std::ofstream file_;
    std::ostream* echo_;
    std::size_t max_queued_;

    mutable std::mutex mutex_;
    std::map<std::uint64_t, std::deque<std::string>> subscribers_;
    std::uint64_t next_id_{1};
};

} // namespace mcp_tap
