#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>

namespace mcp_tap {

struct TailOptions {
    bool color = true;
    std::chrono::milliseconds poll_interval{200};      // appended bytes
    std::chrono::milliseconds switch_interval{2000};   // newer file in the directory
    std::chrono::milliseconds wait_interval{1000};     // no file to watch yet
    std::size_t max_read = 65536;                      // bytes per poll tick
};

// Newest "*.log" entry of dir by modification time, nullopt when the
// directory is missing or holds no log file
std::optional<std::string> find_latest_log(const std::string& dir);

// Streams a growing log file to `out`, colorizing each complete line.
// Everything runs as timer callbacks on one io_context, so the open file,
// offset and partial line are never touched concurrently.
class FileTailer {
public:
    enum class State {
        Idle,
        Streaming,
        Waiting,    // directory has no log file yet, or the target vanished
        Stopped
    };

    FileTailer(asio::io_context& io, std::ostream& out, TailOptions options = {});
    ~FileTailer();

    FileTailer(const FileTailer&) = delete;
    FileTailer& operator=(const FileTailer&) = delete;

    // Follow the newest log in dir, switching when a newer one appears
    void watch_directory(const std::string& dir);

    // Print the current content of path, then follow appended bytes. With
    // auto_switch_dir, also follow rotation inside that directory. Throws
    // std::runtime_error when path cannot be opened and there is no
    // directory to fall back on.
    void stream_file(const std::string& path,
                     const std::optional<std::string>& auto_switch_dir = std::nullopt);

    // Cancels all timers and releases the file
    void stop();

    State state() const { return state_; }
    const std::string& path() const { return path_; }
    std::uint64_t offset() const { return offset_; }
    const std::string& partial() const { return partial_; }

private:
    bool open_target(const std::string& path);
    void close_target();
    void cancel_timers();

    void read_available(std::uint64_t size);
    void emit_chunk(const std::string& text);
    void emit(const std::string& line);
    void flush_partial();

    void schedule_poll();
    void poll();
    void schedule_switch_check();
    void check_for_newer();
    void handle_file_gone();
    void wait_for_log(const std::string& dir);

    // Latest log of dir, unless it is a file that failed to open and has not
    // been modified since
    std::optional<std::string> next_candidate(const std::string& dir) const;

    std::ostream& out_;
    TailOptions options_;

    asio::steady_timer poll_timer_;
    asio::steady_timer switch_timer_;
    asio::steady_timer wait_timer_;

    State state_{State::Idle};
    std::string path_;
    std::optional<std::string> auto_switch_dir_;
    std::ifstream file_;
    std::uint64_t offset_{0};
    std::string partial_;

    std::optional<std::string> failed_path_;
    std::filesystem::file_time_type failed_mtime_{};

    // Bumped on every retarget so callbacks queued for an old target are ignored
    std::uint64_t generation_{0};
};

} // namespace mcp_tap
