#include "file_tailer.hpp"
#include "colorizer.hpp"
#include "server_log.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mcp_tap {

std::optional<std::string> find_latest_log(const std::string& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return std::nullopt;

    std::optional<std::string> latest;
    fs::file_time_type latest_time{};

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        if (name.size() < 4 || name.compare(name.size() - 4, 4, ".log") != 0) continue;

        // Entries can vanish between listing and stat
        std::error_code stat_ec;
        if (!entry.is_regular_file(stat_ec)) continue;
        auto mtime = fs::last_write_time(entry.path(), stat_ec);
        if (stat_ec) continue;

        if (!latest || mtime > latest_time) {
            latest = entry.path().string();
            latest_time = mtime;
        }
    }

    return latest;
}

FileTailer::FileTailer(asio::io_context& io, std::ostream& out, TailOptions options)
    : out_(out)
    , options_(options)
    , poll_timer_(io)
    , switch_timer_(io)
    , wait_timer_(io)
{
}

FileTailer::~FileTailer() {
    stop();
}

void FileTailer::watch_directory(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        ServerLog::error("Tail", "Cannot create " + dir + ": " + ec.message());
    }

    if (auto latest = next_candidate(dir)) {
        stream_file(*latest, dir);
        return;
    }

    out_ << "Waiting for mcp-tap logs in " << dir << " ..." << std::endl;
    wait_for_log(dir);
}

void FileTailer::stream_file(const std::string& path,
                             const std::optional<std::string>& auto_switch_dir) {
    cancel_timers();
    close_target();
    ++generation_;

    path_ = path;
    auto_switch_dir_ = auto_switch_dir;
    offset_ = 0;
    partial_.clear();

    std::string banner = "--- watching " + fs::path(path).filename().string() + " ---";
    if (options_.color) {
        out_ << "\x1b[2m" << banner << "\x1b[0m\n";
    } else {
        out_ << banner << "\n";
    }

    if (!open_target(path)) {
        if (!auto_switch_dir) {
            state_ = State::Stopped;
            throw std::runtime_error("Cannot open " + path);
        }
        ServerLog::error("Tail", "Cannot open " + path);
        std::error_code mtime_ec;
        failed_path_ = path;
        failed_mtime_ = fs::last_write_time(path, mtime_ec);
        wait_for_log(*auto_switch_dir);
        return;
    }

    failed_path_.reset();
    state_ = State::Streaming;

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (!ec) {
        while (offset_ < size && file_.good()) {
            auto before = offset_;
            read_available(size);
            if (offset_ == before) break;
        }
    }
    out_.flush();

    schedule_poll();
    if (auto_switch_dir_) {
        schedule_switch_check();
    }
}

void FileTailer::stop() {
    cancel_timers();
    close_target();
    ++generation_;
    state_ = State::Stopped;
}

bool FileTailer::open_target(const std::string& path) {
    file_.open(path, std::ios::binary);
    return file_.is_open();
}

void FileTailer::close_target() {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
}

void FileTailer::cancel_timers() {
    poll_timer_.cancel();
    switch_timer_.cancel();
    wait_timer_.cancel();
}

void FileTailer::read_available(std::uint64_t size) {
    auto to_read = static_cast<std::size_t>(
        std::min<std::uint64_t>(size - offset_, options_.max_read));

    std::string buffer(to_read, '\0');
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset_));
    file_.read(&buffer[0], static_cast<std::streamsize>(to_read));

    auto got = file_.gcount();
    file_.clear();
    if (got <= 0) return;

    buffer.resize(static_cast<std::size_t>(got));
    offset_ += static_cast<std::uint64_t>(got);
    emit_chunk(buffer);
}

void FileTailer::emit_chunk(const std::string& text) {
    auto lines = split_lines(partial_ + text);
    partial_ = lines.back();
    lines.pop_back();

    for (const auto& line : lines) {
        emit(line);
    }
}

void FileTailer::emit(const std::string& line) {
    out_ << colorize(line, options_.color) << '\n';
}

void FileTailer::flush_partial() {
    if (partial_.empty()) return;
    emit(partial_);
    partial_.clear();
    out_.flush();
}

void FileTailer::schedule_poll() {
    auto gen = generation_;
    poll_timer_.expires_after(options_.poll_interval);
    poll_timer_.async_wait([this, gen](const asio::error_code& ec) {
        if (ec || gen != generation_) return;
        poll();
    });
}

void FileTailer::poll() {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec) {
        handle_file_gone();
        return;
    }

    // Truncated in place (copytruncate rotation): start over
    if (size < offset_) {
        ServerLog::log("Tail", "File truncated, rereading: " + path_);
        offset_ = 0;
        partial_.clear();
    }

    if (size > offset_) {
        read_available(size);
        out_.flush();
    }

    schedule_poll();
}

void FileTailer::schedule_switch_check() {
    auto gen = generation_;
    switch_timer_.expires_after(options_.switch_interval);
    switch_timer_.async_wait([this, gen](const asio::error_code& ec) {
        if (ec || gen != generation_) return;
        check_for_newer();
    });
}

void FileTailer::check_for_newer() {
    auto newest = next_candidate(*auto_switch_dir_);
    if (!newest || *newest == path_) {
        schedule_switch_check();
        return;
    }

    cancel_timers();
    flush_partial();
    close_target();

    out_ << "\n";
    stream_file(*newest, auto_switch_dir_);
}

void FileTailer::handle_file_gone() {
    cancel_timers();
    close_target();
    partial_.clear();

    if (!auto_switch_dir_) {
        ServerLog::log("Tail", "File removed: " + path_);
        ++generation_;
        state_ = State::Stopped;
        return;
    }

    std::string dir = *auto_switch_dir_;
    if (auto next = next_candidate(dir)) {
        out_ << "\n";
        stream_file(*next, dir);
        return;
    }

    out_ << "\nLog file removed. Waiting for new logs in " << dir << " ..." << std::endl;
    wait_for_log(dir);
}

std::optional<std::string> FileTailer::next_candidate(const std::string& dir) const {
    auto latest = find_latest_log(dir);
    if (!latest || !failed_path_ || *latest != *failed_path_) return latest;

    std::error_code ec;
    auto mtime = fs::last_write_time(*latest, ec);
    if (ec || mtime == failed_mtime_) return std::nullopt;
    return latest;
}

void FileTailer::wait_for_log(const std::string& dir) {
    state_ = State::Waiting;
    auto gen = generation_;
    wait_timer_.expires_after(options_.wait_interval);
    wait_timer_.async_wait([this, gen, dir](const asio::error_code& ec) {
        if (ec || gen != generation_) return;

        if (auto found = next_candidate(dir)) {
            out_ << "\n";
            stream_file(*found, dir);
            return;
        }
        wait_for_log(dir);
    });
}

} // namespace mcp_tap
