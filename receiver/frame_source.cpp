// ============================================================
// frame_source.cpp
// ============================================================

#include "frame_source.hpp"
#include "../common/protocol.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ============================================================
// FdLineSource
// ============================================================

FdLineSource::FdLineSource(int fd, int poll_timeout_ms)
    : fd_(fd)
    , poll_timeout_ms_(poll_timeout_ms)
{}

std::string FdLineSource::describe() const {
    return fd_ == 0 ? std::string("stdin") : "fd " + std::to_string(fd_);
}

std::optional<std::string> FdLineSource::pop_line() {
    auto nl = buf_.find('\n');
    if (nl == std::string::npos) {
        if (!eof_ || buf_.empty()) return std::nullopt;
        // Last line without a terminator
        std::string line;
        line.swap(buf_);
        return line;
    }
    std::string line = buf_.substr(0, nl);
    buf_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::optional<std::string> FdLineSource::capture() {
    if (auto line = pop_line()) return line;
    if (eof_) return std::nullopt;

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, poll_timeout_ms_);
    if (rc < 0) {
        if (errno == EINTR) return std::nullopt;
        throw std::runtime_error("poll failed on " + describe() + ": " + platform::last_error_str());
    }
    if (rc == 0) return std::nullopt;

    char tmp[8192];
    ssize_t n = ::read(fd_, tmp, sizeof(tmp));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return std::nullopt;
        throw std::runtime_error("read failed on " + describe() + ": " + platform::last_error_str());
    }
    if (n == 0) {
        eof_ = true;
    } else {
        buf_.append(tmp, (size_t)n);
        // A scanner that never sends a newline must not grow the buffer forever
        if (buf_.find('\n') == std::string::npos && buf_.size() > MAX_FRAME_TEXT_LEN) {
            LOG_WARN("Discarding " + std::to_string(buf_.size()) +
                     " bytes of unterminated input from " + describe());
            buf_.clear();
        }
    }
    return pop_line();
}

// ============================================================
// DirectoryFrameSource
// ============================================================

DirectoryFrameSource::DirectoryFrameSource(const std::string& dir)
    : dir_(dir)
{
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        throw std::runtime_error("Not a directory: " + dir_);
    }
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) files_.push_back(it->path().string());
    }
    if (ec) {
        throw std::runtime_error("Cannot list " + dir_ + ": " + ec.message());
    }
    std::sort(files_.begin(), files_.end());
}

std::string DirectoryFrameSource::describe() const {
    return dir_ + " (" + std::to_string(files_.size()) + " files)";
}

std::optional<std::string> DirectoryFrameSource::capture() {
    while (next_ < files_.size()) {
        const std::string& path = files_[next_++];
        try {
            std::vector<u8> raw = file_io::read_small_file(path);
            std::string text(raw.begin(), raw.end());
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
            return text;
        } catch (const std::exception& e) {
            LOG_WARN("Skipping unreadable capture: " + std::string(e.what()));
        }
    }
    return std::nullopt;
}
