#pragma once

// ============================================================
// frame_source.hpp -- Where captured barcode payloads come from
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <optional>

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // One decoded barcode payload, or std::nullopt if nothing arrived
    // within this capture cycle.
    virtual std::optional<std::string> capture() = 0;

    // True once the source can never produce another capture
    virtual bool exhausted() const = 0;

    virtual std::string describe() const = 0;
};

// Newline-terminated payloads from a file descriptor (a scanner's raw
// output on stdin, or a pipe from a camera decoder). Each capture waits
// at most poll_timeout_ms so the caller can keep checking for a stall.
class FdLineSource : public FrameSource {
public:
    explicit FdLineSource(int fd, int poll_timeout_ms = 500);

    std::optional<std::string> capture() override;
    bool exhausted() const override { return eof_ && buf_.empty(); }
    std::string describe() const override;

private:
    int         fd_;
    int         poll_timeout_ms_;
    std::string buf_;
    bool        eof_{false};

    std::optional<std::string> pop_line();
};

// Every regular file in a directory, sorted by name, one capture per file
// (e.g. the output of framecast_send --out-dir).
class DirectoryFrameSource : public FrameSource {
public:
    // Throws std::runtime_error if dir is not a readable directory
    explicit DirectoryFrameSource(const std::string& dir);

    std::optional<std::string> capture() override;
    bool exhausted() const override { return next_ >= files_.size(); }
    std::string describe() const override;

private:
    std::string              dir_;
    std::vector<std::string> files_;
    size_t                   next_{0};
};
