#pragma once

// ============================================================
// sender_session.hpp -- Produce frames for one file
//
// Threading model:
//   - start() validates the source and spawns one producer thread
//   - the producer reads a part, encodes it, and publishes it into
//     a capacity-one Handoff; it blocks until the consumer took the
//     previous unit
//   - the consumer (display loop) calls next() until std::nullopt
//   - on read failure or stop() the producer closes the hand-off,
//     so next() always terminates
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/handoff.hpp"
#include "../common/chunker.hpp"
#include "../common/remediation_manifest.hpp"
#include "../common/file_io.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <optional>
#include <stdexcept>

class SourceUnreadableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A manifest that does not describe the file being (re)sent
class RemediationIdentityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One frame ready for the presentation layer
struct PresentationUnit {
    u32 part{0};
    u32 total{0};
    u32 raw_len{0};        // chunk bytes carried
    std::string filename;
    std::string payload;   // serialized frame text
};

class SenderSession {
public:
    explicit SenderSession(u32 chunk_size = DEFAULT_CHUNK_SIZE,
                           bool use_compress = false);
    ~SenderSession();

    SenderSession(const SenderSession&) = delete;
    SenderSession& operator=(const SenderSession&) = delete;

    // Send every part of path, or only `subset` (in the given order).
    // Throws SourceUnreadableError if the file cannot be opened,
    // std::out_of_range for a subset entry outside [1, total],
    // std::logic_error if the session was already started.
    void start(const std::string& path, const std::vector<u32>* subset = nullptr);

    // Send only manifest.missing. Throws RemediationIdentityError before any
    // frame is produced when the manifest names another file or another
    // part count; ManifestFormatError when it is internally inconsistent.
    void start_remediation(const std::string& path, const RemediationManifest& manifest);

    // Next unit in production order; std::nullopt is the end marker.
    std::optional<PresentationUnit> next();

    // Cancel production; next() then returns the end marker.
    void stop();

    // True if the producer hit a read error (stream ended early)
    bool failed() const { return failed_.load(); }
    std::string error() const;

    const std::string& filename() const { return filename_; }
    u64 file_size() const { return file_size_; }
    u32 total_parts() const { return total_; }
    u32 planned_parts() const { return (u32)ranges_.size(); }
    u32 parts_produced() const { return parts_produced_.load(); }
    u64 bytes_produced() const { return bytes_produced_.load(); }

private:
    u32  chunk_size_;
    bool use_compress_;

    std::string filename_;
    u64         file_size_{0};
    u32         total_{0};
    std::vector<ChunkRange> ranges_;

    Handoff<PresentationUnit> handoff_;
    std::thread       producer_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stop_{false};
    std::atomic<bool> failed_{false};
    std::atomic<u32>  parts_produced_{0};
    std::atomic<u64>  bytes_produced_{0};

    mutable std::mutex error_mutex_;
    std::string        error_;

    void produce(std::unique_ptr<file_io::ChunkReader> reader, bool do_compress);
};
