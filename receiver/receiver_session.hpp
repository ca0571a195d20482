#pragma once

// ============================================================
// receiver_session.hpp -- Collect the frames of one transfer
//
//   IDLE --first frame--> COLLECTING --all parts--> COMPLETE
//                              |        \--write error--> FAILED
//                              \--stall / cancel / end of input--> STALLED
//
// Single-threaded: the capture loop calls feed() for every captured
// payload and poll() on every cycle, with the current time injected.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/logger.hpp"
#include "reassembler.hpp"
#include "draft_store.hpp"
#include <string>
#include <vector>
#include <chrono>

enum class ReceiverState : u8 {
    IDLE       = 0,
    COLLECTING = 1,
    COMPLETE   = 2,
    STALLED    = 3,  // draft + manifest written (when anything was missing)
    FAILED     = 4,  // every part held but the output could not be written
};

const char* receiver_state_str(ReceiverState s);

// What feed() did with one capture
enum class FeedOutcome : u8 {
    STORED            = 0,
    DUPLICATE         = 1,
    MALFORMED         = 2,  // not a framecast frame
    INVALID_FIELDS    = 3,  // a damaged frame, or one inconsistent with the chunk size
    IDENTITY_MISMATCH = 4,  // a frame of some other transfer
    IGNORED_TERMINAL  = 5,  // session already finished
};

const char* feed_outcome_str(FeedOutcome o);

struct ReceiverConfig {
    std::string output_dir{"."};
    u32         chunk_size{DEFAULT_CHUNK_SIZE};  // used until a non-final part fixes it
    int         stall_timeout_ms{30000};
    int         poll_timeout_ms{500};
    std::string resume_name;                     // non-empty: check this draft before any frame
};

class ReceiverSession {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // Throws std::filesystem::filesystem_error if output_dir cannot be created
    explicit ReceiverSession(ReceiverConfig config);

    // Load the draft of filename before any frame arrived. Returns true if
    // parts were restored. Throws std::invalid_argument on an unsafe name and
    // std::logic_error once a transfer has begun.
    bool resume(const std::string& filename, TimePoint now);

    FeedOutcome feed(const std::string& text, TimePoint now);
    FeedOutcome feed(const Frame& frame, TimePoint now);

    // Check the stall timer; returns the (possibly new) state
    ReceiverState poll(TimePoint now);

    // Operator interrupt: persist what we have, same as a stall
    void cancel();

    // The frame source ran dry: persist what we have, same as a stall
    void end_of_input();

    ReceiverState state() const { return state_; }
    bool terminal() const;

    const std::string& filename() const { return filename_; }
    u32 total() const { return total_; }
    u32 received() const { return (u32)parts_.size(); }
    u64 bytes_received() const { return bytes_received_; }
    u32 chunk_size() const { return effective_chunk_size(); }

    std::vector<u32> gaps() const;

    // Set once COMPLETE
    const std::string& output_path() const { return output_path_; }
    const std::string& digest() const { return digest_; }

    const ReceiverConfig& config() const { return config_; }

private:
    ReceiverConfig    config_;
    DraftStore        store_;
    ReceiverState     state_{ReceiverState::IDLE};
    RateLimitedNotice notice_;

    std::string filename_;
    u32         total_{0};
    u32         chunk_size_{0};      // 0 until fixed by a non-final part or a sidecar
    bool        draft_checked_{false};
    PartMap     parts_;
    u64         bytes_received_{0};
    TimePoint   last_progress_{};

    std::string output_path_;
    std::string digest_;

    void begin_transfer(const std::string& filename, u32 total, TimePoint now);
    void adopt_draft(ResumedDraft&& draft);
    bool check_sizes(const Frame& frame, std::string& why);
    void complete();
    void stall(const std::string& reason);
    u32 effective_chunk_size() const;
};
