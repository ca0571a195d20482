// ============================================================
// receiver_session.cpp
// ============================================================

#include "receiver_session.hpp"
#include "../common/frame_codec.hpp"
#include "../common/hash.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

const char* receiver_state_str(ReceiverState s) {
    switch (s) {
        case ReceiverState::IDLE:       return "IDLE";
        case ReceiverState::COLLECTING: return "COLLECTING";
        case ReceiverState::COMPLETE:   return "COMPLETE";
        case ReceiverState::STALLED:    return "STALLED";
        case ReceiverState::FAILED:     return "FAILED";
    }
    return "?";
}

const char* feed_outcome_str(FeedOutcome o) {
    switch (o) {
        case FeedOutcome::STORED:            return "STORED";
        case FeedOutcome::DUPLICATE:         return "DUPLICATE";
        case FeedOutcome::MALFORMED:         return "MALFORMED";
        case FeedOutcome::INVALID_FIELDS:    return "INVALID_FIELDS";
        case FeedOutcome::IDENTITY_MISMATCH: return "IDENTITY_MISMATCH";
        case FeedOutcome::IGNORED_TERMINAL:  return "IGNORED_TERMINAL";
    }
    return "?";
}

ReceiverSession::ReceiverSession(ReceiverConfig config)
    : config_(std::move(config))
    , store_(config_.output_dir)
{}

bool ReceiverSession::terminal() const {
    return state_ == ReceiverState::COMPLETE ||
           state_ == ReceiverState::STALLED ||
           state_ == ReceiverState::FAILED;
}

std::vector<u32> ReceiverSession::gaps() const {
    return reassembler::gap_set(parts_, total_);
}

u32 ReceiverSession::effective_chunk_size() const {
    if (chunk_size_) return chunk_size_;
    // Nothing fixed the stride yet: the configured size, stretched to fit
    // a lone final part
    u32 c = config_.chunk_size;
    auto last = parts_.find(total_);
    if (last != parts_.end() && last->second.size() > c) c = (u32)last->second.size();
    return c;
}

// ---- Draft resume ------------------------------------------------------

bool ReceiverSession::resume(const std::string& filename, TimePoint now) {
    if (!utils::validate_base_name(filename)) {
        throw std::invalid_argument("Unsafe resume name: '" + filename + "'");
    }
    if (state_ != ReceiverState::IDLE) {
        throw std::logic_error("resume() after the transfer of '" + filename_ + "' began");
    }

    auto draft = store_.load(filename, 0, config_.chunk_size);
    if (!draft) {
        LOG_INFO("No draft of " + filename + " in " + store_.dir() + ", starting fresh");
        return false;
    }

    filename_ = filename;
    total_ = draft->total;
    state_ = ReceiverState::COLLECTING;
    last_progress_ = now;
    draft_checked_ = true;
    adopt_draft(std::move(*draft));

    bool restored = !parts_.empty();
    if (parts_.size() == total_) complete();
    return restored;
}

void ReceiverSession::adopt_draft(ResumedDraft&& draft) {
    for (auto& kv : draft.parts) parts_.emplace(kv.first, std::move(kv.second));
    bytes_received_ = 0;
    for (const auto& kv : parts_) bytes_received_ += kv.second.size();

    // Known part size only: a confirmed sidecar or a held non-final part.
    // A draft holding just the final part was laid out at a guess.
    if (total_ > 1 && chunk_size_ == 0) {
        auto first = parts_.begin();
        if (draft.chunk_confirmed) {
            chunk_size_ = draft.chunk_size;
        } else if (first != parts_.end() && first->first < total_) {
            chunk_size_ = (u32)first->second.size();
        }
    }

    std::vector<u32> missing = gaps();
    LOG_INFO("Resumed " + filename_ + ": " + std::to_string(parts_.size()) + "/" +
             std::to_string(total_) + " parts restored from draft (" +
             (draft.from_sidecar ? "sidecar" : "content scan") + "), still missing " +
             utils::format_part_list(missing));
}

void ReceiverSession::begin_transfer(const std::string& filename, u32 total, TimePoint now) {
    filename_ = filename;
    total_ = total;
    state_ = ReceiverState::COLLECTING;
    last_progress_ = now;
    LOG_INFO("Receiving " + filename_ + ": " + std::to_string(total_) + " parts");
}

// ---- Frames -------------------------------------------------------------

FeedOutcome ReceiverSession::feed(const std::string& text, TimePoint now) {
    if (terminal()) return FeedOutcome::IGNORED_TERMINAL;

    DecodeResult r = proto::decode_frame(text);
    if (!r.ok()) {
        notice_.notify(std::string(decode_status_str(r.status)) + ":" + r.detail,
                       "Ignoring capture (" + std::string(decode_status_str(r.status)) +
                       "): " + r.detail);
        return r.status == DecodeStatus::MALFORMED ? FeedOutcome::MALFORMED
                                                   : FeedOutcome::INVALID_FIELDS;
    }
    return feed(r.frame, now);
}

FeedOutcome ReceiverSession::feed(const Frame& frame, TimePoint now) {
    if (terminal()) return FeedOutcome::IGNORED_TERMINAL;

    if (frame.part == 0 || frame.part > frame.total ||
        !utils::validate_base_name(frame.filename)) {
        notice_.notify("frame:" + std::to_string(frame.part) + "/" + std::to_string(frame.total),
                       "Ignoring frame with part " + std::to_string(frame.part) + " of " +
                       std::to_string(frame.total) + " for '" + frame.filename + "'");
        return FeedOutcome::INVALID_FIELDS;
    }

    if (state_ == ReceiverState::IDLE) {
        begin_transfer(frame.filename, frame.total, now);
    }

    if (frame.filename != filename_ || frame.total != total_) {
        notice_.notify("identity:" + frame.filename + "/" + std::to_string(frame.total),
                       "Ignoring frame of " + frame.filename + " (" +
                       std::to_string(frame.total) + " parts): collecting " + filename_ +
                       " (" + std::to_string(total_) + " parts)");
        return FeedOutcome::IDENTITY_MISMATCH;
    }

    if (!draft_checked_) {
        // A draft without sidecar can only be cut once a frame shows the
        // part size, so a final part alone leaves the check for later
        u32 stride = (frame.part < frame.total || frame.total == 1) ? (u32)frame.data.size() : 0;
        auto draft = store_.load(filename_, total_, stride);
        if (draft || stride != 0 || !store_.has_draft(filename_)) {
            draft_checked_ = true;
        } else {
            LOG_DEBUG("Draft of " + filename_ + " waits for a non-final part");
        }
        if (draft) {
            adopt_draft(std::move(*draft));
            if (parts_.size() == total_) {
                complete();
                return FeedOutcome::DUPLICATE;
            }
        }
    }

    if (parts_.count(frame.part)) {
        LOG_DEBUG("Duplicate part " + std::to_string(frame.part));
        return FeedOutcome::DUPLICATE;
    }

    std::string why;
    if (!check_sizes(frame, why)) {
        notice_.notify("size:" + why, "Ignoring part " + std::to_string(frame.part) + ": " + why);
        return FeedOutcome::INVALID_FIELDS;
    }

    parts_.emplace(frame.part, frame.data);
    bytes_received_ += frame.data.size();
    last_progress_ = now;
    notice_.reset();
    LOG_DEBUG("Stored part " + std::to_string(frame.part) + "/" + std::to_string(total_) +
              " (" + std::to_string(parts_.size()) + " held)");

    if (parts_.size() == total_) complete();
    return FeedOutcome::STORED;
}

bool ReceiverSession::check_sizes(const Frame& frame, std::string& why) {
    size_t n = frame.data.size();
    if (n == 0) {
        why = "empty payload";
        return false;
    }

    if (frame.part < total_) {
        if (chunk_size_ == 0) {
            auto last = parts_.find(total_);
            if (last != parts_.end() && last->second.size() > n) {
                why = std::to_string(n) + " bytes is shorter than the final part (" +
                      std::to_string(last->second.size()) + " bytes)";
                return false;
            }
            chunk_size_ = (u32)n;
            if (chunk_size_ != config_.chunk_size) {
                LOG_INFO("Sender uses " + std::to_string(chunk_size_) + "-byte parts");
            }
            return true;
        }
        if (n != chunk_size_) {
            why = std::to_string(n) + " bytes, parts of this transfer have " +
                  std::to_string(chunk_size_);
            return false;
        }
    } else if (chunk_size_ != 0 && n > chunk_size_) {
        why = "final part of " + std::to_string(n) + " bytes exceeds the " +
              std::to_string(chunk_size_) + "-byte part size";
        return false;
    }
    return true;
}

// ---- Terminal transitions -----------------------------------------------

void ReceiverSession::complete() {
    try {
        std::vector<u8> data = reassembler::assemble(parts_, total_, effective_chunk_size());
        store_.write_output(filename_, data);
        output_path_ = store_.output_path(filename_);
        digest_ = hash::to_hex(hash::xxh3_128(data.data(), data.size()));
        store_.discard(filename_);
        state_ = ReceiverState::COMPLETE;
        LOG_INFO("Transfer complete: " + output_path_ + " (" + utils::format_bytes(data.size()) +
                 ", xxh3-128 " + digest_ + ")");
    } catch (const std::exception& e) {
        state_ = ReceiverState::FAILED;
        Logger::get().transfer_error("Cannot restore " + filename_ + ": " + e.what());
    }
}

ReceiverState ReceiverSession::poll(TimePoint now) {
    if (state_ == ReceiverState::COLLECTING && !parts_.empty()) {
        auto idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           now - last_progress_).count();
        if (idle_ms > config_.stall_timeout_ms) stall("no new part for " +
                                                       utils::format_duration_s((u64)idle_ms / 1000));
    }
    return state_;
}

void ReceiverSession::cancel() {
    stall("cancelled");
}

void ReceiverSession::end_of_input() {
    stall("end of input");
}

void ReceiverSession::stall(const std::string& reason) {
    if (terminal()) return;
    state_ = ReceiverState::STALLED;

    if (total_ == 0) {
        LOG_WARN("Stopped (" + reason + ") before any frame arrived, nothing to save");
        return;
    }

    std::vector<u32> missing = gaps();
    if (missing.empty()) {
        LOG_WARN("Stopped (" + reason + ") with every part of " + filename_ +
                 " held, nothing to save");
        return;
    }

    std::string gap_list = utils::format_part_list(missing);
    LOG_WARN("Transfer of " + filename_ + " stalled (" + reason + "): " +
             std::to_string(parts_.size()) + "/" + std::to_string(total_) +
             " parts held, missing " + gap_list);

    try {
        if (chunk_size_ == 0 && total_ > 1) {
            LOG_WARN("Part size of " + filename_ + " not seen yet: the draft records it as unknown");
        }
        store_.save_draft(filename_, parts_, total_, effective_chunk_size(),
                          chunk_size_ != 0 || total_ == 1);
    } catch (const DraftWriteError& e) {
        Logger::get().transfer_error(std::string(e.what()) + "; missing " + gap_list);
    }

    RemediationManifest manifest;
    manifest.filename = filename_;
    manifest.total_parts = total_;
    manifest.missing = std::move(missing);
    try {
        store_.save_manifest(manifest);
    } catch (const ManifestWriteError& e) {
        Logger::get().transfer_error(std::string(e.what()) + "; missing " + gap_list);
    }
}
