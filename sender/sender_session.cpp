// ============================================================
// sender_session.cpp -- Frame production implementation
// ============================================================

#include "sender_session.hpp"
#include "../common/frame_codec.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <vector>

SenderSession::SenderSession(u32 chunk_size, bool use_compress)
    : chunk_size_(chunk_size)
    , use_compress_(use_compress)
{
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be > 0");
    }
}

SenderSession::~SenderSession() {
    stop();
    if (producer_.joinable()) {
        producer_.join();
    }
}

void SenderSession::start(const std::string& path, const std::vector<u32>* subset) {
    if (started_.exchange(true)) {
        throw std::logic_error("SenderSession already started");
    }

    std::unique_ptr<file_io::ChunkReader> reader;
    try {
        reader = std::make_unique<file_io::ChunkReader>(path);
    } catch (const std::exception& e) {
        Logger::get().transfer_error("Cannot read source " + path + ": " + e.what());
        handoff_.close();
        throw SourceUnreadableError(e.what());
    }

    filename_  = utils::base_name(path);
    file_size_ = reader->size();
    total_     = chunker::total_parts(file_size_, chunk_size_);
    try {
        ranges_ = chunker::split(file_size_, chunk_size_, subset);
    } catch (const std::exception&) {
        handoff_.close();
        throw;
    }

    bool do_compress = use_compress_ && compress::should_compress(filename_);

    if (total_ == 0) {
        LOG_WARN("Source " + path + " is empty: nothing to send");
    }
    LOG_INFO("Sending " + filename_ + " (" + utils::format_bytes(file_size_) + "): " +
             std::to_string(ranges_.size()) + "/" + std::to_string(total_) +
             " parts of " + std::to_string(chunk_size_) + " bytes" +
             (do_compress ? ", zstd" : ""));

    producer_ = std::thread(&SenderSession::produce, this, std::move(reader), do_compress);
}

void SenderSession::start_remediation(const std::string& path,
                                      const RemediationManifest& manifest)
{
    manifest.validate();

    std::string name = utils::base_name(path);
    if (manifest.filename != name) {
        throw RemediationIdentityError("manifest is for '" + manifest.filename +
                                       "' but the file being sent is '" + name + "'");
    }

    // Check part count before any frame exists: a different chunk size or an
    // edited file would make the receiver's part numbers meaningless.
    u64 size = 0;
    {
        std::error_code ec;
        auto sz = fs::file_size(path, ec);
        if (ec) {
            Logger::get().transfer_error("Cannot read source " + path + ": " + ec.message());
            throw SourceUnreadableError("Cannot stat " + path + ": " + ec.message());
        }
        size = (u64)sz;
    }
    u32 total = chunker::total_parts(size, chunk_size_);
    if (total != manifest.total_parts) {
        throw RemediationIdentityError("manifest for '" + name + "' expects " +
                                       std::to_string(manifest.total_parts) +
                                       " parts, file has " + std::to_string(total) +
                                       " at chunk size " + std::to_string(chunk_size_));
    }

    if (manifest.missing.empty()) {
        LOG_WARN("Manifest for " + name + " lists no missing parts");
    } else {
        LOG_INFO("Remediation for " + name + ": parts " +
                 utils::format_part_list(manifest.missing));
    }
    start(path, &manifest.missing);
}

std::optional<PresentationUnit> SenderSession::next() {
    return handoff_.take();
}

void SenderSession::stop() {
    stop_.store(true);
    handoff_.cancel();
}

std::string SenderSession::error() const {
    std::lock_guard<std::mutex> lk(error_mutex_);
    return error_;
}

void SenderSession::produce(std::unique_ptr<file_io::ChunkReader> reader, bool do_compress) {
    std::vector<u8> buf;
    try {
        for (const auto& r : ranges_) {
            if (stop_.load()) break;

            reader->read_at(r.offset, r.length, buf);

            PresentationUnit unit;
            unit.part     = r.part;
            unit.total    = total_;
            unit.raw_len  = r.length;
            unit.filename = filename_;
            unit.payload  = proto::encode_frame(r.part, total_, filename_,
                                                buf.data(), buf.size(), do_compress);

            if (!handoff_.publish(std::move(unit))) break;  // consumer cancelled
            parts_produced_.fetch_add(1);
            bytes_produced_.fetch_add(r.length);
        }
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lk(error_mutex_);
            error_ = e.what();
        }
        failed_.store(true);
        Logger::get().transfer_error("Source became unreadable after " +
                                     std::to_string(parts_produced_.load()) + " parts of " +
                                     filename_ + ": " + e.what());
    }
    // End marker, also on failure, so the consumer never waits forever
    handoff_.close();
}
