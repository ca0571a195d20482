// ============================================================
// sender_app.cpp -- framecast sender: session + sink + display pacing
// ============================================================

#include "sender_app.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/hash.hpp"
#include "../common/file_io.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>

SenderApp::SenderApp(SenderConfig config)
    : config_(std::move(config))
    , session_(config_.chunk_size, config_.use_compress)
{
    if (config_.out_dir.empty()) {
        sink_ = std::make_unique<StreamFrameSink>(std::cout);
        Logger::get().set_stdout_reserved(true);
    } else {
        sink_ = std::make_unique<DirectoryFrameSink>(config_.out_dir);
    }
    tui_state_.transfer_label = "Sent";
}

SenderApp::~SenderApp() {
    stop();
}

void SenderApp::stop() {
    stop_.store(true);
}

void SenderApp::hold_frame() {
    using clock = std::chrono::steady_clock;
    auto until = clock::now() + std::chrono::milliseconds(config_.interval_ms);
    while (!stop_.load() && clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

std::string SenderApp::source_digest(const std::string& path) {
    file_io::ChunkReader reader(path);
    hash::StreamHasher128 hasher;
    std::vector<u8> buf;
    const u32 block = 1u << 20;
    for (u64 off = 0; off < reader.size(); off += block) {
        u32 len = (u32)std::min<u64>(block, reader.size() - off);
        reader.read_at(off, len, buf);
        hasher.update(buf.data(), buf.size());
    }
    return hash::to_hex(hasher.digest());
}

int SenderApp::run() {
    try {
        if (config_.manifest_path.empty()) {
            session_.start(config_.source_path);
        } else {
            RemediationManifest manifest = RemediationManifest::load(config_.manifest_path);
            session_.start_remediation(config_.source_path, manifest);
        }
    } catch (const RemediationIdentityError& e) {
        Logger::get().transfer_error("Remediation refused: " + std::string(e.what()));
        return 2;
    } catch (const SourceUnreadableError& e) {
        LOG_ERROR("Cannot send: " + std::string(e.what()));
        return 2;
    } catch (const ManifestFormatError& e) {
        LOG_ERROR("Bad manifest " + config_.manifest_path + ": " + e.what());
        return 2;
    }

    try {
        LOG_INFO("Source digest xxh3-128: " + source_digest(config_.source_path));
    } catch (const std::exception& e) {
        LOG_WARN("Cannot compute source digest: " + std::string(e.what()));
    }

    LOG_INFO("Presenting frames to " + sink_->describe() + " every " +
             std::to_string(config_.interval_ms) + " ms");

    tui_state_.parts_total.store(session_.planned_parts());
    if (config_.manifest_path.empty()) tui_state_.bytes_total.store(session_.file_size());
    tui_state_.set_current_file(session_.filename());
    Tui tui(tui_state_);
    tui.start();

    bool sink_ok = true;
    while (auto unit = session_.next()) {
        if (stop_.load()) break;
        try {
            sink_->present(*unit);
        } catch (const std::exception& e) {
            Logger::get().transfer_error("Cannot present part " + std::to_string(unit->part) +
                                         ": " + e.what());
            sink_ok = false;
            session_.stop();
            break;
        }
        tui_state_.parts_done.fetch_add(1);
        tui_state_.bytes_done.fetch_add(unit->raw_len);
        LOG_DEBUG("Presented part " + std::to_string(unit->part) + "/" +
                  std::to_string(unit->total));
        hold_frame();
        if (stop_.load()) break;
    }
    if (stop_.load()) session_.stop();
    tui.stop();

    u32 shown = tui_state_.parts_done.load();
    if (session_.failed()) {
        LOG_ERROR("Sending stopped early after " + std::to_string(shown) + " parts: " +
                  session_.error());
        return 2;
    }
    if (!sink_ok) return 2;
    if (stop_.load() && shown < session_.planned_parts()) {
        LOG_WARN("Interrupted after " + std::to_string(shown) + "/" +
                 std::to_string(session_.planned_parts()) + " parts");
        return 3;
    }

    LOG_INFO("All " + std::to_string(shown) + " parts of " + session_.filename() +
             " presented (" + utils::format_bytes(tui_state_.bytes_done.load()) + ")");
    return 0;
}
