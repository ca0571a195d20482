// ============================================================
// receiver_app.cpp -- framecast receiver capture loop
// ============================================================

#include "receiver_app.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <optional>
#include <string>

ReceiverApp::ReceiverApp(ReceiverConfig config, std::unique_ptr<FrameSource> source)
    : source_(std::move(source))
    , session_(std::move(config))
{
    tui_state_.transfer_label = "Recv";
}

void ReceiverApp::update_progress() {
    tui_state_.parts_total.store(session_.total());
    tui_state_.parts_done.store(session_.received());
    tui_state_.bytes_done.store(session_.bytes_received());
}

int ReceiverApp::run() {
    const ReceiverConfig& cfg = session_.config();

    if (!cfg.resume_name.empty()) {
        session_.resume(cfg.resume_name, ReceiverSession::Clock::now());
    }

    LOG_INFO("Capturing frames from " + source_->describe() + " into " + cfg.output_dir +
             " (stall timeout " + utils::format_duration_s((u64)cfg.stall_timeout_ms / 1000) + ")");

    Tui tui(tui_state_);
    tui.start();

    bool capture_failed = false;
    std::string current;
    while (!session_.terminal()) {
        if (stop_.load()) {
            LOG_WARN("Interrupted by operator");
            session_.cancel();
            break;
        }

        std::optional<std::string> text;
        try {
            text = source_->capture();
        } catch (const std::exception& e) {
            Logger::get().transfer_error("Capture failed: " + std::string(e.what()));
            capture_failed = true;
            session_.cancel();
            break;
        }

        auto now = ReceiverSession::Clock::now();
        if (text) {
            FeedOutcome outcome = session_.feed(*text, now);
            if (outcome == FeedOutcome::STORED && current != session_.filename()) {
                current = session_.filename();
                tui_state_.set_current_file(current);
            }
        }
        session_.poll(now);
        if (!session_.terminal() && source_->exhausted()) {
            session_.end_of_input();
        }
        update_progress();
    }
    update_progress();
    tui.stop();

    switch (session_.state()) {
        case ReceiverState::COMPLETE:
            return capture_failed ? 2 : 0;
        case ReceiverState::STALLED:
            if (session_.total() > 0 && !session_.gaps().empty()) {
                LOG_WARN("Resend the missing parts with: framecast_send " + session_.filename() +
                         " --manifest " + session_.filename() + ".missing.json");
            }
            return capture_failed ? 2 : 3;
        default:
            return 2;
    }
}
