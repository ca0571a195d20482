#pragma once

// ============================================================
// receiver_app.hpp -- framecast receiver: capture loop around one
//   ReceiverSession, with progress display and operator cancel
// ============================================================

#include "../common/platform.hpp"
#include "../common/tui.hpp"
#include "receiver_session.hpp"
#include "frame_source.hpp"
#include <memory>
#include <atomic>

class ReceiverApp {
public:
    ReceiverApp(ReceiverConfig config, std::unique_ptr<FrameSource> source);

    // Capture until COMPLETE, STALLED or FAILED.
    // Returns 0 on COMPLETE, 3 on STALLED, 2 on FAILED or a capture error.
    int run();

    // Signal-safe: the loop cancels the session on its next cycle
    void stop() { stop_.store(true); }

    const ReceiverSession& session() const { return session_; }

private:
    std::unique_ptr<FrameSource> source_;
    ReceiverSession              session_;
    TuiState                     tui_state_;
    std::atomic<bool>            stop_{false};

    void update_progress();
};
