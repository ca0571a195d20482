#pragma once

// ============================================================
// sender_app.hpp -- framecast sender: frames one file and presents
//   them one at a time at a fixed display interval
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/tui.hpp"
#include "sender_session.hpp"
#include "frame_sink.hpp"
#include <string>
#include <atomic>
#include <memory>

struct SenderConfig {
    std::string source_path;
    std::string out_dir;         // empty = one frame per line on stdout
    std::string manifest_path;   // non-empty = remediation run
    u32         chunk_size{DEFAULT_CHUNK_SIZE};
    bool        use_compress{false};
    int         interval_ms{1000};  // how long each frame stays on display
};

class SenderApp {
public:
    explicit SenderApp(SenderConfig config);
    ~SenderApp();

    // Present every planned frame. Returns 0 on success, 2 on a fatal
    // error (unreadable source, identity mismatch, sink failure).
    int run();

    // Request a stop. Only sets a flag, so it is safe in a signal
    // handler; run() cancels the session itself.
    void stop();

private:
    SenderConfig               config_;
    std::unique_ptr<FrameSink> sink_;
    SenderSession              session_;
    TuiState                   tui_state_;
    std::atomic<bool>          stop_{false};

    // Sleep for the display interval; returns early on stop()
    void hold_frame();

    // xxh3-128 of the whole source, logged so the receiver's digest can be compared
    static std::string source_digest(const std::string& path);
};
