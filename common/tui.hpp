#pragma once

// ============================================================
// tui.hpp -- ANSI TUI progress display
//
// Draws on stderr: stdout may be carrying frames.
// ============================================================

#include "platform.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <mutex>
#include <chrono>

struct TuiState {
    std::atomic<u32> parts_done{0};
    std::atomic<u32> parts_total{0};
    std::atomic<u64> bytes_done{0};
    std::atomic<u64> bytes_total{0};
    std::string current_file;
    std::mutex current_file_mutex;
    std::string transfer_label{"Sent"};  // "Sent" for sender, "Recv" for receiver

    void set_current_file(const std::string& name) {
        std::lock_guard<std::mutex> lk(current_file_mutex);
        current_file = name;
    }
};

class Tui {
public:
    explicit Tui(TuiState& state);
    ~Tui();

    // Start background refresh thread (interval_ms, default 250ms)
    void start(int interval_ms = 250);

    // Stop and print final line
    void stop();

    // Render one frame to stderr
    void render();

    static bool is_tty();

private:
    TuiState& state_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool stopped_{false};

    // For rate calculation (parts per second)
    u32 last_parts_{0};
    std::chrono::steady_clock::time_point last_time_;
    double smooth_rate_{0.0};

    // Track number of lines printed for cursor-up overwrite
    int lines_printed_{0};
    u32 last_logged_parts_{0xFFFFFFFFu};

    void clear_lines(int n);
    std::string build_progress_bar(double pct, int width) const;
};
