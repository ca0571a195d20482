// ============================================================
// tui.cpp -- ANSI progress display implementation
// ============================================================

#include "tui.hpp"
#include "utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdio>

bool Tui::is_tty() {
    return ISATTY(FILENO(stderr)) != 0;
}

Tui::Tui(TuiState& state)
    : state_(state)
    , last_time_(std::chrono::steady_clock::now())
{}

Tui::~Tui() {
    stop();
}

void Tui::start(int interval_ms) {
    if (running_.exchange(true)) return;
    stopped_ = false;
    thread_ = std::thread([this, interval_ms] {
        while (running_.load()) {
            render();
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
        }
    });
}

void Tui::stop() {
    if (stopped_) return;
    stopped_ = true;
    bool was_running = running_.exchange(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (!was_running) return;
    // Final render
    render();
    std::cerr.flush();
}

void Tui::clear_lines(int n) {
    for (int i = 0; i < n; ++i) {
        // Move cursor up one line, then clear line
        std::cerr << "\x1b[A\x1b[2K";
    }
    if (n > 0) {
        std::cerr << "\r";
        std::cerr.flush();
    }
    lines_printed_ = 0;
}

std::string Tui::build_progress_bar(double pct, int width) const {
    if (width < 4) return "";
    int fill = (int)(pct / 100.0 * width);
    fill = utils::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '=';
        else if (i == fill)    bar += '>';
        else                   bar += ' ';
    }
    bar += "]";
    return bar;
}

void Tui::render() {
    auto now = std::chrono::steady_clock::now();
    double elapsed_s = std::chrono::duration<double>(now - last_time_).count();

    u32 parts_done  = state_.parts_done.load();
    u32 parts_total = state_.parts_total.load();
    u64 bytes_done  = state_.bytes_done.load();
    u64 bytes_total = state_.bytes_total.load();

    // Parts per second (EWMA); frames arrive about once a second
    if (elapsed_s >= 1.0) {
        double instant = (double)(parts_done - last_parts_) / elapsed_s;
        smooth_rate_ = (last_parts_ == 0) ? instant : 0.7 * smooth_rate_ + 0.3 * instant;
        last_parts_ = parts_done;
        last_time_  = now;
    }

    double pct = parts_total > 0 ? (double)parts_done / parts_total * 100.0 : 0.0;
    pct = utils::clamp(pct, 0.0, 100.0);

    // ETA
    std::string eta_str;
    if (smooth_rate_ > 0 && parts_done < parts_total) {
        u64 eta_s = (u64)((parts_total - parts_done) / smooth_rate_);
        eta_str = "ETA " + utils::format_duration_s(eta_s);
    }

    std::ostringstream ss;
    ss << std::fixed;

    // Line 1: Progress bar
    ss << build_progress_bar(pct, 40) << " " << std::setw(5) << std::setprecision(1) << pct << "%";
    std::string line1 = ss.str();
    ss.str("");

    // Line 2: Stats
    ss << "  Parts: " << parts_done << "/" << parts_total
       << "  " << state_.transfer_label << ": " << utils::format_bytes(bytes_done);
    if (bytes_total > 0) ss << "/" << utils::format_bytes(bytes_total);
    ss << "  " << std::setprecision(2) << smooth_rate_ << " parts/s"
       << "  " << eta_str;
    std::string line2 = ss.str();
    ss.str("");

    // Line 3: Current file
    std::string current;
    {
        std::lock_guard<std::mutex> lk(state_.current_file_mutex);
        current = state_.current_file;
    }
    if (current.size() > 70) {
        current = "..." + current.substr(current.size() - 67);
    }
    std::string line3 = "  > " + current;

    if (!is_tty()) {
        // Non-TTY: print a progress line only when the count moved
        if (parts_done == last_logged_parts_) return;
        last_logged_parts_ = parts_done;
        std::cerr << line2 << "\n";
        std::cerr.flush();
        return;
    }

    // Clear previous output
    clear_lines(lines_printed_);

    std::cerr << line1 << "\n" << line2 << "\n" << line3 << "\n";
    std::cerr.flush();
    lines_printed_ = 3;
}
