// ============================================================
// sender/main.cpp -- framecast sender entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "sender_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static SenderApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <file> [options]\n"
        << "\n"
        << "  file              file to transfer\n"
        << "\nOptions:\n"
        << "  --out-dir DIR     write one frame file per part into DIR\n"
        << "                    (default: one frame per line on stdout)\n"
        << "  --chunk N         raw bytes per frame, " << MIN_CHUNK_SIZE << "-" << MAX_CHUNK_SIZE
        << " (default: " << DEFAULT_CHUNK_SIZE << ")\n"
        << "  --manifest PATH   remediation: send only the parts listed in PATH\n"
        << "  --interval-ms N   display time per frame (default: 1000)\n"
        << "  --compress        zstd-compress frame payloads when it helps\n"
        << "  --log FILE        append log lines to FILE\n"
        << "  --verbose         enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " report.pdf | qr-display\n"
        << "  " << prog << " report.pdf --out-dir frames/\n"
        << "  " << prog << " report.pdf --manifest report.pdf.missing.json\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    SenderConfig cfg;
    cfg.source_path = argv[1];
    Logger::get().set_level(LogLevel::INFO);

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--out-dir") == 0 && i + 1 < argc) {
            cfg.out_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--chunk") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            cfg.chunk_size = n > 0 ? (u32)n : 0;
        } else if (std::strcmp(argv[i], "--manifest") == 0 && i + 1 < argc) {
            cfg.manifest_path = argv[++i];
        } else if (std::strcmp(argv[i], "--interval-ms") == 0 && i + 1 < argc) {
            cfg.interval_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--compress") == 0) {
            cfg.use_compress = true;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.source_path)) {
        std::cerr << "ERROR: Invalid file path\n";
        return 1;
    }
    if (cfg.chunk_size < MIN_CHUNK_SIZE || cfg.chunk_size > MAX_CHUNK_SIZE) {
        std::cerr << "ERROR: --chunk must be " << MIN_CHUNK_SIZE << "-" << MAX_CHUNK_SIZE << "\n";
        return 1;
    }
    if (cfg.interval_ms < 0 || cfg.interval_ms > 60000) {
        std::cerr << "ERROR: --interval-ms must be 0-60000\n";
        return 1;
    }

    try {
        SenderApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
