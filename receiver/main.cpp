// ============================================================
// receiver/main.cpp -- framecast receiver entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "receiver_app.hpp"
#include "frame_source.hpp"
#include <iostream>
#include <string>
#include <memory>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ReceiverApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <out_dir> [options]\n"
        << "\n"
        << "  out_dir           directory for RESTORED_/DRAFT_ files and manifests\n"
        << "\nOptions:\n"
        << "  --from-dir DIR    read captured frames from files in DIR\n"
        << "                    (default: one decoded payload per line on stdin)\n"
        << "  --chunk N         expected raw bytes per frame (default: " << DEFAULT_CHUNK_SIZE << ")\n"
        << "  --timeout S       seconds without a new part before saving a draft (default: 30)\n"
        << "  --resume NAME     load DRAFT_NAME from out_dir before the first frame\n"
        << "  --log FILE        append log lines to FILE\n"
        << "  --verbose         enable debug logging\n"
        << "\nA stalled or interrupted transfer leaves DRAFT_<name> and <name>.missing.json;\n"
        << "pass the manifest to the sender's --manifest to resend only what is missing.\n"
        << "\nExamples:\n"
        << "  zbarcam --raw | " << prog << " received/\n"
        << "  " << prog << " received/ --from-dir frames/\n"
        << "  zbarcam --raw | " << prog << " received/ --resume report.pdf\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    ReceiverConfig cfg;
    cfg.output_dir = argv[1];
    std::string from_dir;
    int timeout_s = 30;
    Logger::get().set_level(LogLevel::INFO);

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--from-dir") == 0 && i + 1 < argc) {
            from_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--chunk") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            cfg.chunk_size = n > 0 ? (u32)n : 0;
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_s = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--resume") == 0 && i + 1 < argc) {
            cfg.resume_name = argv[++i];
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

    if (!utils::validate_path(cfg.output_dir)) {
        std::cerr << "ERROR: Invalid out_dir\n";
        return 1;
    }
    if (cfg.chunk_size < MIN_CHUNK_SIZE || cfg.chunk_size > MAX_CHUNK_SIZE) {
        std::cerr << "ERROR: --chunk must be " << MIN_CHUNK_SIZE << "-" << MAX_CHUNK_SIZE << "\n";
        return 1;
    }
    if (timeout_s < 1 || timeout_s > 86400) {
        std::cerr << "ERROR: --timeout must be 1-86400\n";
        return 1;
    }
    if (!cfg.resume_name.empty() && !utils::validate_base_name(cfg.resume_name)) {
        std::cerr << "ERROR: --resume takes a bare file name\n";
        return 1;
    }
    cfg.stall_timeout_ms = timeout_s * 1000;

    try {
        std::unique_ptr<FrameSource> source;
        if (from_dir.empty()) {
            source = std::make_unique<FdLineSource>(0, cfg.poll_timeout_ms);
        } else {
            source = std::make_unique<DirectoryFrameSource>(from_dir);
        }

        ReceiverApp app(std::move(cfg), std::move(source));
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
