#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <memory>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        file_.open(path, std::ios::app);
    }

    // When stdout carries frames, every console line goes to stderr instead
    void set_stdout_reserved(bool reserved) {
        std::lock_guard<std::mutex> lk(mutex_);
        stdout_reserved_ = reserved;
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl >= LogLevel::WARN || stdout_reserved_) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // Log transfer error to a dedicated error log
    void transfer_error(const std::string& msg) {
        std::string line = format_line(LogLevel::ERR, "[TRANSFER] " + msg);
        std::lock_guard<std::mutex> lk(mutex_);
        std::cerr << line << "\n";
        if (!transfer_err_file_.is_open()) {
            transfer_err_file_.open("framecast_errors.log", std::ios::app);
        }
        if (transfer_err_file_.is_open()) {
            transfer_err_file_ << line << "\n";
            transfer_err_file_.flush();
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {}

    std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::ostringstream ss;
        ss << std::put_time(std::localtime(&t), "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex    mutex_;
    LogLevel      level_;
    bool          stdout_reserved_{false};
    std::ofstream file_;
    std::ofstream transfer_err_file_;
};

// ---- RateLimitedNotice ----
// Emits a diagnostic only when it differs from the previous one, so a code
// that stays in front of the camera is reported once, not once per capture.
// reset() re-arms it (e.g. after a part was stored).
class RateLimitedNotice {
public:
    explicit RateLimitedNotice(LogLevel lvl = LogLevel::INFO) : level_(lvl) {}

    // Returns true if the message was logged
    bool notify(const std::string& key, const std::string& msg) {
        if (key == last_key_) return false;
        last_key_ = key;
        Logger::get().log(level_, msg);
        return true;
    }

    void reset() { last_key_.clear(); }

private:
    LogLevel    level_;
    std::string last_key_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
