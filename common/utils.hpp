#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace utils {

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
        return ss.str();
    }
}

// Format duration as "1h 23m 45s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m " +
           std::to_string(seconds % 60) + "s";
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// A transfer filename must be a bare name: it is joined onto the output dir
inline bool validate_base_name(const std::string& name) {
    if (!validate_path(name)) return false;
    if (name == "." || name == "..") return false;
    for (char c : name) {
        if (c == '/' || c == '\\') return false;
    }
    return true;
}

// Last path component ("dir/sub/file.bin" -> "file.bin")
inline std::string base_name(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

// "[2, 5, 9]" -- used when reporting gap sets
inline std::string format_part_list(const std::vector<u32>& parts, size_t max_items = 64) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i == max_items) {
            ss << ", ... (" << parts.size() - max_items << " more)";
            break;
        }
        if (i) ss << ", ";
        ss << parts[i];
    }
    ss << "]";
    return ss.str();
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

} // namespace utils
