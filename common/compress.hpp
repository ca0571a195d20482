#pragma once

// ============================================================
// compress.hpp -- zstd compression wrapper
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Frames are small; spend a little more CPU for a denser barcode
static constexpr int ZSTD_LEVEL = 9;

// Returns the maximum compressed size for a given input size
inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

// Compress to a resizable buffer; returns compressed data
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len) {
    size_t cap = max_compressed_size(src_len);
    std::vector<u8> buf(cap);
    size_t result = ZSTD_compress(buf.data(), cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    buf.resize(result);
    return buf;
}

// Decompress a single zstd frame whose content size is recorded in its header.
// max_size bounds the output so a hostile frame cannot claim gigabytes.
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t max_size) {
    unsigned long long content = ZSTD_getFrameContentSize(src, src_len);
    if (content == ZSTD_CONTENTSIZE_ERROR) {
        throw std::runtime_error("ZSTD decompress error: not a zstd frame");
    }
    if (content == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw std::runtime_error("ZSTD decompress error: content size unknown");
    }
    if (content > max_size) {
        throw std::runtime_error("ZSTD decompress error: content size " +
                                 std::to_string(content) + " exceeds limit");
    }
    std::vector<u8> buf((size_t)content);
    size_t result = ZSTD_decompress(buf.data(), buf.size(), src, src_len);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(result));
    }
    buf.resize(result);
    return buf;
}

// Extension whitelist: should we compress this file?
// Returns true if the file extension is compressible
inline bool should_compress(const std::string& path) {
    // Do NOT compress already-compressed formats
    static const char* const no_compress[] = {
        ".gz", ".bz2", ".xz", ".zst", ".lz4", ".br",
        ".zip", ".7z", ".rar",
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".avif", ".heic",
        ".mp4", ".mkv", ".avi", ".mov", ".webm",
        ".mp3", ".aac", ".ogg", ".flac", ".opus", ".m4a",
        ".pdf",
        nullptr
    };

    // Find extension
    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) return true;

    std::string ext = path.substr(dot_pos);
    // Lowercase
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }

    for (int i = 0; no_compress[i]; ++i) {
        if (ext == no_compress[i]) return false;
    }
    return true;
}

} // namespace compress
