#pragma once

// ============================================================
// file_io.hpp -- File read/write helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- ChunkReader: positional reads of one source file ----
// The sender reads each part just before it is framed, so a file that
// disappears or shrinks mid-transfer surfaces as a read error on that part.
class ChunkReader {
public:
    // Throws std::runtime_error if the file cannot be opened
    explicit ChunkReader(const std::string& path);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

    // Read exactly len bytes at offset into out.
    // Throws std::runtime_error on a short or failed read.
    void read_at(u64 offset, u32 len, std::vector<u8>& out);

private:
    std::string   path_;
    std::ifstream in_;
    u64           size_{0};
};

// ---- Utility functions ----

// Write the whole buffer to path via a temporary file + rename, so a reader
// never sees a half-written file. Throws std::runtime_error on failure.
void write_file_atomic(const std::string& path, const void* data, size_t len);

inline void write_file_atomic(const std::string& path, const std::vector<u8>& data) {
    write_file_atomic(path, data.data(), data.size());
}

inline void write_file_atomic(const std::string& path, const std::string& text) {
    write_file_atomic(path, text.data(), text.size());
}

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Read entire small file into memory. Throws std::runtime_error if unreadable.
std::vector<u8> read_small_file(const std::string& path);

// Remove path if it exists; returns false only on a real failure
bool remove_file(const std::string& path);

} // namespace file_io
