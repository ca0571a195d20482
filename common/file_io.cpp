// ============================================================
// file_io.cpp -- File read/write helpers
// ============================================================

#include "file_io.hpp"
#include "logger.hpp"
#include <vector>
#include <fstream>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// ChunkReader
// ============================================================

ChunkReader::ChunkReader(const std::string& path)
    : path_(path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Not a regular file: " + path);
    }
    in_.open(path, std::ios::binary);
    if (!in_) {
        throw std::runtime_error("Cannot open file: " + path + ": " + platform::last_error_str());
    }
    in_.seekg(0, std::ios::end);
    auto end = in_.tellg();
    if (end < 0) {
        throw std::runtime_error("Cannot determine size of " + path);
    }
    size_ = (u64)end;
    in_.seekg(0, std::ios::beg);
}

void ChunkReader::read_at(u64 offset, u32 len, std::vector<u8>& out) {
    out.resize(len);
    if (len == 0) return;

    in_.clear();
    in_.seekg((std::streamoff)offset, std::ios::beg);
    if (!in_) {
        throw std::runtime_error("Seek to " + std::to_string(offset) + " failed: " + path_);
    }
    in_.read(reinterpret_cast<char*>(out.data()), (std::streamsize)len);
    if ((u64)in_.gcount() != len) {
        throw std::runtime_error("Short read at offset " + std::to_string(offset) +
                                 " (" + std::to_string(in_.gcount()) + "/" +
                                 std::to_string(len) + " bytes): " + path_);
    }
}

// ============================================================
// Utility functions
// ============================================================

void file_io::write_file_atomic(const std::string& path, const void* data, size_t len) {
    ensure_parent_dirs(path);
    std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            throw std::runtime_error("Cannot create file: " + tmp + ": " + platform::last_error_str());
        }
        if (len > 0) {
            f.write(static_cast<const char*>(data), (std::streamsize)len);
        }
        f.flush();
        if (!f) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Write failed: " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(tmp, ec2);
        throw std::runtime_error("Cannot rename " + tmp + " -> " + path + ": " + ec.message());
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

std::vector<u8> file_io::read_small_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    f.seekg(0, std::ios::end);
    auto end = f.tellg();
    if (end < 0) {
        throw std::runtime_error("Cannot determine size of " + path);
    }
    size_t sz = (size_t)end;
    f.seekg(0, std::ios::beg);
    std::vector<u8> buf(sz);
    if (sz > 0) {
        f.read((char*)buf.data(), (std::streamsize)sz);
        if ((size_t)f.gcount() != sz) {
            throw std::runtime_error("Short read: " + path);
        }
    }
    return buf;
}

bool file_io::remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Cannot remove " + path + ": " + ec.message());
        return false;
    }
    return true;
}
