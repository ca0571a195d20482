// ============================================================
// frame_sink.cpp
// ============================================================

#include "frame_sink.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

void StreamFrameSink::present(const PresentationUnit& unit) {
    out_ << unit.payload << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Frame stream closed while presenting part " +
                                 std::to_string(unit.part));
    }
}

DirectoryFrameSink::DirectoryFrameSink(const std::string& dir)
    : dir_(dir)
{
    fs::create_directories(dir_);
}

std::string DirectoryFrameSink::unit_file_name(const PresentationUnit& unit) {
    // 3-digit padding keeps lexical order == part order for up to 999 parts
    int width = 3;
    for (u32 t = unit.total; t >= 1000; t /= 10) ++width;

    std::ostringstream ss;
    ss << unit.filename << "_part_"
       << std::setw(width) << std::setfill('0') << unit.part << "_of_"
       << std::setw(width) << std::setfill('0') << unit.total << ".txt";
    return ss.str();
}

void DirectoryFrameSink::present(const PresentationUnit& unit) {
    fs::path p = fs::path(dir_) / unit_file_name(unit);
    file_io::write_file_atomic(p.string(), unit.payload);
    LOG_DEBUG("Wrote " + p.string());
}
