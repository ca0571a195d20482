#pragma once

// ============================================================
// frame_codec.hpp -- Frame <-> JSON text
//
// Wire form (one per barcode):
//   {"p":<part>,"t":<total>,"f":"<filename>","d":"<base64 bytes>"}
// Optional "z":1 marks d as base64 of a zstd frame.
// ============================================================

#include "protocol.hpp"
#include <string>
#include <vector>

namespace proto {

// Serialize one part. Throws std::invalid_argument on a frame that violates
// 1 <= part <= total or carries an unsafe filename.
// With allow_compress the data is zstd-compressed when that makes it smaller.
std::string encode_frame(u32 part, u32 total, const std::string& filename,
                         const u8* data, size_t len, bool allow_compress = false);

inline std::string encode_frame(const Frame& f, bool allow_compress = false) {
    return encode_frame(f.part, f.total, f.filename,
                        f.data.data(), f.data.size(), allow_compress);
}

// Parse anything the capture step produced. Never throws: foreign codes are
// MALFORMED, damaged frames INVALID_FIELDS.
DecodeResult decode_frame(const std::string& text);

} // namespace proto
