#pragma once

// protocol.hpp -- Frame definitions for framecast

#include "platform.hpp"
#include <string>
#include <vector>

// 2 KB of raw data per frame: ~2.7 KB after base64 + JSON, which a
// low-error-correction QR code carries reliably.
static constexpr u32 DEFAULT_CHUNK_SIZE = 2048u;
static constexpr u32 MIN_CHUNK_SIZE     = 16u;
static constexpr u32 MAX_CHUNK_SIZE     = 4096u;

// Upper bound on a serialized frame we are willing to parse at all
static constexpr size_t MAX_FRAME_TEXT_LEN = 64u * 1024u;

// ---- Frame keys on the wire ----
namespace frame_key {
static constexpr const char* PART     = "p";
static constexpr const char* TOTAL    = "t";
static constexpr const char* FILENAME = "f";
static constexpr const char* DATA     = "d";
static constexpr const char* ZSTD     = "z";  // optional: d holds a zstd frame
} // namespace frame_key

// ---- Manifest keys ----
namespace manifest_key {
static constexpr const char* FILENAME    = "filename";
static constexpr const char* TOTAL_PARTS = "total_parts";
static constexpr const char* MISSING     = "missing";
} // namespace manifest_key

// One transport unit: part `part` of `total` of file `filename`
struct Frame {
    u32 part{0};
    u32 total{0};
    std::string filename;
    std::vector<u8> data;

    bool operator==(const Frame& o) const {
        return part == o.part && total == o.total &&
               filename == o.filename && data == o.data;
    }
};

// Result classes for decoding anything the capture step hands us
enum class DecodeStatus : u8 {
    OK             = 0,
    MALFORMED      = 1,  // not a framecast frame at all (foreign code)
    INVALID_FIELDS = 2,  // looks like a frame, but fields are missing or bad
};

inline const char* decode_status_str(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::OK:             return "OK";
        case DecodeStatus::MALFORMED:      return "MALFORMED";
        case DecodeStatus::INVALID_FIELDS: return "INVALID_FIELDS";
    }
    return "?";
}

struct DecodeResult {
    DecodeStatus status{DecodeStatus::MALFORMED};
    Frame        frame;
    std::string  detail;  // why decoding failed (empty on OK)

    bool ok() const { return status == DecodeStatus::OK; }
};
