#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for framecast
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <stdexcept>
#include <string>

// We include it here with XXH_STATIC_LINKING_ONLY for XXH3 API
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) hash result
using Hash128 = std::array<u8, 16>;

// Big-endian bytes of a 128-bit digest, so hex output reads the same everywhere
inline Hash128 to_bytes(const XXH128_hash_t& h) {
    Hash128 out;
    for (int i = 0; i < 8; ++i) {
        out[i]     = (u8)(h.high64 >> (56 - 8 * i));
        out[8 + i] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return out;
}

inline Hash128 xxh3_128(const void* data, size_t len) {
    return to_bytes(XXH3_128bits(data, len));
}

// Low 32 bits of XXH3-64; per-part check value in draft sidecars
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

// Whole-file digest, fed block by block
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        XXH3_128bits_reset(state_);
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const { return to_bytes(XXH3_128bits_digest(state_)); }

private:
    XXH3_state_t* state_;
};

// Lowercase hex, printed by both sides so an operator can compare files
inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (u8 b : h) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

} // namespace hash
