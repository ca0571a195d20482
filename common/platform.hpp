#pragma once

// ============================================================
// platform.hpp -- Integer types and small POSIX shims
//
// framecast builds on POSIX systems only: the receiver's line source
// is poll(2) based.
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#include <unistd.h>
#include <errno.h>
#include <cstring>

#define ISATTY isatty
#define FILENO fileno

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

namespace platform {

// Human-readable text for the last OS error
inline std::string last_error_str() {
    int err = errno;
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

} // namespace platform
