#pragma once

// ============================================================
// chunker.hpp -- Split a file into numbered, fixed-size parts
// ============================================================

#include "platform.hpp"
#include <vector>

// One part of a file: bytes [offset, offset + length)
struct ChunkRange {
    u32 part;    // 1-based
    u64 offset;
    u32 length;
};

namespace chunker {

// ceil(file_size / chunk_size); throws std::invalid_argument if chunk_size == 0
u32 total_parts(u64 file_size, u32 chunk_size);

// Length of part `part` (1-based) of a file of file_size bytes
u32 part_length(u64 file_size, u32 chunk_size, u32 part);

// All parts in ascending order, or only `subset` (in the given order,
// duplicates produced once). `total` is always computed from the full size.
// Throws std::out_of_range if a subset entry is outside [1, total].
std::vector<ChunkRange> split(u64 file_size, u32 chunk_size,
                              const std::vector<u32>* subset = nullptr);

} // namespace chunker
