// ============================================================
// chunker.cpp
// ============================================================

#include "chunker.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

u32 chunker::total_parts(u64 file_size, u32 chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be > 0");
    }
    u64 total = (file_size + chunk_size - 1) / chunk_size;
    if (total > 0xFFFFFFFFull) {
        throw std::invalid_argument("file needs more than 2^32-1 parts at chunk_size=" +
                                    std::to_string(chunk_size));
    }
    return (u32)total;
}

u32 chunker::part_length(u64 file_size, u32 chunk_size, u32 part) {
    u32 total = total_parts(file_size, chunk_size);
    if (part == 0 || part > total) {
        throw std::out_of_range("part " + std::to_string(part) +
                                " outside [1, " + std::to_string(total) + "]");
    }
    u64 offset = (u64)(part - 1) * chunk_size;
    return (u32)std::min<u64>(chunk_size, file_size - offset);
}

std::vector<ChunkRange> chunker::split(u64 file_size, u32 chunk_size,
                                       const std::vector<u32>* subset)
{
    u32 total = total_parts(file_size, chunk_size);

    auto make_range = [&](u32 part) {
        ChunkRange r;
        r.part   = part;
        r.offset = (u64)(part - 1) * chunk_size;
        r.length = (u32)std::min<u64>(chunk_size, file_size - r.offset);
        return r;
    };

    std::vector<ChunkRange> ranges;
    if (!subset) {
        ranges.reserve(total);
        for (u32 p = 1; p <= total; ++p) {
            ranges.push_back(make_range(p));
        }
        return ranges;
    }

    std::unordered_set<u32> seen;
    ranges.reserve(subset->size());
    for (u32 p : *subset) {
        if (p == 0 || p > total) {
            throw std::out_of_range("subset part " + std::to_string(p) +
                                    " outside [1, " + std::to_string(total) + "]");
        }
        if (!seen.insert(p).second) continue;
        ranges.push_back(make_range(p));
    }
    return ranges;
}
