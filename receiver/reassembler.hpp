#pragma once

// ============================================================
// reassembler.hpp -- Turn a set of received parts back into bytes
// ============================================================

#include "../common/platform.hpp"
#include <map>
#include <vector>
#include <string>
#include <stdexcept>

// Sparse store of received parts, keyed by 1-based part number.
// Iteration is always in ascending part order.
using PartMap = std::map<u32, std::vector<u8>>;

class MissingPartsError : public std::runtime_error {
public:
    explicit MissingPartsError(std::vector<u32> gaps);

    const std::vector<u32>& gaps() const { return gaps_; }

private:
    std::vector<u32> gaps_;
};

namespace reassembler {

// Part numbers in [1, total] not present in parts, strictly increasing
std::vector<u32> gap_set(const PartMap& parts, u32 total);

// Concatenate parts 1..total.
// Throws MissingPartsError if any part is absent, std::runtime_error if a
// non-final part is not exactly chunk_size bytes or the final part is empty
// or longer than chunk_size.
std::vector<u8> assemble(const PartMap& parts, u32 total, u32 chunk_size);

// Offset-correct partial file: every held part at (part-1)*chunk_size,
// missing non-final parts zero-filled. If the final part is missing the
// result ends at (total-1)*chunk_size. Never throws on gaps.
std::vector<u8> assemble_draft(const PartMap& parts, u32 total, u32 chunk_size);

} // namespace reassembler
