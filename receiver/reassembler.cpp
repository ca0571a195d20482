// ============================================================
// reassembler.cpp
// ============================================================

#include "reassembler.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cstring>

MissingPartsError::MissingPartsError(std::vector<u32> gaps)
    : std::runtime_error("Missing " + std::to_string(gaps.size()) + " part(s): " +
                         utils::format_part_list(gaps))
    , gaps_(std::move(gaps))
{}

namespace reassembler {

std::vector<u32> gap_set(const PartMap& parts, u32 total) {
    std::vector<u32> gaps;
    for (u32 p = 1; p <= total; ++p) {
        if (parts.find(p) == parts.end()) gaps.push_back(p);
    }
    return gaps;
}

std::vector<u8> assemble(const PartMap& parts, u32 total, u32 chunk_size) {
    std::vector<u32> gaps = gap_set(parts, total);
    if (!gaps.empty()) throw MissingPartsError(std::move(gaps));

    std::vector<u8> out;
    if (total > 0) out.reserve((size_t)(total - 1) * chunk_size + parts.rbegin()->second.size());

    for (u32 p = 1; p <= total; ++p) {
        const std::vector<u8>& data = parts.at(p);
        if (p < total && data.size() != chunk_size) {
            throw std::runtime_error("Part " + std::to_string(p) + " has " +
                                     std::to_string(data.size()) + " bytes, expected " +
                                     std::to_string(chunk_size));
        }
        if (p == total && (data.empty() || data.size() > chunk_size)) {
            throw std::runtime_error("Final part " + std::to_string(p) + " has " +
                                     std::to_string(data.size()) + " bytes, expected 1-" +
                                     std::to_string(chunk_size));
        }
        out.insert(out.end(), data.begin(), data.end());
    }
    return out;
}

std::vector<u8> assemble_draft(const PartMap& parts, u32 total, u32 chunk_size) {
    if (total == 0) return {};

    size_t len = (size_t)(total - 1) * chunk_size;
    auto last = parts.find(total);
    if (last != parts.end()) len += last->second.size();

    std::vector<u8> out(len, 0);
    for (const auto& kv : parts) {
        if (kv.first < 1 || kv.first > total) continue;
        size_t off = (size_t)(kv.first - 1) * chunk_size;
        size_t n = std::min(kv.second.size(), out.size() - off);
        if (kv.first < total) n = std::min<size_t>(n, chunk_size);
        if (n) std::memcpy(out.data() + off, kv.second.data(), n);
    }
    return out;
}

} // namespace reassembler
