#include "../receiver/reassembler.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <random>

namespace {

PartMap split_into_parts(const std::vector<u8>& content, u32 chunk) {
    PartMap parts;
    u32 part = 1;
    for (size_t off = 0; off < content.size(); off += chunk, ++part) {
        size_t len = std::min<size_t>(chunk, content.size() - off);
        parts[part] = slice(content, off, len);
    }
    return parts;
}

} // namespace

TEST(Reassembler, AssemblesInPartOrderRegardlessOfInsertion) {
    std::vector<u8> content = pattern_bytes(5000);
    PartMap all = split_into_parts(content, 2048);

    std::vector<u32> order{3, 1, 2};
    std::mt19937 rng(42);
    for (int round = 0; round < 6; ++round) {
        PartMap parts;
        for (u32 p : order) parts[p] = all[p];
        EXPECT_EQ(reassembler::assemble(parts, 3, 2048), content);
        std::shuffle(order.begin(), order.end(), rng);
    }
}

TEST(Reassembler, MissingPartsAreReported) {
    std::vector<u8> content = pattern_bytes(10 * 16);
    PartMap parts = split_into_parts(content, 16);
    parts.erase(2);
    parts.erase(9);

    try {
        reassembler::assemble(parts, 10, 16);
        FAIL() << "expected MissingPartsError";
    } catch (const MissingPartsError& e) {
        EXPECT_EQ(e.gaps(), (std::vector<u32>{2, 9}));
    }
    EXPECT_EQ(reassembler::gap_set(parts, 10), (std::vector<u32>{2, 9}));
}

TEST(Reassembler, WrongPartSizesAreRejected) {
    PartMap parts;
    parts[1] = pattern_bytes(15);
    parts[2] = pattern_bytes(4);
    EXPECT_THROW(reassembler::assemble(parts, 2, 16), std::runtime_error);

    parts[1] = pattern_bytes(16);
    parts[2] = pattern_bytes(17);
    EXPECT_THROW(reassembler::assemble(parts, 2, 16), std::runtime_error);
}

TEST(Reassembler, DraftPlacesPartsAtTrueOffsets) {
    std::vector<u8> content = pattern_bytes(5000);
    PartMap all = split_into_parts(content, 2048);
    PartMap parts;
    parts[1] = all[1];
    parts[3] = all[3];

    std::vector<u8> draft = reassembler::assemble_draft(parts, 3, 2048);
    ASSERT_EQ(draft.size(), 5000u);
    EXPECT_EQ(slice(draft, 0, 2048), slice(content, 0, 2048));
    EXPECT_EQ(slice(draft, 2048, 2048), std::vector<u8>(2048, 0));
    EXPECT_EQ(slice(draft, 4096, 904), slice(content, 4096, 904));
}

TEST(Reassembler, DraftWithoutFinalPartStopsAtItsOffset) {
    std::vector<u8> content = pattern_bytes(5000);
    PartMap all = split_into_parts(content, 2048);
    PartMap parts;
    parts[2] = all[2];

    std::vector<u8> draft = reassembler::assemble_draft(parts, 3, 2048);
    ASSERT_EQ(draft.size(), 4096u);
    EXPECT_EQ(slice(draft, 0, 2048), std::vector<u8>(2048, 0));
    EXPECT_EQ(slice(draft, 2048, 2048), slice(content, 2048, 2048));
}

TEST(Reassembler, DraftOfEveryPartIsTheFile) {
    std::vector<u8> content = pattern_bytes(777);
    PartMap parts = split_into_parts(content, 100);
    EXPECT_EQ(reassembler::assemble_draft(parts, 8, 100), content);
}
