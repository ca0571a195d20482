#include "../common/chunker.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(Chunker, TotalIsCeilingOfSizeOverChunk) {
    EXPECT_EQ(chunker::total_parts(0, 2048), 0u);
    EXPECT_EQ(chunker::total_parts(1, 2048), 1u);
    EXPECT_EQ(chunker::total_parts(2048, 2048), 1u);
    EXPECT_EQ(chunker::total_parts(2049, 2048), 2u);
    EXPECT_EQ(chunker::total_parts(5000, 2048), 3u);
}

TEST(Chunker, PartsCoverTheFileContiguously) {
    const u64 sizes[]  = {1, 15, 16, 17, 2047, 2048, 2049, 5000, 100000};
    const u32 chunks[] = {16, 2048, 4096};
    for (u64 size : sizes) {
        for (u32 chunk : chunks) {
            auto ranges = chunker::split(size, chunk);
            ASSERT_EQ(ranges.size(), chunker::total_parts(size, chunk));
            u64 next = 0;
            for (size_t i = 0; i < ranges.size(); ++i) {
                EXPECT_EQ(ranges[i].part, i + 1);
                EXPECT_EQ(ranges[i].offset, next);
                EXPECT_GT(ranges[i].length, 0u);
                EXPECT_LE(ranges[i].length, chunk);
                if (i + 1 < ranges.size()) EXPECT_EQ(ranges[i].length, chunk);
                next += ranges[i].length;
            }
            EXPECT_EQ(next, size) << "size=" << size << " chunk=" << chunk;
        }
    }
}

TEST(Chunker, FiveThousandBytesMakeThreeParts) {
    auto ranges = chunker::split(5000, 2048);
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[2].offset, 4096u);
    EXPECT_EQ(ranges[2].length, 904u);
    EXPECT_EQ(chunker::part_length(5000, 2048, 3), 904u);
    EXPECT_EQ(chunker::part_length(5000, 2048, 1), 2048u);
}

TEST(Chunker, EmptyFileHasNoParts) {
    EXPECT_TRUE(chunker::split(0, 2048).empty());
}

TEST(Chunker, ZeroChunkSizeIsRejected) {
    EXPECT_THROW(chunker::total_parts(10, 0), std::invalid_argument);
    EXPECT_THROW(chunker::split(10, 0), std::invalid_argument);
}

TEST(Chunker, SubsetKeepsOrderAndTotal) {
    std::vector<u32> subset{3, 1, 3};
    auto ranges = chunker::split(5000, 2048, &subset);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].part, 3u);
    EXPECT_EQ(ranges[0].offset, 4096u);
    EXPECT_EQ(ranges[0].length, 904u);
    EXPECT_EQ(ranges[1].part, 1u);
    EXPECT_EQ(ranges[1].offset, 0u);
}

TEST(Chunker, SubsetEntryOutsideRangeIsRejected) {
    std::vector<u32> too_big{4};
    std::vector<u32> zero{0};
    EXPECT_THROW(chunker::split(5000, 2048, &too_big), std::out_of_range);
    EXPECT_THROW(chunker::split(5000, 2048, &zero), std::out_of_range);
    EXPECT_THROW(chunker::part_length(5000, 2048, 4), std::out_of_range);
}
