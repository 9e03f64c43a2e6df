#include <gtest/gtest.h>
#include "rangefetch/byte_range.hpp"

#include <stdexcept>

using rangefetch::ByteRange;
using rangefetch::partitionRanges;

namespace {

// ── Helper: contiguous, non-overlapping, covers [0, length-1] ──

void verifyPartition(const std::vector<ByteRange>& ranges, std::uint64_t length) {
    ASSERT_FALSE(ranges.empty());
    EXPECT_EQ(ranges.front().start, 0u);
    EXPECT_FALSE(ranges.back().isBounded());

    std::uint64_t covered = 0;
    for (size_t i = 0; i + 1 < ranges.size(); ++i) {
        ASSERT_TRUE(ranges[i].isBounded()) << "only the last range may be open ended";
        EXPECT_LE(ranges[i].start, *ranges[i].end);
        EXPECT_EQ(ranges[i + 1].start, *ranges[i].end + 1)
            << "Gap or overlap between range " << i << " and " << (i + 1);
        covered += *ranges[i].size();
    }
    ASSERT_LT(ranges.back().start, length);
    covered += length - ranges.back().start;
    EXPECT_EQ(covered, length);
}

// ── Worked example ─────────────────────────────────────────────

TEST(ByteRangeTest, MillionBytesOverFourWorkers) {
    const auto ranges = partitionRanges(1'000'000, 4);
    ASSERT_EQ(ranges.size(), 4u);

    EXPECT_EQ(ranges[0], (ByteRange{0, 249'999}));
    EXPECT_EQ(ranges[1], (ByteRange{250'000, 499'999}));
    EXPECT_EQ(ranges[2], (ByteRange{500'000, 749'999}));
    EXPECT_EQ(ranges[3], (ByteRange{750'000, std::nullopt}));
    verifyPartition(ranges, 1'000'000);
}

// ── Remainder goes to the last range ───────────────────────────

TEST(ByteRangeTest, RemainderAbsorbedByLastRange) {
    const auto ranges = partitionRanges(103, 4);
    ASSERT_EQ(ranges.size(), 4u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(*ranges[i].size(), 25u);
    }
    EXPECT_EQ(ranges[3].start, 75u);
    verifyPartition(ranges, 103);
}

TEST(ByteRangeTest, SingleWorkerGetsOpenEndedRange) {
    const auto ranges = partitionRanges(42, 1);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (ByteRange{0, std::nullopt}));
}

TEST(ByteRangeTest, PartitionPropertyHoldsAcrossSizes) {
    for (std::uint64_t length : {1ull, 2ull, 7ull, 64ull, 999ull, 4096ull, 1'000'003ull}) {
        for (std::size_t workers : {1u, 2u, 3u, 8u, 16u, 33u}) {
            SCOPED_TRACE(testing::Message() << "length=" << length << " workers=" << workers);
            verifyPartition(partitionRanges(length, workers), length);
        }
    }
}

// ── Edge cases ─────────────────────────────────────────────────

TEST(ByteRangeTest, FewerBytesThanWorkersClampsWorkerCount) {
    const auto ranges = partitionRanges(3, 8);
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], (ByteRange{0, 0}));
    EXPECT_EQ(ranges[1], (ByteRange{1, 1}));
    EXPECT_EQ(ranges[2], (ByteRange{2, std::nullopt}));
}

TEST(ByteRangeTest, ZeroLengthYieldsNoRanges) {
    EXPECT_TRUE(partitionRanges(0, 4).empty());
}

TEST(ByteRangeTest, ZeroWorkersThrows) {
    EXPECT_THROW(partitionRanges(100, 0), std::invalid_argument);
}

// ── Header rendering ───────────────────────────────────────────

TEST(ByteRangeTest, HeaderValueBounded) {
    EXPECT_EQ((ByteRange{250'000, 499'999}).headerValue(), "bytes=250000-499999");
}

TEST(ByteRangeTest, HeaderValueOpenEnded) {
    EXPECT_EQ((ByteRange{750'000, std::nullopt}).headerValue(), "bytes=750000-");
}

TEST(ByteRangeTest, SizeOnlyKnownWhenBounded) {
    EXPECT_EQ((ByteRange{10, 19}).size(), 10u);
    EXPECT_FALSE((ByteRange{10, std::nullopt}).size().has_value());
}

} // namespace
