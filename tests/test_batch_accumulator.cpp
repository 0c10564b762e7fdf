#include <gtest/gtest.h>
#include <arrow/api.h>

#include "parcel/results/batch_accumulator.h"
#include "test_support.h"

namespace parcel {
namespace results {

class BatchAccumulatorTest : public ::testing::Test {
protected:
    int64_t FootprintOf(int64_t rows) {
        return BatchAccumulator::EstimateFootprint(*test::MakeIdBatch(0, rows));
    }
};

TEST_F(BatchAccumulatorTest, BuffersBelowThreshold) {
    BatchAccumulator accumulator(1LL << 30);

    for (int i = 0; i < 3; ++i) {
        auto unit = accumulator.Append(test::MakeIdBatch(i * 10, 10));
        ASSERT_TRUE(unit.ok()) << unit.status().ToString();
        EXPECT_FALSE(unit->has_value());
    }
    EXPECT_EQ(accumulator.buffered_batches(), 3u);
    EXPECT_EQ(accumulator.buffered_rows(), 30);
    EXPECT_GT(accumulator.buffered_bytes(), 0);
}

TEST_F(BatchAccumulatorTest, FlushesWhenThresholdReached) {
    const int64_t threshold = FootprintOf(100) * 3 / 2;
    BatchAccumulator accumulator(threshold);

    auto first = accumulator.Append(test::MakeIdBatch(0, 100));
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first->has_value());

    auto second = accumulator.Append(test::MakeIdBatch(100, 100));
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(second->has_value());

    const FlushUnit& unit = **second;
    EXPECT_EQ(unit.num_rows, 200);
    EXPECT_EQ(unit.table->num_rows(), 200);
    EXPECT_GE(unit.approx_size_bytes, threshold);

    // Buffer is reset after a flush
    EXPECT_EQ(accumulator.buffered_batches(), 0u);
    EXPECT_EQ(accumulator.buffered_bytes(), 0);
    EXPECT_EQ(accumulator.buffered_rows(), 0);
}

TEST_F(BatchAccumulatorTest, OversizedBatchIsOneUnit) {
    BatchAccumulator accumulator(1);

    auto unit = accumulator.Append(test::MakeIdBatch(0, 5000));
    ASSERT_TRUE(unit.ok());
    ASSERT_TRUE(unit->has_value());
    EXPECT_EQ((*unit)->num_rows, 5000);
    EXPECT_EQ((*unit)->table->num_rows(), 5000);
}

TEST_F(BatchAccumulatorTest, DrainReturnsRemainder) {
    BatchAccumulator accumulator(1LL << 30);
    ASSERT_TRUE(accumulator.Append(test::MakeIdBatch(0, 7)).ok());

    auto drained = accumulator.Drain();
    ASSERT_TRUE(drained.ok());
    ASSERT_TRUE(drained->has_value());
    EXPECT_EQ((*drained)->num_rows, 7);

    auto again = accumulator.Drain();
    ASSERT_TRUE(again.ok());
    EXPECT_FALSE(again->has_value());
}

TEST_F(BatchAccumulatorTest, DrainOnEmptyYieldsNothing) {
    BatchAccumulator accumulator;
    auto drained = accumulator.Drain();
    ASSERT_TRUE(drained.ok());
    EXPECT_FALSE(drained->has_value());
}

TEST_F(BatchAccumulatorTest, ConcatenatesInArrivalOrder) {
    BatchAccumulator accumulator(1LL << 30);
    ASSERT_TRUE(accumulator.Append(test::MakeIdBatch(0, 3)).ok());
    ASSERT_TRUE(accumulator.Append(test::MakeIdBatch(3, 3)).ok());

    auto drained = accumulator.Drain();
    ASSERT_TRUE(drained.ok());
    ASSERT_TRUE(drained->has_value());

    auto combined = (*drained)->table->CombineChunks();
    ASSERT_TRUE(combined.ok());
    auto ids = std::static_pointer_cast<arrow::Int64Array>((*combined)->column(0)->chunk(0));
    for (int64_t i = 0; i < 6; ++i) {
        EXPECT_EQ(ids->Value(i), i);
    }
}

TEST_F(BatchAccumulatorTest, ZeroRowBatchesAreIgnored) {
    BatchAccumulator accumulator(1);
    auto unit = accumulator.Append(test::MakeIdBatch(0, 0));
    ASSERT_TRUE(unit.ok());
    EXPECT_FALSE(unit->has_value());
    EXPECT_EQ(accumulator.buffered_batches(), 0u);
}

TEST_F(BatchAccumulatorTest, RejectsNullAndMismatchedBatches) {
    BatchAccumulator accumulator(1LL << 30);
    EXPECT_TRUE(accumulator.Append(nullptr).status().IsInvalid());

    ASSERT_TRUE(accumulator.Append(test::MakeIdBatch(0, 3)).ok());

    EXPECT_TRUE(accumulator.Append(test::MakeDoubleBatch({1.5})).status().IsInvalid());
    EXPECT_EQ(accumulator.buffered_rows(), 3);
}

TEST_F(BatchAccumulatorTest, SchemaStaysFixedAcrossFlushes) {
    BatchAccumulator accumulator(1);

    auto first = accumulator.Append(test::MakeIdBatch(0, 3));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(first->has_value());
    EXPECT_EQ(accumulator.buffered_batches(), 0u);

    auto drifted = accumulator.Append(test::MakeDoubleBatch({1.5, 2.5}));
    EXPECT_TRUE(drifted.status().IsInvalid()) << drifted.status().ToString();
    EXPECT_EQ(accumulator.buffered_batches(), 0u);

    auto same = accumulator.Append(test::MakeIdBatch(3, 3));
    ASSERT_TRUE(same.ok());
    EXPECT_TRUE(same->has_value());
}

TEST_F(BatchAccumulatorTest, FootprintGrowsWithRows) {
    EXPECT_LT(FootprintOf(10), FootprintOf(1000));
}

} // namespace results
} // namespace parcel
