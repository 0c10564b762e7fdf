#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <arrow/api.h>
#include <arrow/result.h>
#include "parcel/common/config.h"

namespace parcel {
namespace results {

/**
 * @brief Buffered batches concatenated into one table, ready to persist
 */
struct FlushUnit {
    std::shared_ptr<arrow::Table> table;
    int64_t num_rows = 0;
    int64_t approx_size_bytes = 0;  // Footprint estimate at flush time
};

/**
 * @brief Groups a stream of record batches into size-bounded flush units
 *
 * The footprint estimate is the sum of the sizes of each buffered batch's
 * column buffers (arrow::util::TotalBufferSize). It is an approximation:
 * it neither serializes nor compresses, and a buffer shared by several
 * batches (e.g. slices of one table) is counted once for each of them.
 *
 * The threshold is a trigger, not a cap. A unit is emitted as soon as the
 * estimate reaches the threshold, so every unit except the one returned
 * by Drain() is at least threshold bytes, and a single oversized batch
 * becomes one unit on its own. Batches are never split.
 *
 * The first batch with rows fixes the schema for the accumulator's whole
 * lifetime, across flushes; a later batch with a different schema is
 * rejected.
 *
 * Not thread-safe; one accumulator per execution.
 */
class BatchAccumulator {
public:
    explicit BatchAccumulator(
        int64_t flush_threshold_bytes = ExecutorConfig::kDefaultFlushThresholdBytes);

    /**
     * @brief Buffer a batch
     * @return A flush unit when the buffered estimate reaches the threshold,
     *         std::nullopt otherwise. Batches without rows are ignored.
     */
    arrow::Result<std::optional<FlushUnit>> Append(std::shared_ptr<arrow::RecordBatch> batch);

    /**
     * @brief Emit whatever is still buffered once the source is exhausted
     * @return std::nullopt when nothing is buffered
     */
    arrow::Result<std::optional<FlushUnit>> Drain();

    int64_t buffered_bytes() const { return buffered_bytes_; }
    int64_t buffered_rows() const { return buffered_rows_; }
    size_t buffered_batches() const { return buffer_.size(); }

    static int64_t EstimateFootprint(const arrow::RecordBatch& batch);

private:
    arrow::Result<FlushUnit> TakeBuffered();

    int64_t flush_threshold_bytes_;
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<std::shared_ptr<arrow::RecordBatch>> buffer_;
    int64_t buffered_bytes_ = 0;
    int64_t buffered_rows_ = 0;
};

} // namespace results
} // namespace parcel
