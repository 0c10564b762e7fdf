#include "parcel/results/batch_accumulator.h"

#include <arrow/util/byte_size.h>

namespace parcel {
namespace results {

BatchAccumulator::BatchAccumulator(int64_t flush_threshold_bytes)
    : flush_threshold_bytes_(flush_threshold_bytes) {
}

int64_t BatchAccumulator::EstimateFootprint(const arrow::RecordBatch& batch) {
    return arrow::util::TotalBufferSize(batch);
}

arrow::Result<std::optional<FlushUnit>>
BatchAccumulator::Append(std::shared_ptr<arrow::RecordBatch> batch) {
    if (!batch) {
        return arrow::Status::Invalid("Cannot append a null batch");
    }
    if (batch->num_rows() == 0) {
        return std::nullopt;
    }
    if (!schema_) {
        schema_ = batch->schema();
    } else if (!batch->schema()->Equals(*schema_, false)) {
        return arrow::Status::Invalid("Batch schema ", batch->schema()->ToString(),
                                      " does not match stream schema ", schema_->ToString());
    }

    buffered_bytes_ += EstimateFootprint(*batch);
    buffered_rows_ += batch->num_rows();
    buffer_.push_back(std::move(batch));

    if (buffered_bytes_ < flush_threshold_bytes_) {
        return std::nullopt;
    }
    ARROW_ASSIGN_OR_RAISE(auto unit, TakeBuffered());
    return unit;
}

arrow::Result<std::optional<FlushUnit>> BatchAccumulator::Drain() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    ARROW_ASSIGN_OR_RAISE(auto unit, TakeBuffered());
    return unit;
}

arrow::Result<FlushUnit> BatchAccumulator::TakeBuffered() {
    ARROW_ASSIGN_OR_RAISE(auto table, arrow::Table::FromRecordBatches(schema_, buffer_));

    FlushUnit unit;
    unit.table = std::move(table);
    unit.num_rows = buffered_rows_;
    unit.approx_size_bytes = buffered_bytes_;

    buffer_.clear();
    buffered_bytes_ = 0;
    buffered_rows_ = 0;
    return unit;
}

} // namespace results
} // namespace parcel
