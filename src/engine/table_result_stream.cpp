#include "parcel/engine/table_result_stream.h"

#include <algorithm>

namespace parcel {
namespace engine {

TableResultStream::TableResultStream(
    std::shared_ptr<arrow::Table> table,
    int64_t max_batch_rows)
    : table_(std::move(table))
    , max_batch_rows_(std::max<int64_t>(1, max_batch_rows)) {
}

arrow::Result<std::shared_ptr<arrow::Schema>> TableResultStream::GetOutputSchema() const {
    if (!table_) {
        return arrow::Status::Invalid("No table");
    }
    return table_->schema();
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> TableResultStream::GetNextBatch() {
    if (!table_) {
        return arrow::Status::Invalid("No table");
    }

    int64_t num_rows = std::min(max_batch_rows_, table_->num_rows() - next_row_);
    if (num_rows <= 0) {
        return nullptr;
    }

    auto sliced = table_->Slice(next_row_, num_rows);
    ARROW_ASSIGN_OR_RAISE(auto batch, sliced->CombineChunksToBatch());

    next_row_ += num_rows;
    stats_.rows_returned += batch->num_rows();
    stats_.batches_returned++;
    return batch;
}

Telemetry TableResultStream::GetTelemetry() const {
    return {
        {"rows_returned", std::to_string(stats_.rows_returned)},
        {"batches_returned", std::to_string(stats_.batches_returned)},
    };
}

} // namespace engine
} // namespace parcel
