#pragma once

#include <cstdint>
#include <memory>
#include <arrow/api.h>
#include "parcel/engine/result_stream.h"

namespace parcel {
namespace engine {

/**
 * @brief Streams an in-memory table as batches of at most max_batch_rows rows
 */
class TableResultStream : public ResultStream {
public:
    static constexpr int64_t kDefaultMaxBatchRows = 100000;

    explicit TableResultStream(std::shared_ptr<arrow::Table> table,
                               int64_t max_batch_rows = kDefaultMaxBatchRows);

    arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const override;
    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    Telemetry GetTelemetry() const override;

private:
    std::shared_ptr<arrow::Table> table_;
    int64_t max_batch_rows_;
    int64_t next_row_ = 0;
    Statistics stats_;
};

} // namespace engine
} // namespace parcel
