#pragma once

#include <cstdint>
#include <memory>
#include <arrow/api.h>
#include <arrow/result.h>
#include "parcel/common/common_types.h"

namespace parcel {
namespace engine {

/**
 * @brief Lazy, forward-only sequence of result batches from one query
 *
 * The sequence is finite and cannot be restarted. Telemetry is only
 * complete once GetNextBatch() has returned nullptr.
 */
class ResultStream {
public:
    virtual ~ResultStream() = default;

    /**
     * @brief Schema shared by every batch of this stream
     */
    virtual arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const = 0;

    /**
     * @brief Pull the next batch
     * @return nullptr once the stream is exhausted
     */
    virtual arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() = 0;

    /**
     * @brief Engine statistics for this query
     */
    virtual Telemetry GetTelemetry() const = 0;

    struct Statistics {
        int64_t rows_returned = 0;
        int64_t batches_returned = 0;
        double execution_time_ms = 0.0;
    };
};

} // namespace engine
} // namespace parcel
