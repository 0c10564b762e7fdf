#pragma once

#include <string>
#include <arrow/result.h>
#include <arrow/status.h>
#include "parcel/ledger/job.h"

namespace parcel {
namespace ledger {

/**
 * @brief External record store holding job status and metadata
 *
 * Implementations must be safe to call from concurrent executions of
 * distinct jobs. Timestamps are assigned by the ledger at call time.
 */
class Ledger {
public:
    virtual ~Ledger() = default;

    /**
     * @brief Fetch a job record
     * @return NotFound-tagged KeyError when the handle is unknown
     */
    virtual arrow::Result<JobRecord> GetJob(const std::string& handle) = 0;

    /**
     * @brief Merge a partial update into an existing record
     * @return NotFound-tagged KeyError when the handle is unknown
     */
    virtual arrow::Status UpdateJob(const std::string& handle, const JobUpdate& update) = 0;

    /**
     * @brief Insert a new record; fails with AlreadyExists on a duplicate handle
     */
    virtual arrow::Status CreateJob(const JobRecord& record) = 0;
};

} // namespace ledger
} // namespace parcel
