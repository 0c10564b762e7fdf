#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <nlohmann/json.hpp>
#include "parcel/common/common_types.h"
#include "parcel/common/time_util.h"

namespace parcel {
namespace ledger {

/**
 * @brief Job lifecycle: QUEUED -> EXECUTING -> {COMPLETED | FAILED}
 */
enum class JobStatus {
    kQueued,
    kExecuting,
    kCompleted,
    kFailed
};

const char* JobStatusToString(JobStatus status);

// Case-insensitive, so "queued" from older submitters is accepted
arrow::Result<JobStatus> ParseJobStatus(const std::string& name);

inline bool IsTerminal(JobStatus status) {
    return status == JobStatus::kCompleted || status == JobStatus::kFailed;
}

/**
 * @brief Ledger record of one statement execution request
 */
struct JobRecord {
    std::string handle;
    std::optional<std::string> sql_text;
    JobStatus status = JobStatus::kQueued;
    std::optional<std::string> submitted_by;

    // Server-assigned
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> updated_at;
    std::optional<Timestamp> finished_at;

    std::optional<std::string> error;  // Only while FAILED
    std::optional<int> progress;

    int64_t total_rows = 0;
    std::vector<ColumnDescriptor> columns;
    int64_t total_size_estimate = 0;
    std::string result_manifest_path;
    Telemetry telemetry;
};

/**
 * @brief Partial update with merge semantics
 *
 * Only engaged fields are written. clear_error removes a stale error
 * left by an earlier failed attempt.
 */
struct JobUpdate {
    std::optional<JobStatus> status;
    std::optional<std::string> error;
    bool clear_error = false;
    std::optional<int> progress;
    std::optional<int64_t> total_rows;
    std::optional<std::vector<ColumnDescriptor>> columns;
    std::optional<int64_t> total_size_estimate;
    std::optional<std::string> result_manifest_path;
    std::optional<Telemetry> telemetry;
};

/**
 * @brief Merge an update into a record, stamping server timestamps
 *
 * updated_at is always set to now; entering EXECUTING sets started_at
 * and entering a terminal status sets finished_at.
 */
void ApplyUpdate(const JobUpdate& update, Timestamp now, JobRecord* record);

// Ledger document encoding
nlohmann::json JobRecordToJson(const JobRecord& record);
arrow::Result<JobRecord> JobRecordFromJson(const nlohmann::json& json);

} // namespace ledger
} // namespace parcel
