#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>

#include "parcel/common/common_types.h"
#include "parcel/common/config.h"
#include "parcel/engine/query_engine.h"
#include "parcel/ledger/ledger.h"
#include "parcel/results/batch_accumulator.h"
#include "parcel/results/manifest.h"
#include "parcel/storage/object_store.h"
#include "parcel/storage/parquet_part_encoder.h"

namespace parcel {
namespace execution {

/**
 * @brief Outcome of one Execute call as seen by the caller
 *
 * Mirrors what was written to the ledger; the ledger remains the source
 * of truth.
 */
struct ExecutionSummary {
    std::string handle;
    ledger::JobStatus status = ledger::JobStatus::kQueued;
    int64_t total_rows = 0;
    int64_t total_parts = 0;
    int64_t total_size_estimate = 0;
    std::string manifest_path;
    std::vector<ColumnDescriptor> columns;
    Telemetry telemetry;
    std::optional<std::string> error;
};

/**
 * @brief Runs a queued job end to end and materializes its result set
 *
 * Pipeline: ledger fetch -> EXECUTING -> engine batches -> accumulator ->
 * one Parquet part per flush unit -> manifest -> COMPLETED.
 *
 * Failure handling:
 * - Unknown handle: NotFound error, the ledger is not touched.
 * - No query text: the job is marked FAILED and Execute returns OK with a
 *   FAILED summary.
 * - Any failure after that: the job is marked FAILED with the cause's
 *   message and the cause is returned. Parts already written stay in the
 *   object store.
 *
 * The executor keeps no per-job state between calls. Concurrent Execute
 * calls for distinct handles are fine provided the collaborators are
 * thread-safe; two concurrent calls for the same handle are not guarded
 * against.
 *
 * Example:
 *   ARROW_ASSIGN_OR_RAISE(auto executor,
 *       StatementExecutor::Create(ledger, engine, store, config));
 *   ARROW_ASSIGN_OR_RAISE(auto summary, executor->Execute("job-42"));
 */
class StatementExecutor {
public:
    static constexpr const char* kMissingSqlTextError = "missing sqlText";

    /**
     * @brief Validate the config and build an executor
     */
    static arrow::Result<std::shared_ptr<StatementExecutor>> Create(
        std::shared_ptr<ledger::Ledger> ledger,
        std::shared_ptr<engine::QueryEngine> engine,
        std::shared_ptr<storage::ObjectStore> store,
        const ExecutorConfig& config = ExecutorConfig());

    /**
     * @brief Execute the job addressed by handle
     * @return Summary of the terminal state written to the ledger, or the
     *         failure that moved the job to FAILED
     */
    arrow::Result<ExecutionSummary> Execute(const std::string& handle);

private:
    StatementExecutor(std::shared_ptr<ledger::Ledger> ledger,
                      std::shared_ptr<engine::QueryEngine> engine,
                      std::shared_ptr<storage::ObjectStore> store,
                      ExecutorConfig config,
                      std::shared_ptr<storage::ParquetPartEncoder> encoder);

    // Steps from EXECUTING through COMPLETED; every failure is tagged by site
    arrow::Result<ExecutionSummary> RunPipeline(const std::string& handle,
                                                const std::string& sql);

    arrow::Result<results::PartDescriptor> WritePart(const std::string& handle,
                                                     int64_t index,
                                                     results::FlushUnit unit);

    // Marks the job FAILED and returns the status to hand back to the caller
    arrow::Status RecordFailure(const std::string& handle, const arrow::Status& cause);

    std::shared_ptr<ledger::Ledger> ledger_;
    std::shared_ptr<engine::QueryEngine> engine_;
    std::shared_ptr<storage::ObjectStore> store_;
    ExecutorConfig config_;
    std::shared_ptr<storage::ParquetPartEncoder> encoder_;
};

} // namespace execution
} // namespace parcel
