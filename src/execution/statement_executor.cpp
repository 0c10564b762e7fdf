#include "parcel/execution/statement_executor.h"

#include <arrow/buffer.h>
#include "parcel/common/logging.h"
#include "parcel/common/status.h"
#include "parcel/results/result_paths.h"

namespace parcel {
namespace execution {

PARCEL_LOG_TAG(Executor);

using ledger::JobStatus;
using ledger::JobUpdate;

StatementExecutor::StatementExecutor(
    std::shared_ptr<ledger::Ledger> ledger,
    std::shared_ptr<engine::QueryEngine> engine,
    std::shared_ptr<storage::ObjectStore> store,
    ExecutorConfig config,
    std::shared_ptr<storage::ParquetPartEncoder> encoder)
    : ledger_(std::move(ledger))
    , engine_(std::move(engine))
    , store_(std::move(store))
    , config_(std::move(config))
    , encoder_(std::move(encoder)) {
}

arrow::Result<std::shared_ptr<StatementExecutor>> StatementExecutor::Create(
    std::shared_ptr<ledger::Ledger> ledger,
    std::shared_ptr<engine::QueryEngine> engine,
    std::shared_ptr<storage::ObjectStore> store,
    const ExecutorConfig& config) {

    if (!ledger || !engine || !store) {
        return arrow::Status::Invalid("StatementExecutor needs a ledger, an engine and a store");
    }
    ARROW_RETURN_NOT_OK(config.Validate());
    ARROW_ASSIGN_OR_RAISE(
        auto encoder,
        storage::ParquetPartEncoder::Make(storage::PartEncodingOptions::FromConfig(config)));

    return std::shared_ptr<StatementExecutor>(new StatementExecutor(
        std::move(ledger), std::move(engine), std::move(store), config, std::move(encoder)));
}

arrow::Result<ExecutionSummary> StatementExecutor::Execute(const std::string& handle) {
    auto fetched = ledger_->GetJob(handle);
    if (!fetched.ok()) {
        return LedgerError(fetched.status());
    }
    auto job = std::move(fetched).ValueUnsafe();

    if (ledger::IsTerminal(job.status)) {
        if (config_.terminal_job_policy == TerminalJobPolicy::kReject) {
            return InvalidJobError("Job " + handle + " is already " +
                                   ledger::JobStatusToString(job.status));
        }
        PARCEL_LOG_WARN(Executor) << "Reprocessing job " << handle << " from terminal status "
                                  << ledger::JobStatusToString(job.status);
    }

    if (!job.sql_text || job.sql_text->empty()) {
        JobUpdate failed;
        failed.status = JobStatus::kFailed;
        failed.error = kMissingSqlTextError;
        ARROW_RETURN_NOT_OK(LedgerError(ledger_->UpdateJob(handle, failed)));

        PARCEL_LOG_WARN(Executor) << "Job " << handle << " has no query text; marked FAILED";
        ExecutionSummary summary;
        summary.handle = handle;
        summary.status = JobStatus::kFailed;
        summary.error = kMissingSqlTextError;
        return summary;
    }

    auto outcome = RunPipeline(handle, *job.sql_text);
    if (!outcome.ok()) {
        return RecordFailure(handle, outcome.status());
    }
    return outcome;
}

arrow::Result<ExecutionSummary> StatementExecutor::RunPipeline(const std::string& handle,
                                                               const std::string& sql) {
    JobUpdate executing;
    executing.status = JobStatus::kExecuting;
    executing.progress = 0;
    executing.clear_error = true;
    ARROW_RETURN_NOT_OK(LedgerError(ledger_->UpdateJob(handle, executing)));

    PARCEL_LOG_INFO(Executor) << "Executing statement " << handle << " into "
                              << store_->GetName() << " bucket " << config_.bucket;

    auto opened = engine_->Execute(sql);
    if (!opened.ok()) {
        return EngineError(opened.status());
    }
    auto stream = std::move(opened).ValueUnsafe();

    auto output_schema = stream->GetOutputSchema();
    if (!output_schema.ok()) {
        return EngineError(output_schema.status());
    }
    auto schema = std::move(output_schema).ValueUnsafe();

    results::BatchAccumulator accumulator(config_.flush_threshold_bytes);
    std::vector<results::PartDescriptor> parts;

    while (true) {
        auto next = stream->GetNextBatch();
        if (!next.ok()) {
            return EngineError(next.status());
        }
        auto batch = std::move(next).ValueUnsafe();
        if (!batch) {
            break;
        }
        if (!batch->schema()->Equals(*schema, false)) {
            return EngineError(arrow::Status::Invalid(
                "Result batch schema ", batch->schema()->ToString(),
                " does not match the declared result schema ", schema->ToString()));
        }

        auto appended = accumulator.Append(std::move(batch));
        if (!appended.ok()) {
            return EngineError(appended.status());
        }
        if (auto unit = std::move(appended).ValueUnsafe()) {
            ARROW_ASSIGN_OR_RAISE(auto part, WritePart(handle, static_cast<int64_t>(parts.size()),
                                                       std::move(*unit)));
            parts.push_back(std::move(part));
        }
    }

    auto drained = accumulator.Drain();
    if (!drained.ok()) {
        return EngineError(drained.status());
    }
    if (auto unit = std::move(drained).ValueUnsafe()) {
        ARROW_ASSIGN_OR_RAISE(auto part, WritePart(handle, static_cast<int64_t>(parts.size()),
                                                   std::move(*unit)));
        parts.push_back(std::move(part));
    }

    auto columns = ColumnsFromSchema(*schema);
    auto telemetry = stream->GetTelemetry();
    stream.reset();

    auto manifest = results::ManifestBuilder::Build(
        std::move(parts), columns, results::WriteSettings::FromConfig(config_));
    auto manifest_path = results::ResultPaths::ManifestPath(config_.bucket, handle);
    ARROW_RETURN_NOT_OK(WriteError(store_->WriteBytes(
        manifest_path, arrow::Buffer::FromString(manifest.ToJsonString()))));

    JobUpdate completed;
    completed.status = JobStatus::kCompleted;
    completed.total_rows = manifest.total_rows;
    completed.columns = columns;
    completed.total_size_estimate = manifest.total_size_estimate;
    completed.result_manifest_path = manifest_path;
    completed.telemetry = telemetry;
    ARROW_RETURN_NOT_OK(LedgerError(ledger_->UpdateJob(handle, completed)));

    PARCEL_LOG_INFO(Executor) << "Completed statement " << handle << ": "
                              << manifest.total_rows << " rows in "
                              << manifest.total_parts << " parts, ~"
                              << manifest.total_size_estimate << " bytes";

    ExecutionSummary summary;
    summary.handle = handle;
    summary.status = JobStatus::kCompleted;
    summary.total_rows = manifest.total_rows;
    summary.total_parts = manifest.total_parts;
    summary.total_size_estimate = manifest.total_size_estimate;
    summary.manifest_path = std::move(manifest_path);
    summary.columns = std::move(columns);
    summary.telemetry = std::move(telemetry);
    return summary;
}

arrow::Result<results::PartDescriptor> StatementExecutor::WritePart(const std::string& handle,
                                                                    int64_t index,
                                                                    results::FlushUnit unit) {
    auto path = results::ResultPaths::PartPath(config_.bucket, handle, index,
                                               config_.part_extension);

    auto encoded = encoder_->Encode(*unit.table);
    unit.table.reset();
    if (!encoded.ok()) {
        return WriteError(encoded.status());
    }
    ARROW_RETURN_NOT_OK(WriteError(store_->WriteBytes(path, *encoded)));

    PARCEL_LOG_DEBUG(Executor) << "Wrote " << path << " (" << unit.num_rows << " rows, ~"
                               << unit.approx_size_bytes << " bytes in memory, "
                               << (*encoded)->size() << " bytes encoded)";

    results::PartDescriptor part;
    part.index = index;
    part.path = std::move(path);
    part.row_count = unit.num_rows;
    part.approx_size_bytes = unit.approx_size_bytes;
    return part;
}

arrow::Status StatementExecutor::RecordFailure(const std::string& handle,
                                               const arrow::Status& cause) {
    PARCEL_LOG_ERROR(Executor) << "Error executing statement " << handle << ": "
                               << cause.ToString();

    JobUpdate failed;
    failed.status = JobStatus::kFailed;
    failed.error = cause.message();
    auto recorded = ledger_->UpdateJob(handle, failed);
    if (!recorded.ok()) {
        PARCEL_LOG_ERROR(Executor) << "Could not record FAILED status for " << handle << ": "
                                   << recorded.ToString();
        return cause.WithMessage(cause.message(), " (recording FAILED status also failed: ",
                                 recorded.message(), ")");
    }
    return cause;
}

} // namespace execution
} // namespace parcel
