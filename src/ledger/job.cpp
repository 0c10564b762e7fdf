#include "parcel/ledger/job.h"

#include <algorithm>
#include <cctype>

namespace parcel {
namespace ledger {

const char* JobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::kQueued:    return "QUEUED";
        case JobStatus::kExecuting: return "EXECUTING";
        case JobStatus::kCompleted: return "COMPLETED";
        case JobStatus::kFailed:    return "FAILED";
    }
    return "UNKNOWN";
}

arrow::Result<JobStatus> ParseJobStatus(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "QUEUED")    return JobStatus::kQueued;
    if (upper == "EXECUTING") return JobStatus::kExecuting;
    if (upper == "COMPLETED") return JobStatus::kCompleted;
    if (upper == "FAILED")    return JobStatus::kFailed;
    return arrow::Status::Invalid("Unknown job status: '", name, "'");
}

void ApplyUpdate(const JobUpdate& update, Timestamp now, JobRecord* record) {
    if (update.status) {
        record->status = *update.status;
        if (*update.status == JobStatus::kExecuting) {
            record->started_at = now;
            record->finished_at.reset();
        } else if (IsTerminal(*update.status)) {
            record->finished_at = now;
        }
    }
    if (update.clear_error) {
        record->error.reset();
    }
    if (update.error) {
        record->error = update.error;
    }
    if (update.progress) {
        record->progress = update.progress;
    }
    if (update.total_rows) {
        record->total_rows = *update.total_rows;
    }
    if (update.columns) {
        record->columns = *update.columns;
    }
    if (update.total_size_estimate) {
        record->total_size_estimate = *update.total_size_estimate;
    }
    if (update.result_manifest_path) {
        record->result_manifest_path = *update.result_manifest_path;
    }
    if (update.telemetry) {
        record->telemetry = *update.telemetry;
    }
    record->updated_at = now;
}

namespace {

void PutTimestamp(nlohmann::json& json, const char* key, const std::optional<Timestamp>& ts) {
    if (ts) {
        json[key] = FormatIso8601(*ts);
    }
}

arrow::Status GetTimestamp(const nlohmann::json& json, const char* key,
                           std::optional<Timestamp>* out) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return arrow::Status::OK();
    }
    ARROW_ASSIGN_OR_RAISE(auto ts, ParseIso8601(it->get<std::string>()));
    *out = ts;
    return arrow::Status::OK();
}

template <typename T>
void GetOptional(const nlohmann::json& json, const char* key, std::optional<T>* out) {
    auto it = json.find(key);
    if (it != json.end() && !it->is_null()) {
        *out = it->get<T>();
    }
}

} // namespace

nlohmann::json JobRecordToJson(const JobRecord& record) {
    nlohmann::json json;
    json["execution_id"] = record.handle;
    if (record.sql_text) {
        json["sqlText"] = *record.sql_text;
    }
    json["status"] = JobStatusToString(record.status);
    if (record.submitted_by) {
        json["submitted_by"] = *record.submitted_by;
    }
    PutTimestamp(json, "started_at", record.started_at);
    PutTimestamp(json, "updated_at", record.updated_at);
    PutTimestamp(json, "finished_at", record.finished_at);
    if (record.error) {
        json["error"] = *record.error;
    }
    if (record.progress) {
        json["progress"] = *record.progress;
    }
    json["total_rows"] = record.total_rows;

    nlohmann::json columns = nlohmann::json::array();
    for (const auto& column : record.columns) {
        columns.push_back({{"name", column.name}, {"type", column.type}});
    }
    json["columns"] = std::move(columns);

    json["total_size_estimate"] = record.total_size_estimate;
    json["result_manifest_path"] = record.result_manifest_path;
    json["telemetry"] = record.telemetry;
    return json;
}

arrow::Result<JobRecord> JobRecordFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return arrow::Status::Invalid("Job document must be a JSON object");
    }

    JobRecord record;
    try {
        record.handle = json.value("execution_id", std::string());
        GetOptional(json, "sqlText", &record.sql_text);
        ARROW_ASSIGN_OR_RAISE(record.status,
                              ParseJobStatus(json.value("status", std::string("QUEUED"))));
        GetOptional(json, "submitted_by", &record.submitted_by);
        ARROW_RETURN_NOT_OK(GetTimestamp(json, "started_at", &record.started_at));
        ARROW_RETURN_NOT_OK(GetTimestamp(json, "updated_at", &record.updated_at));
        ARROW_RETURN_NOT_OK(GetTimestamp(json, "finished_at", &record.finished_at));
        GetOptional(json, "error", &record.error);
        GetOptional(json, "progress", &record.progress);
        record.total_rows = json.value("total_rows", int64_t{0});

        if (auto it = json.find("columns"); it != json.end()) {
            for (const auto& column : *it) {
                record.columns.push_back({column.at("name").get<std::string>(),
                                          column.at("type").get<std::string>()});
            }
        }

        record.total_size_estimate = json.value("total_size_estimate", int64_t{0});
        record.result_manifest_path = json.value("result_manifest_path", std::string());
        if (auto it = json.find("telemetry"); it != json.end()) {
            record.telemetry = it->get<Telemetry>();
        }
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Malformed job document: ", e.what());
    }
    return record;
}

} // namespace ledger
} // namespace parcel
