#include "parcel/common/status.h"

#include <cstring>

namespace parcel {

const char* JobErrorKindToString(JobErrorKind kind) {
    switch (kind) {
        case JobErrorKind::kNotFound:   return "NotFound";
        case JobErrorKind::kInvalidJob: return "InvalidJob";
        case JobErrorKind::kEngine:     return "EngineError";
        case JobErrorKind::kWrite:      return "WriteError";
        case JobErrorKind::kLedger:     return "LedgerError";
    }
    return "Unknown";
}

std::string JobErrorDetail::ToString() const {
    return JobErrorKindToString(kind_);
}

std::optional<JobErrorKind> GetJobErrorKind(const arrow::Status& status) {
    if (status.ok()) {
        return std::nullopt;
    }
    const auto& detail = status.detail();
    if (!detail || std::strcmp(detail->type_id(), JobErrorDetail::kTypeId) != 0) {
        return std::nullopt;
    }
    return static_cast<const JobErrorDetail&>(*detail).kind();
}

arrow::Status NotFoundError(const std::string& message) {
    return arrow::Status::KeyError(message).WithDetail(
        std::make_shared<JobErrorDetail>(JobErrorKind::kNotFound));
}

arrow::Status InvalidJobError(const std::string& message) {
    return arrow::Status::Invalid(message).WithDetail(
        std::make_shared<JobErrorDetail>(JobErrorKind::kInvalidJob));
}

arrow::Status TagJobError(const arrow::Status& cause, JobErrorKind kind) {
    if (cause.ok() || GetJobErrorKind(cause).has_value()) {
        return cause;
    }
    return cause.WithDetail(std::make_shared<JobErrorDetail>(kind));
}

} // namespace parcel
