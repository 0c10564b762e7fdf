#pragma once

#include <memory>
#include <optional>
#include <string>
#include <arrow/status.h>

namespace parcel {

/**
 * @brief Failure classes of a statement execution
 *
 * Carried on an arrow::Status as a JobErrorDetail so callers can tell
 * an unknown job from an engine or storage failure without parsing
 * messages.
 */
enum class JobErrorKind {
    kNotFound,    // Job handle unknown to the ledger
    kInvalidJob,  // Job cannot be executed (e.g. no query text)
    kEngine,      // Query engine failed before or during execution
    kWrite,       // Object store rejected a part or manifest write
    kLedger       // Ledger read or update failed
};

const char* JobErrorKindToString(JobErrorKind kind);

/**
 * @brief arrow::StatusDetail tagging a status with its JobErrorKind
 */
class JobErrorDetail : public arrow::StatusDetail {
public:
    static constexpr const char* kTypeId = "parcel::JobErrorDetail";

    explicit JobErrorDetail(JobErrorKind kind) : kind_(kind) {}

    const char* type_id() const override { return kTypeId; }
    std::string ToString() const override;

    JobErrorKind kind() const { return kind_; }

private:
    JobErrorKind kind_;
};

/**
 * @brief Extract the failure class of a status, if it carries one
 */
std::optional<JobErrorKind> GetJobErrorKind(const arrow::Status& status);

inline bool IsJobError(const arrow::Status& status, JobErrorKind kind) {
    auto found = GetJobErrorKind(status);
    return found.has_value() && *found == kind;
}

// Fresh errors
arrow::Status NotFoundError(const std::string& message);
arrow::Status InvalidJobError(const std::string& message);

/**
 * @brief Re-tag an existing failure
 *
 * The status code and message are kept. A status that already carries a
 * JobErrorKind is returned unchanged, so the innermost classification
 * wins. An OK status stays OK.
 */
arrow::Status TagJobError(const arrow::Status& cause, JobErrorKind kind);

inline arrow::Status EngineError(const arrow::Status& cause) {
    return TagJobError(cause, JobErrorKind::kEngine);
}

inline arrow::Status WriteError(const arrow::Status& cause) {
    return TagJobError(cause, JobErrorKind::kWrite);
}

inline arrow::Status LedgerError(const arrow::Status& cause) {
    return TagJobError(cause, JobErrorKind::kLedger);
}

} // namespace parcel
