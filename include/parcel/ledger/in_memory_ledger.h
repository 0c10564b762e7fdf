#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "parcel/ledger/ledger.h"

namespace parcel {
namespace ledger {

/**
 * @brief Process-local ledger
 *
 * Keeps every applied update per handle, in order, so callers can
 * inspect the exact sequence of writes an execution produced.
 */
class InMemoryLedger : public Ledger {
public:
    using Clock = std::function<Timestamp()>;

    explicit InMemoryLedger(Clock clock = Now);
    ~InMemoryLedger() override = default;

    arrow::Result<JobRecord> GetJob(const std::string& handle) override;
    arrow::Status UpdateJob(const std::string& handle, const JobUpdate& update) override;
    arrow::Status CreateJob(const JobRecord& record) override;

    std::vector<JobUpdate> GetUpdates(const std::string& handle) const;
    size_t get_count() const;

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobRecord> jobs_;
    std::unordered_map<std::string, std::vector<JobUpdate>> updates_;
    size_t get_count_ = 0;
};

} // namespace ledger
} // namespace parcel
