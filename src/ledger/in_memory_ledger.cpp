#include "parcel/ledger/in_memory_ledger.h"

#include "parcel/common/status.h"

namespace parcel {
namespace ledger {

InMemoryLedger::InMemoryLedger(Clock clock) : clock_(std::move(clock)) {}

arrow::Result<JobRecord> InMemoryLedger::GetJob(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++get_count_;
    auto it = jobs_.find(handle);
    if (it == jobs_.end()) {
        return NotFoundError("No job found for handle: " + handle);
    }
    return it->second;
}

arrow::Status InMemoryLedger::UpdateJob(const std::string& handle, const JobUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(handle);
    if (it == jobs_.end()) {
        return NotFoundError("No job found for handle: " + handle);
    }
    ApplyUpdate(update, clock_(), &it->second);
    updates_[handle].push_back(update);
    return arrow::Status::OK();
}

arrow::Status InMemoryLedger::CreateJob(const JobRecord& record) {
    if (record.handle.empty()) {
        return arrow::Status::Invalid("Job handle must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = jobs_.emplace(record.handle, record);
    if (!inserted) {
        return arrow::Status::AlreadyExists("Job already exists: ", record.handle);
    }
    it->second.updated_at = clock_();
    return arrow::Status::OK();
}

std::vector<JobUpdate> InMemoryLedger::GetUpdates(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = updates_.find(handle);
    if (it == updates_.end()) {
        return {};
    }
    return it->second;
}

size_t InMemoryLedger::get_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_count_;
}

} // namespace ledger
} // namespace parcel
