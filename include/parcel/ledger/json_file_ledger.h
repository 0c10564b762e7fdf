#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "parcel/ledger/ledger.h"

namespace parcel {
namespace ledger {

/**
 * @brief Ledger backed by one JSON document per job
 *
 * Layout: <root>/jobs/<handle>.json. Every write goes to a temporary
 * file that is renamed over the document, so readers never observe a
 * partially written record. Updates are serialized within the process
 * only; separate processes sharing a root need external claiming.
 */
class JsonFileLedger : public Ledger {
public:
    /**
     * @brief Open (creating if needed) a ledger rooted at a directory
     */
    static arrow::Result<std::shared_ptr<JsonFileLedger>> Open(const std::string& root);

    ~JsonFileLedger() override = default;

    arrow::Result<JobRecord> GetJob(const std::string& handle) override;
    arrow::Status UpdateJob(const std::string& handle, const JobUpdate& update) override;
    arrow::Status CreateJob(const JobRecord& record) override;

    const std::filesystem::path& root() const { return root_; }

private:
    explicit JsonFileLedger(std::filesystem::path root);

    arrow::Result<std::filesystem::path> DocumentPath(const std::string& handle) const;
    arrow::Result<JobRecord> ReadDocument(const std::string& handle) const;
    arrow::Status WriteDocument(const JobRecord& record) const;

    std::filesystem::path root_;
    std::mutex mutex_;
};

} // namespace ledger
} // namespace parcel
