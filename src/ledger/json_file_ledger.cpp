#include "parcel/ledger/json_file_ledger.h"

#include <fstream>
#include <system_error>
#include "parcel/common/logging.h"
#include "parcel/common/status.h"

namespace parcel {
namespace ledger {

PARCEL_LOG_TAG(JsonFileLedger);

namespace fs = std::filesystem;

JsonFileLedger::JsonFileLedger(fs::path root) : root_(std::move(root)) {}

arrow::Result<std::shared_ptr<JsonFileLedger>> JsonFileLedger::Open(const std::string& root) {
    std::error_code ec;
    fs::create_directories(fs::path(root) / "jobs", ec);
    if (ec) {
        return arrow::Status::IOError("Cannot create ledger directory ", root, ": ", ec.message());
    }
    PARCEL_LOG_DEBUG(JsonFileLedger) << "Opened ledger at " << root;
    return std::shared_ptr<JsonFileLedger>(new JsonFileLedger(root));
}

arrow::Result<fs::path> JsonFileLedger::DocumentPath(const std::string& handle) const {
    if (handle.empty() || handle == "." || handle == ".." ||
        handle.find('/') != std::string::npos || handle.find('\\') != std::string::npos) {
        return arrow::Status::Invalid("Job handle is not a valid document name: '", handle, "'");
    }
    return root_ / "jobs" / (handle + ".json");
}

arrow::Result<JobRecord> JsonFileLedger::ReadDocument(const std::string& handle) const {
    ARROW_ASSIGN_OR_RAISE(auto path, DocumentPath(handle));

    std::ifstream in(path);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return NotFoundError("No job found for handle: " + handle);
        }
        return arrow::Status::IOError("Cannot read job document ", path.string());
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        return arrow::Status::Invalid("Corrupt job document ", path.string(), ": ", e.what());
    }

    ARROW_ASSIGN_OR_RAISE(auto record, JobRecordFromJson(json));
    record.handle = handle;
    return record;
}

arrow::Status JsonFileLedger::WriteDocument(const JobRecord& record) const {
    ARROW_ASSIGN_OR_RAISE(auto path, DocumentPath(record.handle));
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            return arrow::Status::IOError("Cannot write job document ", tmp_path.string());
        }
        out << JobRecordToJson(record).dump(2);
        out.flush();
        if (!out) {
            return arrow::Status::IOError("Short write on job document ", tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        return arrow::Status::IOError("Cannot publish job document ", path.string(), ": ",
                                      ec.message());
    }
    return arrow::Status::OK();
}

arrow::Result<JobRecord> JsonFileLedger::GetJob(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadDocument(handle);
}

arrow::Status JsonFileLedger::UpdateJob(const std::string& handle, const JobUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    ARROW_ASSIGN_OR_RAISE(auto record, ReadDocument(handle));
    ApplyUpdate(update, Now(), &record);
    return WriteDocument(record);
}

arrow::Status JsonFileLedger::CreateJob(const JobRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    ARROW_ASSIGN_OR_RAISE(auto path, DocumentPath(record.handle));

    std::error_code ec;
    if (fs::exists(path, ec)) {
        return arrow::Status::AlreadyExists("Job already exists: ", record.handle);
    }

    JobRecord stamped = record;
    stamped.updated_at = Now();
    return WriteDocument(stamped);
}

} // namespace ledger
} // namespace parcel
