#include "parcel/storage/filesystem_object_store.h"

#include <arrow/filesystem/path_util.h>
#include <arrow/io/interfaces.h>
#include "parcel/common/logging.h"

namespace parcel {
namespace storage {

PARCEL_LOG_TAG(ObjectStore);

FileSystemObjectStore::FileSystemObjectStore(
    std::shared_ptr<arrow::fs::FileSystem> filesystem,
    std::string base_path)
    : filesystem_(std::move(filesystem))
    , base_path_(std::move(base_path)) {
}

arrow::Result<std::shared_ptr<FileSystemObjectStore>>
FileSystemObjectStore::FromUri(const std::string& uri) {
    std::string base_path;
    ARROW_ASSIGN_OR_RAISE(auto filesystem, arrow::fs::FileSystemFromUriOrPath(uri, &base_path));
    return std::make_shared<FileSystemObjectStore>(std::move(filesystem), std::move(base_path));
}

std::string FileSystemObjectStore::ResolvePath(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    return arrow::fs::internal::ConcatAbstractPath(base_path_, path);
}

std::string FileSystemObjectStore::GetName() const {
    return "FileSystemObjectStore(" + filesystem_->type_name() + ":" + base_path_ + ")";
}

arrow::Status FileSystemObjectStore::EnsureParentDirectory(const std::string& full_path) {
    auto parent = arrow::fs::internal::GetAbstractPathParent(full_path).first;
    if (parent.empty()) {
        return arrow::Status::OK();
    }

    auto created = filesystem_->CreateDir(parent, /*recursive=*/true);
    if (created.ok()) {
        return arrow::Status::OK();
    }

    // Object stores may refuse to create a bucket that is already there
    auto info = filesystem_->GetFileInfo(parent);
    if (!info.ok()) {
        return created;
    }
    if (info->type() == arrow::fs::FileType::Directory) {
        PARCEL_LOG_DEBUG(ObjectStore) << "Directory " << parent
                                      << " already exists: " << created.message();
        return arrow::Status::OK();
    }
    return created;
}

arrow::Status FileSystemObjectStore::WriteBytes(const std::string& path,
                                                const std::shared_ptr<arrow::Buffer>& bytes) {
    if (path.empty()) {
        return arrow::Status::Invalid("Object path must not be empty");
    }
    if (!bytes) {
        return arrow::Status::Invalid("No data for object ", path);
    }

    auto full_path = ResolvePath(path);
    ARROW_RETURN_NOT_OK(EnsureParentDirectory(full_path));

    ARROW_ASSIGN_OR_RAISE(auto out, filesystem_->OpenOutputStream(full_path));
    auto written = out->Write(bytes);
    auto closed = out->Close();
    ARROW_RETURN_NOT_OK(written);
    ARROW_RETURN_NOT_OK(closed);

    PARCEL_LOG_TRACE(ObjectStore) << "Wrote " << bytes->size() << " bytes to " << full_path;
    return arrow::Status::OK();
}

} // namespace storage
} // namespace parcel
