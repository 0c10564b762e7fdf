#pragma once

#include <memory>
#include <string>
#include <arrow/filesystem/filesystem.h>
#include "parcel/storage/object_store.h"

namespace parcel {
namespace storage {

/**
 * @brief ObjectStore over an arrow::fs::FileSystem
 *
 * Works with any filesystem Arrow was built with: local paths,
 * s3:// and gs:// URIs. Object paths are resolved under base_path.
 */
class FileSystemObjectStore : public ObjectStore {
public:
    FileSystemObjectStore(std::shared_ptr<arrow::fs::FileSystem> filesystem,
                          std::string base_path);
    ~FileSystemObjectStore() override = default;

    /**
     * @brief Build from a URI or local path, e.g. "file:///tmp/results",
     *        "s3://my-bucket/prefix" or "/var/lib/parcel"
     */
    static arrow::Result<std::shared_ptr<FileSystemObjectStore>> FromUri(const std::string& uri);

    arrow::Status WriteBytes(const std::string& path,
                             const std::shared_ptr<arrow::Buffer>& bytes) override;

    std::string GetName() const override;

    std::string ResolvePath(const std::string& path) const;

private:
    // Creating a directory that already exists is not an error
    arrow::Status EnsureParentDirectory(const std::string& full_path);

    std::shared_ptr<arrow::fs::FileSystem> filesystem_;
    std::string base_path_;
};

} // namespace storage
} // namespace parcel
