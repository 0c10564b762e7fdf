#include "parcel/storage/object_store.h"

#include <algorithm>

namespace parcel {
namespace storage {

arrow::Status InMemoryObjectStore::WriteBytes(const std::string& path,
                                              const std::shared_ptr<arrow::Buffer>& bytes) {
    if (path.empty()) {
        return arrow::Status::Invalid("Object path must not be empty");
    }
    if (!bytes) {
        return arrow::Status::Invalid("No data for object ", path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    objects_[path] = bytes;
    write_log_.push_back(path);
    return arrow::Status::OK();
}

arrow::Result<std::shared_ptr<arrow::Buffer>>
InMemoryObjectStore::Get(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(path);
    if (it == objects_.end()) {
        return arrow::Status::KeyError("No object at ", path);
    }
    return it->second;
}

bool InMemoryObjectStore::Contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(path) > 0;
}

std::vector<std::string> InMemoryObjectStore::ListPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> paths;
    paths.reserve(objects_.size());
    for (const auto& [path, buffer] : objects_) {
        paths.push_back(path);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

std::vector<std::string> InMemoryObjectStore::WriteLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_log_;
}

} // namespace storage
} // namespace parcel
