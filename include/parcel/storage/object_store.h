#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>

namespace parcel {
namespace storage {

/**
 * @brief Destination for result parts and manifests
 *
 * Paths are "{bucket}/{key...}" with '/' separators. A successful
 * WriteBytes means the object is durable and readable at that path.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual arrow::Status WriteBytes(const std::string& path,
                                     const std::shared_ptr<arrow::Buffer>& bytes) = 0;

    virtual std::string GetName() const = 0;
};

// In-memory object store (for testing)
class InMemoryObjectStore : public ObjectStore {
public:
    InMemoryObjectStore() = default;
    ~InMemoryObjectStore() override = default;

    arrow::Status WriteBytes(const std::string& path,
                             const std::shared_ptr<arrow::Buffer>& bytes) override;

    std::string GetName() const override { return "InMemoryObjectStore"; }

    /**
     * @brief Read back an object; KeyError when absent
     */
    arrow::Result<std::shared_ptr<arrow::Buffer>> Get(const std::string& path) const;

    bool Contains(const std::string& path) const;

    // Sorted
    std::vector<std::string> ListPaths() const;

    // Every path written, in write order, including overwrites
    std::vector<std::string> WriteLog() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> objects_;
    std::vector<std::string> write_log_;
};

} // namespace storage
} // namespace parcel
