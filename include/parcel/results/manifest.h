#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <nlohmann/json.hpp>
#include "parcel/common/common_types.h"
#include "parcel/common/config.h"
#include "parcel/common/time_util.h"

namespace parcel {
namespace results {

/**
 * @brief One persisted output part
 */
struct PartDescriptor {
    int64_t index = 0;
    std::string path;
    int64_t row_count = 0;
    int64_t approx_size_bytes = 0;

    bool operator==(const PartDescriptor& other) const = default;
};

struct WriteSettings {
    std::string compression = "zstd";
    int compression_level = 1;
    bool write_statistics = false;

    static WriteSettings FromConfig(const ExecutorConfig& config);
};

/**
 * @brief Description of a job's complete result set
 */
struct Manifest {
    std::vector<PartDescriptor> parts;
    int64_t total_parts = 0;
    int64_t total_rows = 0;
    int64_t total_size_estimate = 0;
    WriteSettings settings;
    std::vector<ColumnDescriptor> columns;
    Timestamp created_at;

    /**
     * @brief Serialize to the manifest.json layout
     *
     * Keys: parts[{path, rows, approx_size}], total_parts, total_rows,
     * total_size_estimate, compression, compression_level,
     * write_statistics, columns[{name, type}], created_at.
     */
    nlohmann::ordered_json ToJson() const;
    std::string ToJsonString() const;

    /**
     * @brief Parse manifest.json; part indices are taken from array order
     */
    static arrow::Result<Manifest> FromJson(const std::string& text);
};

/**
 * @brief Pure aggregation of written parts into a Manifest
 */
class ManifestBuilder {
public:
    static Manifest Build(std::vector<PartDescriptor> parts,
                          std::vector<ColumnDescriptor> columns,
                          const WriteSettings& settings,
                          Timestamp created_at = Now());
};

} // namespace results
} // namespace parcel
