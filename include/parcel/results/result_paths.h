#pragma once

#include <cstdint>
#include <string>

namespace parcel {
namespace results {

/**
 * @brief Object paths of one job's result set
 *
 *   {bucket}/{handle}/part_0000.parquet
 *   {bucket}/{handle}/manifest.json
 *
 * Part indices are zero-padded to at least four digits.
 */
struct ResultPaths {
    static std::string PartPath(const std::string& bucket, const std::string& handle,
                                int64_t index, const std::string& extension = "parquet");

    static std::string ManifestPath(const std::string& bucket, const std::string& handle);
};

} // namespace results
} // namespace parcel
