#include "parcel/results/result_paths.h"

#include <iomanip>
#include <sstream>

namespace parcel {
namespace results {

std::string ResultPaths::PartPath(const std::string& bucket, const std::string& handle,
                                  int64_t index, const std::string& extension) {
    std::ostringstream oss;
    oss << bucket << '/' << handle << "/part_"
        << std::setw(4) << std::setfill('0') << index
        << '.' << extension;
    return oss.str();
}

std::string ResultPaths::ManifestPath(const std::string& bucket, const std::string& handle) {
    return bucket + "/" + handle + "/manifest.json";
}

} // namespace results
} // namespace parcel
