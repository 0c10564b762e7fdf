#pragma once

#include <map>
#include <string>
#include <vector>
#include <arrow/type_fwd.h>

namespace parcel {

/**
 * @brief One result column as recorded in the ledger and the manifest
 */
struct ColumnDescriptor {
    std::string name;
    std::string type;  // Arrow type string, e.g. "int64", "string"

    bool operator==(const ColumnDescriptor& other) const = default;
};

// Engine-supplied statistics, opaque to the pipeline
using Telemetry = std::map<std::string, std::string>;

std::vector<ColumnDescriptor> ColumnsFromSchema(const arrow::Schema& schema);

} // namespace parcel
