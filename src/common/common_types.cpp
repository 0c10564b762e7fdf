#include "parcel/common/common_types.h"

#include <arrow/type.h>

namespace parcel {

std::vector<ColumnDescriptor> ColumnsFromSchema(const arrow::Schema& schema) {
    std::vector<ColumnDescriptor> columns;
    columns.reserve(schema.num_fields());
    for (const auto& field : schema.fields()) {
        columns.push_back({field->name(), field->type()->ToString()});
    }
    return columns;
}

} // namespace parcel
