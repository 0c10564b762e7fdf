#include "parcel/engine/duckdb_engine.h"

#include <arrow/util/checked_cast.h>

namespace parcel {
namespace engine {

namespace {

using duckdb::LogicalTypeId;

// One-to-one pairs; parameterized types (decimal, timestamp) are handled
// separately in each direction.
struct ScalarMapping {
    LogicalTypeId duck_id;
    std::shared_ptr<arrow::DataType> arrow_type;
};

const std::vector<ScalarMapping>& ScalarMappings() {
    static const std::vector<ScalarMapping> mappings = {
        {LogicalTypeId::BOOLEAN,   arrow::boolean()},
        {LogicalTypeId::TINYINT,   arrow::int8()},
        {LogicalTypeId::SMALLINT,  arrow::int16()},
        {LogicalTypeId::INTEGER,   arrow::int32()},
        {LogicalTypeId::BIGINT,    arrow::int64()},
        {LogicalTypeId::UTINYINT,  arrow::uint8()},
        {LogicalTypeId::USMALLINT, arrow::uint16()},
        {LogicalTypeId::UINTEGER,  arrow::uint32()},
        {LogicalTypeId::UBIGINT,   arrow::uint64()},
        {LogicalTypeId::FLOAT,     arrow::float32()},
        {LogicalTypeId::DOUBLE,    arrow::float64()},
        {LogicalTypeId::VARCHAR,   arrow::utf8()},
        {LogicalTypeId::BLOB,      arrow::binary()},
        {LogicalTypeId::DATE,      arrow::date32()},
        {LogicalTypeId::TIME,      arrow::time64(arrow::TimeUnit::MICRO)},
    };
    return mappings;
}

constexpr int kMaxDecimalWidth = 38;

} // namespace

arrow::Result<std::shared_ptr<arrow::DataType>>
TypeConverter::DuckDBToArrow(const duckdb::LogicalType& duck_type) {
    for (const auto& mapping : ScalarMappings()) {
        if (mapping.duck_id == duck_type.id()) {
            return mapping.arrow_type;
        }
    }

    switch (duck_type.id()) {
        case LogicalTypeId::HUGEINT:
            // SUM(BIGINT) and friends; exact as a scale-0 decimal
            return arrow::decimal128(kMaxDecimalWidth, 0);
        case LogicalTypeId::DECIMAL:
            return arrow::decimal128(duckdb::DecimalType::GetWidth(duck_type),
                                     duckdb::DecimalType::GetScale(duck_type));
        case LogicalTypeId::TIMESTAMP:
            return arrow::timestamp(arrow::TimeUnit::MICRO);
        case LogicalTypeId::TIMESTAMP_TZ:
            return arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
        default:
            return arrow::Status::NotImplemented(
                "No Arrow mapping for DuckDB type ", duck_type.ToString());
    }
}

arrow::Result<duckdb::LogicalType>
TypeConverter::ArrowToDuckDB(const std::shared_ptr<arrow::DataType>& arrow_type) {
    using arrow::internal::checked_cast;

    for (const auto& mapping : ScalarMappings()) {
        if (mapping.arrow_type->Equals(*arrow_type)) {
            return duckdb::LogicalType(mapping.duck_id);
        }
    }

    switch (arrow_type->id()) {
        case arrow::Type::DECIMAL128: {
            const auto& decimal = checked_cast<const arrow::Decimal128Type&>(*arrow_type);
            return duckdb::LogicalType::DECIMAL(static_cast<uint8_t>(decimal.precision()),
                                                static_cast<uint8_t>(decimal.scale()));
        }
        case arrow::Type::TIMESTAMP: {
            // DuckDB keeps microseconds; other units are rescaled on load
            const auto& ts = checked_cast<const arrow::TimestampType&>(*arrow_type);
            if (ts.timezone().empty()) {
                return duckdb::LogicalType(LogicalTypeId::TIMESTAMP);
            }
            return duckdb::LogicalType(LogicalTypeId::TIMESTAMP_TZ);
        }
        default:
            return arrow::Status::NotImplemented(
                "No DuckDB mapping for Arrow type ", arrow_type->ToString());
    }
}

arrow::Result<std::shared_ptr<arrow::Schema>>
TypeConverter::DuckDBSchemaToArrow(const std::vector<duckdb::LogicalType>& duck_types,
                                   const std::vector<std::string>& column_names) {
    if (duck_types.size() != column_names.size()) {
        return arrow::Status::Invalid("Result has ", duck_types.size(), " types but ",
                                      column_names.size(), " column names");
    }

    arrow::FieldVector fields;
    fields.reserve(duck_types.size());
    for (size_t i = 0; i < duck_types.size(); ++i) {
        auto converted = DuckDBToArrow(duck_types[i]);
        if (!converted.ok()) {
            return converted.status().WithMessage("Column '", column_names[i], "': ",
                                                  converted.status().message());
        }
        fields.push_back(arrow::field(column_names[i], *converted));
    }
    return arrow::schema(std::move(fields));
}

} // namespace engine
} // namespace parcel
