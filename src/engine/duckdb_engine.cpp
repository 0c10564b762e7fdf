#include "parcel/engine/duckdb_engine.h"

#include <chrono>
#include <string_view>
#include <arrow/builder.h>
#include <arrow/util/checked_cast.h>
#include <arrow/util/decimal.h>
#include "parcel/common/logging.h"

namespace parcel {
namespace engine {

PARCEL_LOG_TAG(DuckDBEngine);

namespace {

template <typename SourceType, typename BuilderType, typename Convert>
arrow::Result<std::shared_ptr<arrow::Array>> BuildFromFlatVector(
    duckdb::Vector& vec, duckdb::idx_t count, BuilderType& builder, Convert convert) {

    auto data = duckdb::FlatVector::GetData<SourceType>(vec);
    auto& validity = duckdb::FlatVector::Validity(vec);
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(count)));
    for (duckdb::idx_t i = 0; i < count; i++) {
        if (validity.RowIsValid(i)) {
            ARROW_RETURN_NOT_OK(builder.Append(convert(data[i])));
        } else {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
        }
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

template <typename SourceType, typename BuilderType>
arrow::Result<std::shared_ptr<arrow::Array>> BuildFromFlatVector(
    duckdb::Vector& vec, duckdb::idx_t count, BuilderType& builder) {
    return BuildFromFlatVector<SourceType>(vec, count, builder,
                                           [](SourceType v) { return v; });
}

std::string_view AsStringView(const duckdb::string_t& s) {
    return std::string_view(s.GetData(), s.GetSize());
}

arrow::Decimal128 HugeintToDecimal(const duckdb::hugeint_t& h) {
    return arrow::Decimal128(h.upper, h.lower);
}

arrow::Result<std::shared_ptr<arrow::Array>> ConvertDecimalVector(
    duckdb::Vector& vec, duckdb::idx_t count,
    const std::shared_ptr<arrow::DataType>& arrow_type) {

    arrow::Decimal128Builder builder(arrow_type, arrow::default_memory_pool());
    auto widen = [](auto v) { return arrow::Decimal128(static_cast<int64_t>(v)); };

    switch (vec.GetType().InternalType()) {
        case duckdb::PhysicalType::INT16:
            return BuildFromFlatVector<int16_t>(vec, count, builder, widen);
        case duckdb::PhysicalType::INT32:
            return BuildFromFlatVector<int32_t>(vec, count, builder, widen);
        case duckdb::PhysicalType::INT64:
            return BuildFromFlatVector<int64_t>(vec, count, builder, widen);
        case duckdb::PhysicalType::INT128:
            return BuildFromFlatVector<duckdb::hugeint_t>(vec, count, builder, HugeintToDecimal);
        default:
            return arrow::Status::NotImplemented(
                "Decimal storage not supported: " + vec.GetType().ToString());
    }
}

std::string QuoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

arrow::Result<duckdb::Value> ArrowValueAt(const arrow::Array& array, int64_t row,
                                          const duckdb::LogicalType& duck_type) {
    using arrow::internal::checked_cast;

    if (array.IsNull(row)) {
        return duckdb::Value(duck_type);
    }

    switch (array.type_id()) {
        case arrow::Type::BOOL:
            return duckdb::Value::BOOLEAN(checked_cast<const arrow::BooleanArray&>(array).Value(row));
        case arrow::Type::INT8:
            return duckdb::Value::TINYINT(checked_cast<const arrow::Int8Array&>(array).Value(row));
        case arrow::Type::INT16:
            return duckdb::Value::SMALLINT(checked_cast<const arrow::Int16Array&>(array).Value(row));
        case arrow::Type::INT32:
            return duckdb::Value::INTEGER(checked_cast<const arrow::Int32Array&>(array).Value(row));
        case arrow::Type::INT64:
            return duckdb::Value::BIGINT(checked_cast<const arrow::Int64Array&>(array).Value(row));
        case arrow::Type::UINT8:
            return duckdb::Value::UTINYINT(checked_cast<const arrow::UInt8Array&>(array).Value(row));
        case arrow::Type::UINT16:
            return duckdb::Value::USMALLINT(checked_cast<const arrow::UInt16Array&>(array).Value(row));
        case arrow::Type::UINT32:
            return duckdb::Value::UINTEGER(checked_cast<const arrow::UInt32Array&>(array).Value(row));
        case arrow::Type::UINT64:
            return duckdb::Value::UBIGINT(checked_cast<const arrow::UInt64Array&>(array).Value(row));
        case arrow::Type::FLOAT:
            return duckdb::Value::FLOAT(checked_cast<const arrow::FloatArray&>(array).Value(row));
        case arrow::Type::DOUBLE:
            return duckdb::Value::DOUBLE(checked_cast<const arrow::DoubleArray&>(array).Value(row));
        case arrow::Type::STRING:
            return duckdb::Value(checked_cast<const arrow::StringArray&>(array).GetString(row));
        case arrow::Type::DATE32:
            return duckdb::Value::DATE(
                duckdb::date_t(checked_cast<const arrow::Date32Array&>(array).Value(row)));
        case arrow::Type::TIMESTAMP: {
            const auto& ts_array = checked_cast<const arrow::TimestampArray&>(array);
            const auto& ts_type = checked_cast<const arrow::TimestampType&>(*array.type());
            int64_t value = ts_array.Value(row);
            switch (ts_type.unit()) {
                case arrow::TimeUnit::SECOND: value *= 1000000; break;
                case arrow::TimeUnit::MILLI:  value *= 1000; break;
                case arrow::TimeUnit::MICRO:  break;
                case arrow::TimeUnit::NANO:   value /= 1000; break;
            }
            if (duck_type.id() == duckdb::LogicalTypeId::TIMESTAMP_TZ) {
                return duckdb::Value::TIMESTAMPTZ(duckdb::timestamp_tz_t(value));
            }
            return duckdb::Value::TIMESTAMP(duckdb::timestamp_t(value));
        }
        case arrow::Type::TIME64: {
            const auto& time_array = checked_cast<const arrow::Time64Array&>(array);
            return duckdb::Value::TIME(duckdb::dtime_t(time_array.Value(row)));
        }
        case arrow::Type::DECIMAL128: {
            const auto& decimal_array = checked_cast<const arrow::Decimal128Array&>(array);
            arrow::Decimal128 decimal(decimal_array.GetValue(row));
            auto width = duckdb::DecimalType::GetWidth(duck_type);
            auto scale = duckdb::DecimalType::GetScale(duck_type);
            if (width <= duckdb::Decimal::MAX_WIDTH_INT64) {
                return duckdb::Value::DECIMAL(static_cast<int64_t>(decimal.low_bits()),
                                              width, scale);
            }
            duckdb::hugeint_t hugeint;
            hugeint.lower = decimal.low_bits();
            hugeint.upper = decimal.high_bits();
            return duckdb::Value::DECIMAL(hugeint, width, scale);
        }
        case arrow::Type::BINARY: {
            auto view = checked_cast<const arrow::BinaryArray&>(array).GetView(row);
            return duckdb::Value::BLOB(reinterpret_cast<duckdb::const_data_ptr_t>(view.data()),
                                       view.size());
        }
        default:
            return arrow::Status::NotImplemented(
                "Arrow type not yet supported: " + array.type()->ToString());
    }
}

/**
 * @brief Streams a DuckDB query result chunk by chunk
 *
 * Owns the connection the query runs on; the result is released first.
 */
class DuckDBResultStream : public ResultStream {
public:
    DuckDBResultStream(std::unique_ptr<duckdb::Connection> connection,
                       duckdb::unique_ptr<duckdb::QueryResult> result,
                       std::shared_ptr<arrow::Schema> schema)
        : connection_(std::move(connection))
        , result_(std::move(result))
        , schema_(std::move(schema))
        , start_(std::chrono::steady_clock::now()) {
    }

    arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const override {
        return schema_;
    }

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override {
        if (exhausted_) {
            return nullptr;
        }

        try {
            auto chunk = result_->Fetch();
            if (result_->HasError()) {
                return arrow::Status::Invalid("Query error: " + result_->GetError());
            }
            if (!chunk || chunk->size() == 0) {
                Finish();
                return nullptr;
            }

            chunk->Flatten();
            std::vector<std::shared_ptr<arrow::Array>> arrays;
            arrays.reserve(chunk->ColumnCount());
            for (duckdb::idx_t col_idx = 0; col_idx < chunk->ColumnCount(); col_idx++) {
                ARROW_ASSIGN_OR_RAISE(
                    auto array,
                    ConvertVectorToArrow(chunk->data[col_idx], chunk->size(),
                                         schema_->field(static_cast<int>(col_idx))->type()));
                arrays.push_back(std::move(array));
            }

            auto batch = arrow::RecordBatch::Make(
                schema_, static_cast<int64_t>(chunk->size()), std::move(arrays));
            stats_.rows_returned += batch->num_rows();
            stats_.batches_returned++;
            return batch;
        } catch (const std::exception& e) {
            return arrow::Status::IOError(
                "Failed to fetch query result: " + std::string(e.what()));
        }
    }

    Telemetry GetTelemetry() const override {
        return {
            {"rows_returned", std::to_string(stats_.rows_returned)},
            {"chunks_fetched", std::to_string(stats_.batches_returned)},
            {"execution_time_ms", std::to_string(stats_.execution_time_ms)},
        };
    }

private:
    void Finish() {
        exhausted_ = true;
        stats_.execution_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

    std::unique_ptr<duckdb::Connection> connection_;
    duckdb::unique_ptr<duckdb::QueryResult> result_;
    std::shared_ptr<arrow::Schema> schema_;
    std::chrono::steady_clock::time_point start_;
    Statistics stats_;
    bool exhausted_ = false;
};

} // namespace

arrow::Result<std::shared_ptr<arrow::Array>> ConvertVectorToArrow(
    duckdb::Vector& vec, duckdb::idx_t count,
    const std::shared_ptr<arrow::DataType>& arrow_type) {

    using duckdb::LogicalTypeId;
    auto pool = arrow::default_memory_pool();

    switch (vec.GetType().id()) {
        case LogicalTypeId::BOOLEAN: {
            arrow::BooleanBuilder builder;
            return BuildFromFlatVector<bool>(vec, count, builder);
        }
        case LogicalTypeId::TINYINT: {
            arrow::Int8Builder builder;
            return BuildFromFlatVector<int8_t>(vec, count, builder);
        }
        case LogicalTypeId::SMALLINT: {
            arrow::Int16Builder builder;
            return BuildFromFlatVector<int16_t>(vec, count, builder);
        }
        case LogicalTypeId::INTEGER: {
            arrow::Int32Builder builder;
            return BuildFromFlatVector<int32_t>(vec, count, builder);
        }
        case LogicalTypeId::BIGINT: {
            arrow::Int64Builder builder;
            return BuildFromFlatVector<int64_t>(vec, count, builder);
        }
        case LogicalTypeId::UTINYINT: {
            arrow::UInt8Builder builder;
            return BuildFromFlatVector<uint8_t>(vec, count, builder);
        }
        case LogicalTypeId::USMALLINT: {
            arrow::UInt16Builder builder;
            return BuildFromFlatVector<uint16_t>(vec, count, builder);
        }
        case LogicalTypeId::UINTEGER: {
            arrow::UInt32Builder builder;
            return BuildFromFlatVector<uint32_t>(vec, count, builder);
        }
        case LogicalTypeId::UBIGINT: {
            arrow::UInt64Builder builder;
            return BuildFromFlatVector<uint64_t>(vec, count, builder);
        }
        case LogicalTypeId::HUGEINT: {
            arrow::Decimal128Builder builder(arrow_type, pool);
            return BuildFromFlatVector<duckdb::hugeint_t>(vec, count, builder, HugeintToDecimal);
        }
        case LogicalTypeId::DECIMAL:
            return ConvertDecimalVector(vec, count, arrow_type);
        case LogicalTypeId::FLOAT: {
            arrow::FloatBuilder builder;
            return BuildFromFlatVector<float>(vec, count, builder);
        }
        case LogicalTypeId::DOUBLE: {
            arrow::DoubleBuilder builder;
            return BuildFromFlatVector<double>(vec, count, builder);
        }
        case LogicalTypeId::VARCHAR: {
            arrow::StringBuilder builder;
            return BuildFromFlatVector<duckdb::string_t>(vec, count, builder, AsStringView);
        }
        case LogicalTypeId::BLOB: {
            arrow::BinaryBuilder builder;
            return BuildFromFlatVector<duckdb::string_t>(vec, count, builder, AsStringView);
        }
        case LogicalTypeId::DATE: {
            arrow::Date32Builder builder;
            return BuildFromFlatVector<duckdb::date_t>(
                vec, count, builder, [](duckdb::date_t d) { return d.days; });
        }
        case LogicalTypeId::TIMESTAMP:
        case LogicalTypeId::TIMESTAMP_TZ: {
            arrow::TimestampBuilder builder(arrow_type, pool);
            return BuildFromFlatVector<duckdb::timestamp_t>(
                vec, count, builder, [](duckdb::timestamp_t ts) { return ts.value; });
        }
        case LogicalTypeId::TIME: {
            arrow::Time64Builder builder(arrow_type, pool);
            return BuildFromFlatVector<duckdb::dtime_t>(
                vec, count, builder, [](duckdb::dtime_t t) { return t.micros; });
        }
        default:
            return arrow::Status::NotImplemented(
                "Vector type not yet supported: " + vec.GetType().ToString());
    }
}

DuckDBQueryEngine::DuckDBQueryEngine(std::unique_ptr<duckdb::DuckDB> database)
    : database_(std::move(database)) {
}

DuckDBQueryEngine::~DuckDBQueryEngine() = default;

arrow::Result<std::shared_ptr<DuckDBQueryEngine>>
DuckDBQueryEngine::Create(const DuckDBEngineConfig& config) {
    try {
        auto database = std::make_unique<duckdb::DuckDB>(config.database_path);
        PARCEL_LOG_DEBUG(DuckDBEngine) << "Opened DuckDB database " << config.database_path;
        return std::shared_ptr<DuckDBQueryEngine>(new DuckDBQueryEngine(std::move(database)));
    } catch (const std::exception& e) {
        return arrow::Status::IOError(
            "Failed to open DuckDB database: " + std::string(e.what()));
    }
}

arrow::Result<std::unique_ptr<ResultStream>>
DuckDBQueryEngine::Execute(const std::string& sql) {
    try {
        auto connection = std::make_unique<duckdb::Connection>(*database_);
        auto result = connection->SendQuery(sql);
        if (result->HasError()) {
            return arrow::Status::Invalid("Query error: " + result->GetError());
        }

        ARROW_ASSIGN_OR_RAISE(
            auto schema,
            TypeConverter::DuckDBSchemaToArrow(result->types, result->names));

        return std::unique_ptr<ResultStream>(new DuckDBResultStream(
            std::move(connection), std::move(result), std::move(schema)));
    } catch (const std::exception& e) {
        return arrow::Status::IOError(
            "Failed to execute query: " + std::string(e.what()));
    }
}

arrow::Status DuckDBQueryEngine::RegisterTable(
    const std::string& table_name,
    const std::shared_ptr<arrow::Table>& table) {

    std::vector<duckdb::LogicalType> duck_types;
    std::string ddl = "CREATE OR REPLACE TABLE " + QuoteIdentifier(table_name) + " (";
    for (int i = 0; i < table->num_columns(); i++) {
        const auto& field = table->schema()->field(i);
        ARROW_ASSIGN_OR_RAISE(auto duck_type, TypeConverter::ArrowToDuckDB(field->type()));
        if (i > 0) {
            ddl += ", ";
        }
        ddl += QuoteIdentifier(field->name()) + " " + duck_type.ToString();
        duck_types.push_back(std::move(duck_type));
    }
    ddl += ")";

    ARROW_ASSIGN_OR_RAISE(auto combined, table->CombineChunks());

    try {
        duckdb::Connection connection(*database_);
        auto created = connection.Query(ddl);
        if (created->HasError()) {
            return arrow::Status::Invalid("Failed to create table: " + created->GetError());
        }

        duckdb::Appender appender(connection, table_name);
        for (int64_t row = 0; row < combined->num_rows(); row++) {
            appender.BeginRow();
            for (int col = 0; col < combined->num_columns(); col++) {
                ARROW_ASSIGN_OR_RAISE(
                    auto value,
                    ArrowValueAt(*combined->column(col)->chunk(0), row, duck_types[col]));
                appender.Append(std::move(value));
            }
            appender.EndRow();
        }
        appender.Close();
    } catch (const std::exception& e) {
        return arrow::Status::IOError(
            "Failed to register table: " + std::string(e.what()));
    }

    PARCEL_LOG_DEBUG(DuckDBEngine) << "Registered table " << table_name
                                   << " (" << table->num_rows() << " rows)";
    return arrow::Status::OK();
}

} // namespace engine
} // namespace parcel
