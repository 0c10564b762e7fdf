#pragma once

#include <memory>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <arrow/result.h>

#include "duckdb.hpp"

#include "parcel/engine/query_engine.h"

namespace parcel {
namespace engine {

/**
 * @brief Converts between DuckDB and Arrow types
 *
 * HUGEINT and DECIMAL map to decimal128 so aggregates such as SUM(BIGINT)
 * keep their exact value.
 */
class TypeConverter {
public:
    static arrow::Result<std::shared_ptr<arrow::DataType>>
        DuckDBToArrow(const duckdb::LogicalType& duck_type);

    static arrow::Result<duckdb::LogicalType>
        ArrowToDuckDB(const std::shared_ptr<arrow::DataType>& arrow_type);

    static arrow::Result<std::shared_ptr<arrow::Schema>>
        DuckDBSchemaToArrow(const std::vector<duckdb::LogicalType>& duck_types,
                            const std::vector<std::string>& column_names);
};

/**
 * @brief Convert one flattened DuckDB vector to an Arrow array
 */
arrow::Result<std::shared_ptr<arrow::Array>> ConvertVectorToArrow(
    duckdb::Vector& vec, duckdb::idx_t count,
    const std::shared_ptr<arrow::DataType>& arrow_type);

struct DuckDBEngineConfig {
    std::string database_path = ":memory:";  // DuckDB database path
};

/**
 * @brief QueryEngine running statements on an embedded DuckDB database
 *
 * Every Execute opens its own connection and streams the result chunk by
 * chunk, so statements for different jobs can run concurrently.
 *
 * Example:
 *   ARROW_ASSIGN_OR_RAISE(auto engine, DuckDBQueryEngine::Create());
 *   ARROW_ASSIGN_OR_RAISE(auto stream, engine->Execute("SELECT * FROM range(10)"));
 */
class DuckDBQueryEngine : public QueryEngine {
public:
    static arrow::Result<std::shared_ptr<DuckDBQueryEngine>>
        Create(const DuckDBEngineConfig& config = DuckDBEngineConfig());

    ~DuckDBQueryEngine() override;

    arrow::Result<std::unique_ptr<ResultStream>> Execute(const std::string& sql) override;

    /**
     * @brief Copy an Arrow table into a DuckDB table so SQL can query it
     * @param table_name Name to register the table as (replaced if present)
     * @param table Arrow table data
     */
    arrow::Status RegisterTable(const std::string& table_name,
                                const std::shared_ptr<arrow::Table>& table);

private:
    explicit DuckDBQueryEngine(std::unique_ptr<duckdb::DuckDB> database);

    std::unique_ptr<duckdb::DuckDB> database_;
};

} // namespace engine
} // namespace parcel
