#pragma once

#include <memory>
#include <string>
#include <arrow/api.h>
#include <arrow/result.h>
#include <parquet/properties.h>
#include "parcel/common/config.h"

namespace parcel {
namespace storage {

struct PartEncodingOptions {
    std::string compression = "zstd";
    int compression_level = 1;
    bool write_statistics = false;
    std::string data_page_version = "2.0";

    static PartEncodingOptions FromConfig(const ExecutorConfig& config);
};

/**
 * @brief Encodes a flush unit into an in-memory Parquet file
 *
 * The Arrow schema is stored in the file metadata so readers get back
 * the exact column types.
 */
class ParquetPartEncoder {
public:
    static arrow::Result<std::shared_ptr<ParquetPartEncoder>>
        Make(const PartEncodingOptions& options = PartEncodingOptions());

    arrow::Result<std::shared_ptr<arrow::Buffer>> Encode(const arrow::Table& table) const;

    const std::shared_ptr<parquet::WriterProperties>& properties() const { return properties_; }

private:
    ParquetPartEncoder(std::shared_ptr<parquet::WriterProperties> properties,
                       std::shared_ptr<parquet::ArrowWriterProperties> arrow_properties);

    std::shared_ptr<parquet::WriterProperties> properties_;
    std::shared_ptr<parquet::ArrowWriterProperties> arrow_properties_;
};

} // namespace storage
} // namespace parcel
