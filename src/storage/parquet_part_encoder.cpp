#include "parcel/storage/parquet_part_encoder.h"

#include <arrow/io/memory.h>
#include <arrow/util/compression.h>
#include <parquet/arrow/writer.h>

namespace parcel {
namespace storage {

PartEncodingOptions PartEncodingOptions::FromConfig(const ExecutorConfig& config) {
    PartEncodingOptions options;
    options.compression = config.compression;
    options.compression_level = config.compression_level;
    options.write_statistics = config.write_statistics;
    options.data_page_version = config.data_page_version;
    return options;
}

ParquetPartEncoder::ParquetPartEncoder(
    std::shared_ptr<parquet::WriterProperties> properties,
    std::shared_ptr<parquet::ArrowWriterProperties> arrow_properties)
    : properties_(std::move(properties))
    , arrow_properties_(std::move(arrow_properties)) {
}

arrow::Result<std::shared_ptr<ParquetPartEncoder>>
ParquetPartEncoder::Make(const PartEncodingOptions& options) {
    ARROW_ASSIGN_OR_RAISE(auto codec, arrow::util::Codec::GetCompressionType(options.compression));
    if (!arrow::util::Codec::IsAvailable(codec)) {
        return arrow::Status::NotImplemented("Compression codec '", options.compression,
                                             "' is not available in this Arrow build");
    }

    parquet::WriterProperties::Builder builder;
    builder.compression(codec);
    if (arrow::util::Codec::SupportsCompressionLevel(codec)) {
        builder.compression_level(options.compression_level);
    }
    if (options.write_statistics) {
        builder.enable_statistics();
    } else {
        builder.disable_statistics();
    }

    if (options.data_page_version == "2.0") {
        builder.data_page_version(parquet::ParquetDataPageVersion::V2);
    } else if (options.data_page_version == "1.0") {
        builder.data_page_version(parquet::ParquetDataPageVersion::V1);
    } else {
        return arrow::Status::Invalid("Unknown data page version '",
                                      options.data_page_version, "'");
    }
    builder.version(parquet::ParquetVersion::PARQUET_2_6);

    auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    return std::shared_ptr<ParquetPartEncoder>(
        new ParquetPartEncoder(builder.build(), std::move(arrow_properties)));
}

arrow::Result<std::shared_ptr<arrow::Buffer>>
ParquetPartEncoder::Encode(const arrow::Table& table) const {
    ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
    ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(
        table, arrow::default_memory_pool(), sink,
        parquet::DEFAULT_MAX_ROW_GROUP_LENGTH, properties_, arrow_properties_));
    return sink->Finish();
}

} // namespace storage
} // namespace parcel
