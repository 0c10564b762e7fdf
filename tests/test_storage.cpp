#include <gtest/gtest.h>
#include <arrow/api.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/io/memory.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>
#include <fstream>
#include <sstream>

#include "parcel/storage/filesystem_object_store.h"
#include "parcel/storage/object_store.h"
#include "parcel/storage/parquet_part_encoder.h"
#include "test_support.h"

namespace parcel {
namespace storage {

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::shared_ptr<arrow::Table> IdTable(int64_t rows) {
    auto table = arrow::Table::FromRecordBatches({test::MakeIdBatch(0, rows)});
    EXPECT_TRUE(table.ok());
    return *table;
}

// Local filesystem on which directory creation and stat both fail
class UnreachableFileSystem : public arrow::fs::LocalFileSystem {
public:
    using arrow::fs::LocalFileSystem::GetFileInfo;

    arrow::Status CreateDir(const std::string& path, bool recursive) override {
        return arrow::Status::IOError("permission denied creating ", path);
    }

    arrow::Result<arrow::fs::FileInfo> GetFileInfo(const std::string& path) override {
        return arrow::Status::IOError("stat failed for ", path);
    }
};

} // namespace

TEST(InMemoryObjectStoreTest, WriteAndGet) {
    InMemoryObjectStore store;
    ASSERT_TRUE(store.WriteBytes("b/x/manifest.json", arrow::Buffer::FromString("{}")).ok());
    ASSERT_TRUE(store.WriteBytes("b/x/part_0000.parquet", arrow::Buffer::FromString("PAR1")).ok());
    ASSERT_TRUE(store.WriteBytes("b/x/manifest.json", arrow::Buffer::FromString("{\"a\":1}")).ok());

    EXPECT_TRUE(store.Contains("b/x/manifest.json"));
    auto bytes = store.Get("b/x/manifest.json");
    ASSERT_TRUE(bytes.ok());
    EXPECT_EQ((*bytes)->ToString(), "{\"a\":1}");

    EXPECT_TRUE(store.Get("b/x/nope").status().IsKeyError());
    EXPECT_EQ(store.ListPaths(),
              (std::vector<std::string>{"b/x/manifest.json", "b/x/part_0000.parquet"}));
    EXPECT_EQ(store.WriteLog().size(), 3u);
}

class FileSystemObjectStoreTest : public test::TempDirTestBase {};

TEST_F(FileSystemObjectStoreTest, CreatesParentDirectories) {
    auto store = FileSystemObjectStore::FromUri(test_path_);
    ASSERT_TRUE(store.ok()) << store.status().ToString();

    ASSERT_TRUE((*store)->WriteBytes("results/job-1/part_0000.parquet",
                                     arrow::Buffer::FromString("first")).ok());
    ASSERT_TRUE((*store)->WriteBytes("results/job-1/part_0001.parquet",
                                     arrow::Buffer::FromString("second")).ok());

    EXPECT_EQ(ReadFile(test_path_ + "/results/job-1/part_0000.parquet"), "first");
    EXPECT_EQ(ReadFile(test_path_ + "/results/job-1/part_0001.parquet"), "second");
}

TEST_F(FileSystemObjectStoreTest, AcceptsFileUri) {
    auto store = FileSystemObjectStore::FromUri("file://" + test_path_);
    ASSERT_TRUE(store.ok()) << store.status().ToString();
    ASSERT_TRUE((*store)->WriteBytes("m.json", arrow::Buffer::FromString("{}")).ok());
    EXPECT_EQ(ReadFile(test_path_ + "/m.json"), "{}");
}

TEST_F(FileSystemObjectStoreTest, FailsWhenParentIsAFile) {
    {
        std::ofstream out(test_path_ + "/blocker");
        out << "x";
    }
    FileSystemObjectStore store(std::make_shared<arrow::fs::LocalFileSystem>(), test_path_);
    EXPECT_FALSE(store.WriteBytes("blocker/part_0000.parquet",
                                  arrow::Buffer::FromString("data")).ok());
    EXPECT_FALSE(store.WriteBytes("", arrow::Buffer::FromString("data")).ok());
}

TEST_F(FileSystemObjectStoreTest, CreateDirErrorWinsOverStatError) {
    FileSystemObjectStore store(std::make_shared<UnreachableFileSystem>(), test_path_);
    auto written = store.WriteBytes("results/job-1/part_0000.parquet",
                                    arrow::Buffer::FromString("data"));
    ASSERT_FALSE(written.ok());
    EXPECT_NE(written.message().find("permission denied"), std::string::npos)
        << written.ToString();
}

TEST_F(FileSystemObjectStoreTest, NameIncludesBasePath) {
    auto store = FileSystemObjectStore::FromUri(test_path_);
    ASSERT_TRUE(store.ok()) << store.status().ToString();
    auto name = (*store)->GetName();
    EXPECT_NE(name.find("local"), std::string::npos) << name;
    EXPECT_NE(name.find(test_path_), std::string::npos) << name;
}

class ParquetPartEncoderTest : public ::testing::Test {
protected:
    std::unique_ptr<parquet::ParquetFileReader> OpenEncoded(
        const std::shared_ptr<arrow::Buffer>& bytes) {
        return parquet::ParquetFileReader::Open(std::make_shared<arrow::io::BufferReader>(bytes));
    }
};

TEST_F(ParquetPartEncoderTest, DefaultsUseZstdWithoutStatistics) {
    auto encoder = ParquetPartEncoder::Make();
    ASSERT_TRUE(encoder.ok()) << encoder.status().ToString();
    EXPECT_EQ((*encoder)->properties()->data_page_version(), parquet::ParquetDataPageVersion::V2);

    auto bytes = (*encoder)->Encode(*IdTable(100));
    ASSERT_TRUE(bytes.ok()) << bytes.status().ToString();

    auto reader = OpenEncoded(*bytes);
    auto metadata = reader->metadata();
    EXPECT_EQ(metadata->num_rows(), 100);
    auto column = metadata->RowGroup(0)->ColumnChunk(0);
    EXPECT_EQ(column->compression(), arrow::Compression::ZSTD);
    EXPECT_FALSE(column->is_stats_set());
}

TEST_F(ParquetPartEncoderTest, HonoursConfiguredSettings) {
    PartEncodingOptions options;
    options.compression = "snappy";
    options.write_statistics = true;
    options.data_page_version = "1.0";
    auto encoder = ParquetPartEncoder::Make(options);
    ASSERT_TRUE(encoder.ok()) << encoder.status().ToString();
    EXPECT_EQ((*encoder)->properties()->data_page_version(), parquet::ParquetDataPageVersion::V1);

    auto bytes = (*encoder)->Encode(*IdTable(10));
    ASSERT_TRUE(bytes.ok());
    auto column = OpenEncoded(*bytes)->metadata()->RowGroup(0)->ColumnChunk(0);
    EXPECT_EQ(column->compression(), arrow::Compression::SNAPPY);
    EXPECT_TRUE(column->is_stats_set());
}

TEST_F(ParquetPartEncoderTest, DecodesToSameRows) {
    auto encoder = ParquetPartEncoder::Make();
    ASSERT_TRUE(encoder.ok());
    auto table = IdTable(64);
    auto bytes = (*encoder)->Encode(*table);
    ASSERT_TRUE(bytes.ok());

    auto reader = parquet::arrow::OpenFile(std::make_shared<arrow::io::BufferReader>(*bytes),
                                           arrow::default_memory_pool());
    ASSERT_TRUE(reader.ok()) << reader.status().ToString();
    std::shared_ptr<arrow::Table> decoded;
    ASSERT_TRUE((*reader)->ReadTable(&decoded).ok());
    EXPECT_TRUE(decoded->Equals(*table));
}

TEST_F(ParquetPartEncoderTest, RejectsUnknownSettings) {
    PartEncodingOptions options;
    options.compression = "bogus";
    EXPECT_FALSE(ParquetPartEncoder::Make(options).ok());

    options = PartEncodingOptions();
    options.data_page_version = "9.9";
    EXPECT_FALSE(ParquetPartEncoder::Make(options).ok());
}

} // namespace storage
} // namespace parcel
