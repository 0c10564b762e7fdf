#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "parcel/results/manifest.h"
#include "parcel/results/result_paths.h"

namespace parcel {
namespace results {

class ManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        parts_ = {
            {0, "b/h/part_0000.parquet", 100, 4096},
            {1, "b/h/part_0001.parquet", 50, 2048},
        };
        columns_ = {{"id", "int64"}, {"label", "string"}};
        settings_.compression = "zstd";
        settings_.compression_level = 3;
        settings_.write_statistics = false;
    }

    std::vector<PartDescriptor> parts_;
    std::vector<ColumnDescriptor> columns_;
    WriteSettings settings_;
};

TEST_F(ManifestTest, BuildSumsParts) {
    auto manifest = ManifestBuilder::Build(parts_, columns_, settings_);
    EXPECT_EQ(manifest.total_parts, 2);
    EXPECT_EQ(manifest.total_rows, 150);
    EXPECT_EQ(manifest.total_size_estimate, 6144);
    EXPECT_EQ(manifest.columns, columns_);
}

TEST_F(ManifestTest, BuildWithNoParts) {
    auto manifest = ManifestBuilder::Build({}, columns_, settings_);
    EXPECT_EQ(manifest.total_parts, 0);
    EXPECT_EQ(manifest.total_rows, 0);
    EXPECT_EQ(manifest.total_size_estimate, 0);
}

TEST_F(ManifestTest, JsonKeysInContractOrder) {
    auto manifest = ManifestBuilder::Build(parts_, columns_, settings_,
                                           Timestamp(std::chrono::seconds(0)));
    auto json = manifest.ToJson();

    std::vector<std::string> keys;
    for (const auto& item : json.items()) {
        keys.push_back(item.key());
    }
    const std::vector<std::string> expected = {
        "parts", "total_parts", "total_rows", "total_size_estimate", "compression",
        "compression_level", "write_statistics", "columns", "created_at"};
    EXPECT_EQ(keys, expected);

    EXPECT_EQ(json["parts"][0]["path"], "b/h/part_0000.parquet");
    EXPECT_EQ(json["parts"][0]["rows"], 100);
    EXPECT_EQ(json["parts"][0]["approx_size"], 4096);
    EXPECT_EQ(json["compression_level"], 3);
    EXPECT_EQ(json["write_statistics"], false);
    EXPECT_EQ(json["columns"][1]["type"], "string");
    EXPECT_EQ(json["created_at"], "1970-01-01T00:00:00.000000+00:00");
}

TEST_F(ManifestTest, ParsesWrittenJson) {
    auto manifest = ManifestBuilder::Build(parts_, columns_, settings_);
    auto parsed = Manifest::FromJson(manifest.ToJsonString());
    ASSERT_TRUE(parsed.ok()) << parsed.status().ToString();

    EXPECT_EQ(parsed->parts, parts_);
    EXPECT_EQ(parsed->total_rows, 150);
    EXPECT_EQ(parsed->settings.compression_level, 3);
    EXPECT_EQ(parsed->columns, columns_);
    EXPECT_EQ(FormatIso8601(parsed->created_at), FormatIso8601(manifest.created_at));
}

TEST_F(ManifestTest, RejectsMalformedJson) {
    EXPECT_FALSE(Manifest::FromJson("{not json").ok());
    EXPECT_FALSE(Manifest::FromJson(R"({"parts": []})").ok());
}

TEST(ResultPathsTest, PartPathIsZeroPadded) {
    EXPECT_EQ(ResultPaths::PartPath("opteryx_results", "abc", 0), "opteryx_results/abc/part_0000.parquet");
    EXPECT_EQ(ResultPaths::PartPath("opteryx_results", "abc", 42), "opteryx_results/abc/part_0042.parquet");
    EXPECT_EQ(ResultPaths::PartPath("b", "abc", 12345), "b/abc/part_12345.parquet");
    EXPECT_EQ(ResultPaths::PartPath("b", "abc", 1, "pq"), "b/abc/part_0001.pq");
}

TEST(ResultPathsTest, ManifestPath) {
    EXPECT_EQ(ResultPaths::ManifestPath("opteryx_results", "abc"), "opteryx_results/abc/manifest.json");
}

} // namespace results
} // namespace parcel
