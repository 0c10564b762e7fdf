#include <gtest/gtest.h>
#include <fstream>
#include <nlohmann/json.hpp>

#include "parcel/common/config.h"
#include "test_support.h"

namespace parcel {

class ExecutorConfigTest : public test::TempDirTestBase {};

TEST_F(ExecutorConfigTest, Defaults) {
    ExecutorConfig config;
    EXPECT_EQ(config.bucket, "opteryx_results");
    EXPECT_EQ(config.flush_threshold_bytes, 256LL * 1024 * 1024);
    EXPECT_EQ(config.compression, "zstd");
    EXPECT_EQ(config.compression_level, 1);
    EXPECT_FALSE(config.write_statistics);
    EXPECT_EQ(config.data_page_version, "2.0");
    EXPECT_EQ(config.part_extension, "parquet");
    EXPECT_EQ(config.terminal_job_policy, TerminalJobPolicy::kReprocess);
    EXPECT_TRUE(config.Validate().ok());
}

TEST_F(ExecutorConfigTest, FromJsonOverridesSubset) {
    auto config = ExecutorConfig::FromJson(nlohmann::json{
        {"bucket", "analytics"},
        {"flush_threshold_bytes", 1024},
        {"terminal_job_policy", "reject"},
    });
    ASSERT_TRUE(config.ok()) << config.status().ToString();
    EXPECT_EQ(config->bucket, "analytics");
    EXPECT_EQ(config->flush_threshold_bytes, 1024);
    EXPECT_EQ(config->terminal_job_policy, TerminalJobPolicy::kReject);
    EXPECT_EQ(config->compression, "zstd");
}

TEST_F(ExecutorConfigTest, FromJsonRejectsBadInput) {
    EXPECT_TRUE(ExecutorConfig::FromJson(nlohmann::json{{"bukket", "x"}}).status().IsInvalid());
    EXPECT_TRUE(ExecutorConfig::FromJson(nlohmann::json{{"compression_level", "high"}})
                    .status().IsInvalid());
    EXPECT_TRUE(ExecutorConfig::FromJson(nlohmann::json{{"terminal_job_policy", "retry"}})
                    .status().IsInvalid());
    EXPECT_TRUE(ExecutorConfig::FromJson(nlohmann::json::array()).status().IsInvalid());
}

TEST_F(ExecutorConfigTest, JsonRoundTripKeepsValues) {
    ExecutorConfig config;
    config.bucket = "b";
    config.write_statistics = true;
    config.data_page_version = "1.0";
    auto parsed = ExecutorConfig::FromJson(config.ToJson());
    ASSERT_TRUE(parsed.ok()) << parsed.status().ToString();
    EXPECT_EQ(parsed->ToJson(), config.ToJson());
}

TEST_F(ExecutorConfigTest, ValidateRejectsInvalidValues) {
    ExecutorConfig config;
    config.bucket = "";
    EXPECT_FALSE(config.Validate().ok());

    config = ExecutorConfig();
    config.flush_threshold_bytes = 0;
    EXPECT_FALSE(config.Validate().ok());

    config = ExecutorConfig();
    config.compression = "lzma-ish";
    EXPECT_FALSE(config.Validate().ok());

    config = ExecutorConfig();
    config.compression_level = 1000;
    EXPECT_FALSE(config.Validate().ok());

    config = ExecutorConfig();
    config.data_page_version = "3.0";
    EXPECT_FALSE(config.Validate().ok());

    config = ExecutorConfig();
    config.part_extension = "";
    EXPECT_FALSE(config.Validate().ok());
}

TEST_F(ExecutorConfigTest, LoadFromFile) {
    auto path = test_path_ + "/executor.json";
    {
        std::ofstream out(path);
        out << R"({"bucket": "from-file", "compression_level": 3})";
    }
    auto config = LoadExecutorConfig(path);
    ASSERT_TRUE(config.ok()) << config.status().ToString();
    EXPECT_EQ(config->bucket, "from-file");
    EXPECT_EQ(config->compression_level, 3);

    EXPECT_TRUE(LoadExecutorConfig(test_path_ + "/missing.json").status().IsIOError());

    auto broken = test_path_ + "/broken.json";
    {
        std::ofstream out(broken);
        out << "{ bucket: ";
    }
    EXPECT_TRUE(LoadExecutorConfig(broken).status().IsInvalid());
}

} // namespace parcel
