#include <gtest/gtest.h>

#include "parcel/common/logging.h"
#include "parcel/common/status.h"
#include "parcel/common/time_util.h"

namespace parcel {

class JobErrorTest : public ::testing::Test {};

TEST_F(JobErrorTest, FreshErrorsCarryKind) {
    auto not_found = NotFoundError("No job found for handle: x");
    EXPECT_TRUE(not_found.IsKeyError());
    EXPECT_EQ(not_found.message(), "No job found for handle: x");
    EXPECT_TRUE(IsJobError(not_found, JobErrorKind::kNotFound));

    auto invalid = InvalidJobError("already COMPLETED");
    EXPECT_TRUE(invalid.IsInvalid());
    EXPECT_TRUE(IsJobError(invalid, JobErrorKind::kInvalidJob));
}

TEST_F(JobErrorTest, TagKeepsCodeAndMessage) {
    auto cause = arrow::Status::IOError("disk full");
    auto tagged = WriteError(cause);
    EXPECT_TRUE(tagged.IsIOError());
    EXPECT_EQ(tagged.message(), "disk full");
    EXPECT_TRUE(IsJobError(tagged, JobErrorKind::kWrite));
    EXPECT_FALSE(GetJobErrorKind(cause).has_value());
}

TEST_F(JobErrorTest, InnermostTagWins) {
    auto tagged = LedgerError(EngineError(arrow::Status::Invalid("bad sql")));
    EXPECT_TRUE(IsJobError(tagged, JobErrorKind::kEngine));
    EXPECT_FALSE(IsJobError(tagged, JobErrorKind::kLedger));

    EXPECT_TRUE(IsJobError(LedgerError(NotFoundError("gone")), JobErrorKind::kNotFound));
}

TEST_F(JobErrorTest, OkIsNeverTagged) {
    EXPECT_TRUE(EngineError(arrow::Status::OK()).ok());
    EXPECT_FALSE(GetJobErrorKind(arrow::Status::OK()).has_value());
}

TEST_F(JobErrorTest, KindNames) {
    EXPECT_STREQ(JobErrorKindToString(JobErrorKind::kNotFound), "NotFound");
    EXPECT_STREQ(JobErrorKindToString(JobErrorKind::kLedger), "LedgerError");
}

TEST(TimeUtilTest, FormatsUtcWithMicroseconds) {
    Timestamp ts = Timestamp(std::chrono::seconds(1700000000)) + std::chrono::microseconds(42);
    EXPECT_EQ(FormatIso8601(ts), "2023-11-14T22:13:20.000042+00:00");
}

TEST(TimeUtilTest, ParsesOffsetsAndFractions) {
    auto utc = ParseIso8601("2023-11-14T22:13:20.000042+00:00");
    ASSERT_TRUE(utc.ok()) << utc.status().ToString();
    EXPECT_EQ(FormatIso8601(*utc), "2023-11-14T22:13:20.000042+00:00");

    auto zulu = ParseIso8601("2023-11-14T22:13:20Z");
    ASSERT_TRUE(zulu.ok());
    EXPECT_EQ(FormatIso8601(*zulu), "2023-11-14T22:13:20.000000+00:00");

    auto offset = ParseIso8601("2023-11-15T00:13:20.5+02:00");
    ASSERT_TRUE(offset.ok());
    EXPECT_EQ(FormatIso8601(*offset), "2023-11-14T22:13:20.500000+00:00");
}

TEST(TimeUtilTest, RejectsGarbage) {
    EXPECT_FALSE(ParseIso8601("yesterday").ok());
    EXPECT_FALSE(ParseIso8601("2023-11-14T22:13:20.+00:00").ok());
    EXPECT_FALSE(ParseIso8601("2023-11-14T22:13:20+0x:00").ok());
    EXPECT_FALSE(ParseIso8601("2023-11-14T22:13:20Z trailing").ok());
}

TEST(LoggingTest, ParsesLevelNames) {
    using logging::LogLevel;
    EXPECT_EQ(logging::ParseLogLevel("debug").value_or(LogLevel::TRACE), LogLevel::DEBUG);
    EXPECT_EQ(logging::ParseLogLevel("WARN").value_or(LogLevel::TRACE), LogLevel::WARN);
    EXPECT_EQ(logging::ParseLogLevel("off").value_or(LogLevel::TRACE), LogLevel::OFF);
    EXPECT_FALSE(logging::ParseLogLevel("verbose").has_value());
    EXPECT_STREQ(logging::LogLevelToString(logging::LogLevel::ERROR), "ERROR");
}

} // namespace parcel
