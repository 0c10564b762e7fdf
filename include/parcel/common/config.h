#pragma once

#include <cstdint>
#include <string>
#include <arrow/result.h>
#include <arrow/status.h>
#include <nlohmann/json.hpp>

namespace parcel {

/**
 * @brief What Execute does with a job that already reached COMPLETED or FAILED
 */
enum class TerminalJobPolicy {
    kReprocess,  // Run it again, overwriting the earlier outcome
    kReject      // Refuse with an InvalidJob error, no ledger mutation
};

const char* TerminalJobPolicyToString(TerminalJobPolicy policy);
arrow::Result<TerminalJobPolicy> ParseTerminalJobPolicy(const std::string& name);

/**
 * @brief Statement executor configuration
 *
 * Passed by value into StatementExecutor; there is no process-wide
 * default instance.
 */
struct ExecutorConfig {
    static constexpr int64_t kDefaultFlushThresholdBytes = 256LL * 1024 * 1024;

    std::string bucket = "opteryx_results";          // Root prefix for result objects
    int64_t flush_threshold_bytes = kDefaultFlushThresholdBytes;
    std::string compression = "zstd";                // Parquet codec name
    int compression_level = 1;
    bool write_statistics = false;
    std::string data_page_version = "2.0";          // "1.0" or "2.0"
    std::string part_extension = "parquet";
    TerminalJobPolicy terminal_job_policy = TerminalJobPolicy::kReprocess;

    arrow::Status Validate() const;

    /**
     * @brief Overlay the keys present in a JSON object onto the defaults
     *
     * Unknown keys and mistyped values are rejected with Invalid.
     */
    static arrow::Result<ExecutorConfig> FromJson(const nlohmann::json& json);

    nlohmann::json ToJson() const;
};

/**
 * @brief Read, parse and validate an ExecutorConfig JSON file
 */
arrow::Result<ExecutorConfig> LoadExecutorConfig(const std::string& path);

} // namespace parcel
