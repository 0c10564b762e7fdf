#include "parcel/common/config.h"

#include <fstream>
#include <arrow/util/compression.h>

namespace parcel {

const char* TerminalJobPolicyToString(TerminalJobPolicy policy) {
    switch (policy) {
        case TerminalJobPolicy::kReprocess: return "reprocess";
        case TerminalJobPolicy::kReject:    return "reject";
    }
    return "unknown";
}

arrow::Result<TerminalJobPolicy> ParseTerminalJobPolicy(const std::string& name) {
    if (name == "reprocess") return TerminalJobPolicy::kReprocess;
    if (name == "reject") return TerminalJobPolicy::kReject;
    return arrow::Status::Invalid("Unknown terminal_job_policy: '", name,
                                  "' (expected 'reprocess' or 'reject')");
}

arrow::Status ExecutorConfig::Validate() const {
    if (bucket.empty()) {
        return arrow::Status::Invalid("bucket must not be empty");
    }
    if (flush_threshold_bytes <= 0) {
        return arrow::Status::Invalid("flush_threshold_bytes must be positive, got ",
                                      flush_threshold_bytes);
    }
    if (part_extension.empty()) {
        return arrow::Status::Invalid("part_extension must not be empty");
    }
    if (data_page_version != "1.0" && data_page_version != "2.0") {
        return arrow::Status::Invalid("data_page_version must be '1.0' or '2.0', got '",
                                      data_page_version, "'");
    }

    ARROW_ASSIGN_OR_RAISE(auto codec, arrow::util::Codec::GetCompressionType(compression));
    if (!arrow::util::Codec::IsAvailable(codec)) {
        return arrow::Status::NotImplemented("Compression codec '", compression,
                                             "' is not available in this Arrow build");
    }
    if (arrow::util::Codec::SupportsCompressionLevel(codec)) {
        ARROW_ASSIGN_OR_RAISE(int min_level, arrow::util::Codec::MinimumCompressionLevel(codec));
        ARROW_ASSIGN_OR_RAISE(int max_level, arrow::util::Codec::MaximumCompressionLevel(codec));
        if (compression_level < min_level || compression_level > max_level) {
            return arrow::Status::Invalid("compression_level ", compression_level,
                                          " out of range [", min_level, ", ", max_level,
                                          "] for codec '", compression, "'");
        }
    }
    return arrow::Status::OK();
}

arrow::Result<ExecutorConfig> ExecutorConfig::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return arrow::Status::Invalid("Executor config must be a JSON object");
    }

    ExecutorConfig config;
    try {
        for (const auto& [key, value] : json.items()) {
            if (key == "bucket") {
                config.bucket = value.get<std::string>();
            } else if (key == "flush_threshold_bytes") {
                config.flush_threshold_bytes = value.get<int64_t>();
            } else if (key == "compression") {
                config.compression = value.get<std::string>();
            } else if (key == "compression_level") {
                config.compression_level = value.get<int>();
            } else if (key == "write_statistics") {
                config.write_statistics = value.get<bool>();
            } else if (key == "data_page_version") {
                config.data_page_version = value.get<std::string>();
            } else if (key == "part_extension") {
                config.part_extension = value.get<std::string>();
            } else if (key == "terminal_job_policy") {
                ARROW_ASSIGN_OR_RAISE(config.terminal_job_policy,
                                      ParseTerminalJobPolicy(value.get<std::string>()));
            } else {
                return arrow::Status::Invalid("Unknown executor config key: '", key, "'");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Malformed executor config: ", e.what());
    }
    return config;
}

nlohmann::json ExecutorConfig::ToJson() const {
    return nlohmann::json{
        {"bucket", bucket},
        {"flush_threshold_bytes", flush_threshold_bytes},
        {"compression", compression},
        {"compression_level", compression_level},
        {"write_statistics", write_statistics},
        {"data_page_version", data_page_version},
        {"part_extension", part_extension},
        {"terminal_job_policy", TerminalJobPolicyToString(terminal_job_policy)},
    };
}

arrow::Result<ExecutorConfig> LoadExecutorConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return arrow::Status::IOError("Cannot open config file: ", path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        return arrow::Status::Invalid("Cannot parse config file ", path, ": ", e.what());
    }

    ARROW_ASSIGN_OR_RAISE(auto config, ExecutorConfig::FromJson(json));
    ARROW_RETURN_NOT_OK(config.Validate());
    return config;
}

} // namespace parcel
