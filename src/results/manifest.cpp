#include "parcel/results/manifest.h"

namespace parcel {
namespace results {

WriteSettings WriteSettings::FromConfig(const ExecutorConfig& config) {
    WriteSettings settings;
    settings.compression = config.compression;
    settings.compression_level = config.compression_level;
    settings.write_statistics = config.write_statistics;
    return settings;
}

nlohmann::ordered_json Manifest::ToJson() const {
    nlohmann::ordered_json json;

    nlohmann::ordered_json parts_json = nlohmann::ordered_json::array();
    for (const auto& part : parts) {
        nlohmann::ordered_json part_json;
        part_json["path"] = part.path;
        part_json["rows"] = part.row_count;
        part_json["approx_size"] = part.approx_size_bytes;
        parts_json.push_back(std::move(part_json));
    }
    json["parts"] = std::move(parts_json);

    json["total_parts"] = total_parts;
    json["total_rows"] = total_rows;
    json["total_size_estimate"] = total_size_estimate;
    json["compression"] = settings.compression;
    json["compression_level"] = settings.compression_level;
    json["write_statistics"] = settings.write_statistics;

    nlohmann::ordered_json columns_json = nlohmann::ordered_json::array();
    for (const auto& column : columns) {
        nlohmann::ordered_json column_json;
        column_json["name"] = column.name;
        column_json["type"] = column.type;
        columns_json.push_back(std::move(column_json));
    }
    json["columns"] = std::move(columns_json);

    json["created_at"] = FormatIso8601(created_at);
    return json;
}

std::string Manifest::ToJsonString() const {
    return ToJson().dump();
}

arrow::Result<Manifest> Manifest::FromJson(const std::string& text) {
    Manifest manifest;
    try {
        auto json = nlohmann::json::parse(text);

        int64_t index = 0;
        for (const auto& part_json : json.at("parts")) {
            PartDescriptor part;
            part.index = index++;
            part.path = part_json.at("path").get<std::string>();
            part.row_count = part_json.at("rows").get<int64_t>();
            part.approx_size_bytes = part_json.at("approx_size").get<int64_t>();
            manifest.parts.push_back(std::move(part));
        }

        manifest.total_parts = json.at("total_parts").get<int64_t>();
        manifest.total_rows = json.at("total_rows").get<int64_t>();
        manifest.total_size_estimate = json.at("total_size_estimate").get<int64_t>();
        manifest.settings.compression = json.at("compression").get<std::string>();
        manifest.settings.compression_level = json.at("compression_level").get<int>();
        manifest.settings.write_statistics = json.at("write_statistics").get<bool>();

        for (const auto& column_json : json.at("columns")) {
            manifest.columns.push_back({column_json.at("name").get<std::string>(),
                                        column_json.at("type").get<std::string>()});
        }

        ARROW_ASSIGN_OR_RAISE(manifest.created_at,
                              ParseIso8601(json.at("created_at").get<std::string>()));
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Malformed manifest: ", e.what());
    }
    return manifest;
}

Manifest ManifestBuilder::Build(std::vector<PartDescriptor> parts,
                                std::vector<ColumnDescriptor> columns,
                                const WriteSettings& settings,
                                Timestamp created_at) {
    Manifest manifest;
    manifest.total_parts = static_cast<int64_t>(parts.size());
    for (const auto& part : parts) {
        manifest.total_rows += part.row_count;
        manifest.total_size_estimate += part.approx_size_bytes;
    }
    manifest.parts = std::move(parts);
    manifest.settings = settings;
    manifest.columns = std::move(columns);
    manifest.created_at = created_at;
    return manifest;
}

} // namespace results
} // namespace parcel
