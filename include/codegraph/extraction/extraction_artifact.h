#pragma once

#include <codegraph/core/types.h>
#include <codegraph/extraction/file_record.h>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <vector>

namespace codegraph::extraction {

// nlohmann ADL hooks. Readers accept objects with optional fields missing.
void to_json(nlohmann::json& j, const CallSite& c);
void from_json(const nlohmann::json& j, CallSite& c);
void to_json(nlohmann::json& j, const ParameterRecord& p);
void from_json(const nlohmann::json& j, ParameterRecord& p);
void to_json(nlohmann::json& j, const MethodRecord& m);
void from_json(const nlohmann::json& j, MethodRecord& m);
void to_json(nlohmann::json& j, const ImportRecord& i);
void from_json(const nlohmann::json& j, ImportRecord& i);
void to_json(nlohmann::json& j, const DocRecord& d);
void from_json(const nlohmann::json& j, DocRecord& d);
void to_json(nlohmann::json& j, const FileRecord& f);
void from_json(const nlohmann::json& j, FileRecord& f);

/**
 * @brief Serialize records as the extraction artifact (a JSON array of file objects).
 *
 * Type declarations are split into `classes` and `interfaces`; each file also
 * carries `method_count`, `class_count` and `interface_count`.
 */
nlohmann::json artifactToJson(const std::vector<FileRecord>& records);

/**
 * @brief Parse an extraction artifact. Fails with InvalidData when the document
 * is not an array of objects or a required field (`path`) is missing.
 */
Result<std::vector<FileRecord>> artifactFromJson(const nlohmann::json& doc);

Result<void> saveArtifact(const std::vector<FileRecord>& records,
                          const std::filesystem::path& path);
Result<std::vector<FileRecord>> loadArtifact(const std::filesystem::path& path);

} // namespace codegraph::extraction
