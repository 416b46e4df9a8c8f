// Ticket: 0013_report_exporter

#ifndef CLASH_REPORT_REPORT_SERIALIZER_HPP
#define CLASH_REPORT_REPORT_SERIALIZER_HPP

#include <filesystem>

#include <nlohmann/json.hpp>

#include "clash-core/src/Detection/DetectionConfig.hpp"
#include "clash-core/src/Detection/ReportDocument.hpp"

namespace clash_report
{

/**
 * @brief JSON interchange for detection configs and reports
 *
 * Report layout (schema_version 1):
 * @code
 * {
 *   "schema_version": 1,
 *   "config": { "group_a": [...], "group_b": [...] | null, ... },
 *   "resolved_at_ms": <ms since epoch>,
 *   "sample_times": [...],
 *   "records": [ { "object_a", "object_b", "classification", "distance",
 *                  "start_time", "end_time", "start_sample", "end_sample",
 *                  "overlapping_triangles", "contact": {...} | null } ],
 *   "duplicates": [ { "object_a", "object_b", "content_hash",
 *                     "first_time", "last_time" } ],
 *   "warnings": [ { "kind", "path", "time", "message" } ]
 * }
 * @endcode
 *
 * The schema only ever grows: readers ignore unknown keys and fall back to
 * defaults for keys that are absent. Documents with a newer schema_version
 * are rejected.
 *
 * @ticket 0013_report_exporter
 */

nlohmann::json configToJson(const clash_core::DetectionConfig& config);

/**
 * @throws clash_core::ReportIOError on a wrong value type or unknown enum name
 */
clash_core::DetectionConfig configFromJson(const nlohmann::json& json);

/**
 * @brief Read a DetectionConfig from a JSON file
 * @throws clash_core::ReportIOError if the file is unreadable or malformed
 */
clash_core::DetectionConfig loadDetectionConfig(const std::filesystem::path& path);

/**
 * @throws clash_core::ReportIOError if path cannot be written
 */
void saveDetectionConfig(const clash_core::DetectionConfig& config,
                         const std::filesystem::path& path);

nlohmann::json reportToJson(const clash_core::ReportDocument& document);

/**
 * @throws clash_core::ReportIOError on a malformed or newer document
 */
clash_core::ReportDocument reportFromJson(const nlohmann::json& json);

/**
 * @brief Write document as JSON to path (overwrites)
 * @throws clash_core::ReportIOError if path cannot be written
 */
void exportReport(const clash_core::ReportDocument& document,
                  const std::filesystem::path& path);

/**
 * @brief Inverse of exportReport()
 * @throws clash_core::ReportIOError if path is unreadable or malformed
 */
clash_core::ReportDocument importReport(const std::filesystem::path& path);

}  // namespace clash_report

#endif  // CLASH_REPORT_REPORT_SERIALIZER_HPP
