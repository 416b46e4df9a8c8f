// Ticket: 0013_report_exporter

#include "clash-report/src/ReportSerializer.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "clash-core/src/Detection/DetectionErrors.hpp"

using json = nlohmann::json;

namespace clash_report
{

using namespace clash_core;

namespace
{

json pointToJson(const Coordinate& point)
{
  return json::array({point.x(), point.y(), point.z()});
}

Coordinate pointFromJson(const json& value)
{
  const auto xyz = value.get<std::vector<double>>();
  if (xyz.size() != 3)
  {
    throw ReportIOError("expected a point of 3 coordinates, got " +
                        std::to_string(xyz.size()));
  }
  return Coordinate{xyz[0], xyz[1], xyz[2]};
}

json recordToJson(const ClashRecord& record)
{
  json out;
  out["object_a"] = record.pair.first();
  out["object_b"] = record.pair.second();
  out["classification"] = std::string{toString(record.classification)};
  out["distance"] = record.distance;
  out["start_time"] = record.startTime;
  out["end_time"] = record.endTime;
  out["start_sample"] = record.startSample;
  out["end_sample"] = record.endSample;
  out["overlapping_triangles"] = record.overlappingTriangles;
  if (record.contact.has_value())
  {
    out["contact"] = {{"point_a", pointToJson(record.contact->pointA)},
                      {"point_b", pointToJson(record.contact->pointB)}};
  }
  else
  {
    out["contact"] = nullptr;
  }
  return out;
}

ClashRecord recordFromJson(const json& in)
{
  ClashRecord record;
  record.pair = ClashPair{in.at("object_a").get<std::string>(),
                          in.at("object_b").get<std::string>()};
  record.classification =
    classificationFromString(in.at("classification").get<std::string>());
  record.distance = in.at("distance").get<double>();
  record.startTime = in.at("start_time").get<double>();
  record.endTime = in.value("end_time", record.startTime);
  record.startSample = in.value("start_sample", 0U);
  record.endSample = in.value("end_sample", record.startSample);
  record.overlappingTriangles = in.value("overlapping_triangles", 0U);

  const auto contact = in.find("contact");
  if (contact != in.end() && !contact->is_null())
  {
    record.contact = ContactLocation{pointFromJson(contact->at("point_a")),
                                     pointFromJson(contact->at("point_b"))};
  }
  return record;
}

json duplicateToJson(const DuplicateGeometry& duplicate)
{
  return json{{"object_a", duplicate.pair.first()},
              {"object_b", duplicate.pair.second()},
              {"content_hash", duplicate.contentHash},
              {"first_time", duplicate.firstTime},
              {"last_time", duplicate.lastTime}};
}

DuplicateGeometry duplicateFromJson(const json& in)
{
  DuplicateGeometry duplicate;
  duplicate.pair = ClashPair{in.at("object_a").get<std::string>(),
                             in.at("object_b").get<std::string>()};
  duplicate.contentHash = in.at("content_hash").get<uint64_t>();
  duplicate.firstTime = in.value("first_time", 0.0);
  duplicate.lastTime = in.value("last_time", duplicate.firstTime);
  return duplicate;
}

json warningToJson(const ResolutionWarning& warning)
{
  return json{{"kind", std::string{toString(warning.kind)}},
              {"path", warning.path},
              {"time", warning.time},
              {"message", warning.message}};
}

ResolutionWarning warningFromJson(const json& in)
{
  ResolutionWarning warning;
  warning.kind = warningKindFromString(in.at("kind").get<std::string>());
  warning.path = in.at("path").get<std::string>();
  warning.time = in.value("time", 0.0);
  warning.message = in.value("message", std::string{});
  return warning;
}

// Non-negative integer under key, fallback if absent
size_t countValue(const json& in, const char* key, size_t fallback)
{
  const auto it = in.find(key);
  if (it == in.end())
  {
    return fallback;
  }
  // Parsed non-negative numbers are unsigned, built ones may be signed
  const bool nonNegative =
    it->is_number_unsigned() || (it->is_number_integer() && it->get<int64_t>() >= 0);
  if (!nonNegative)
  {
    throw ReportIOError(std::string{"Malformed detection config: "} + key +
                        " must be a non-negative integer, got " + it->dump());
  }
  return it->get<size_t>();
}

// Runs parse, turning every parsing failure into a ReportIOError
template <typename Parse>
auto parseOrThrow(const std::string& what, Parse&& parse)
{
  try
  {
    return parse();
  }
  catch (const ReportIOError&)
  {
    throw;
  }
  catch (const json::exception& e)
  {
    throw ReportIOError("Malformed " + what + ": " + e.what());
  }
  catch (const std::invalid_argument& e)
  {
    throw ReportIOError("Malformed " + what + ": " + e.what());
  }
}

json readJsonFile(const std::filesystem::path& path, const std::string& what)
{
  std::ifstream file{path};
  if (!file.is_open())
  {
    spdlog::error("Cannot open {} '{}'", what, path.string());
    throw ReportIOError("Cannot open " + what + " '" + path.string() + "'");
  }

  try
  {
    return json::parse(file);
  }
  catch (const json::parse_error& e)
  {
    spdlog::error("Cannot parse {} '{}': {}", what, path.string(), e.what());
    throw ReportIOError("Cannot parse " + what + " '" + path.string() +
                        "': " + e.what());
  }
}

}  // namespace

json configToJson(const DetectionConfig& config)
{
  json out;
  out["group_a"] = config.groupA;
  out["group_b"] = config.groupB.has_value() ? json(*config.groupB) : json(nullptr);
  out["clash_tolerance"] = config.clashTolerance;
  out["clearance_tolerance"] = config.clearanceTolerance;
  out["mode"] = std::string{toString(config.mode)};
  out["static_time"] = config.staticTime;
  out["start_time"] = config.startTime;
  out["end_time"] = config.endTime;
  out["time_step"] = config.timeStep;
  out["strict_resolution"] = config.strictResolution;
  out["epsilon"] = config.epsilon;
  out["worker_count"] = config.workerCount;
  out["pair_batch_size"] = config.pairBatchSize;
  out["query_name"] = config.queryName;
  out["comment"] = config.comment;
  return out;
}

DetectionConfig configFromJson(const json& in)
{
  return parseOrThrow(
    "detection config",
    [&in]
    {
      if (!in.is_object())
      {
        throw ReportIOError("Malformed detection config: not a JSON object");
      }

      DetectionConfig config;
      config.groupA = in.value("group_a", std::vector<std::string>{});
      const auto groupB = in.find("group_b");
      if (groupB != in.end() && !groupB->is_null())
      {
        config.groupB = groupB->get<std::vector<std::string>>();
      }
      config.clashTolerance = in.value("clash_tolerance", config.clashTolerance);
      config.clearanceTolerance =
        in.value("clearance_tolerance", config.clearanceTolerance);
      config.mode = detectionModeFromString(
        in.value("mode", std::string{toString(config.mode)}));
      config.staticTime = in.value("static_time", config.staticTime);
      config.startTime = in.value("start_time", config.startTime);
      config.endTime = in.value("end_time", config.endTime);
      config.timeStep = in.value("time_step", config.timeStep);
      config.strictResolution = in.value("strict_resolution", config.strictResolution);
      config.epsilon = in.value("epsilon", config.epsilon);
      config.workerCount = countValue(in, "worker_count", config.workerCount);
      config.pairBatchSize = countValue(in, "pair_batch_size", config.pairBatchSize);
      config.queryName = in.value("query_name", config.queryName);
      config.comment = in.value("comment", config.comment);
      return config;
    });
}

DetectionConfig loadDetectionConfig(const std::filesystem::path& path)
{
  const json in = readJsonFile(path, "detection config");
  DetectionConfig config = configFromJson(in);
  spdlog::info("Loaded detection config '{}' from '{}'", config.queryName, path.string());
  return config;
}

void saveDetectionConfig(const DetectionConfig& config, const std::filesystem::path& path)
{
  std::ofstream file{path, std::ios::out | std::ios::trunc};
  if (!file.is_open())
  {
    spdlog::error("Cannot open '{}' for writing", path.string());
    throw ReportIOError("Cannot open '" + path.string() + "' for writing");
  }
  file << configToJson(config).dump(2) << '\n';
  file.flush();
  if (!file)
  {
    spdlog::error("Failed writing detection config to '{}'", path.string());
    throw ReportIOError("Failed writing detection config to '" + path.string() + "'");
  }
  spdlog::info("Saved detection config '{}' to '{}'", config.queryName, path.string());
}

json reportToJson(const ReportDocument& document)
{
  json out;
  out["schema_version"] = document.schemaVersion;
  out["config"] = configToJson(document.config);
  out["resolved_at_ms"] = document.resolvedAt.time_since_epoch().count();
  out["sample_times"] = document.sampleTimes;

  json records = json::array();
  for (const auto& record : document.records)
  {
    records.push_back(recordToJson(record));
  }
  out["records"] = std::move(records);

  json duplicates = json::array();
  for (const auto& duplicate : document.duplicates)
  {
    duplicates.push_back(duplicateToJson(duplicate));
  }
  out["duplicates"] = std::move(duplicates);

  json warnings = json::array();
  for (const auto& warning : document.warnings)
  {
    warnings.push_back(warningToJson(warning));
  }
  out["warnings"] = std::move(warnings);
  return out;
}

ReportDocument reportFromJson(const json& in)
{
  return parseOrThrow(
    "report document",
    [&in]
    {
      if (!in.is_object())
      {
        throw ReportIOError("Malformed report document: not a JSON object");
      }

      ReportDocument document;
      document.schemaVersion = in.at("schema_version").get<uint32_t>();
      if (document.schemaVersion > ReportDocument::kSchemaVersion)
      {
        throw ReportIOError("Report schema version " +
                            std::to_string(document.schemaVersion) +
                            " is newer than supported version " +
                            std::to_string(ReportDocument::kSchemaVersion));
      }

      document.config = configFromJson(in.at("config"));
      document.resolvedAt = ReportTimestamp{
        std::chrono::milliseconds{in.value("resolved_at_ms", int64_t{0})}};
      document.sampleTimes = in.value("sample_times", std::vector<double>{});

      for (const auto& record : in.value("records", json::array()))
      {
        document.records.push_back(recordFromJson(record));
      }
      for (const auto& duplicate : in.value("duplicates", json::array()))
      {
        document.duplicates.push_back(duplicateFromJson(duplicate));
      }
      for (const auto& warning : in.value("warnings", json::array()))
      {
        document.warnings.push_back(warningFromJson(warning));
      }
      return document;
    });
}

void exportReport(const ReportDocument& document, const std::filesystem::path& path)
{
  const std::string text = reportToJson(document).dump(2);

  std::ofstream file{path, std::ios::out | std::ios::trunc};
  if (!file.is_open())
  {
    spdlog::error("Cannot open '{}' for writing", path.string());
    throw ReportIOError("Cannot open '" + path.string() + "' for writing");
  }
  file << text << '\n';
  file.flush();
  if (!file)
  {
    spdlog::error("Failed writing report to '{}'", path.string());
    throw ReportIOError("Failed writing report to '" + path.string() + "'");
  }

  spdlog::info("Exported {} clash record(s) to '{}'", document.records.size(), path.string());
}

ReportDocument importReport(const std::filesystem::path& path)
{
  const json in = readJsonFile(path, "report");
  ReportDocument document = reportFromJson(in);
  spdlog::info("Imported {} clash record(s) from '{}'", document.records.size(), path.string());
  return document;
}

}  // namespace clash_report
