// Ticket: 0015_clash_data_store

#include "clash-db/src/ClashDataStore.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "clash-core/src/Detection/DetectionErrors.hpp"
#include "clash-report/src/ReportSerializer.hpp"
#include "clash-transfer/src/Records.hpp"

namespace clash_db
{

using namespace clash_core;
using namespace clash_transfer;

namespace
{

OverlapRecord toOverlapRecord(const ClashRecord& record, uint32_t queryId)
{
  OverlapRecord out{};
  out.object_a = record.pair.first();
  out.object_b = record.pair.second();
  out.classification = std::string{toString(record.classification)};
  out.distance = record.distance;
  out.start_time = record.startTime;
  out.end_time = record.endTime;
  out.start_sample = record.startSample;
  out.end_sample = record.endSample;
  out.overlapping_triangles = record.overlappingTriangles;
  if (record.contact.has_value())
  {
    out.has_contact = 1;
    out.point_a_x = record.contact->pointA.x();
    out.point_a_y = record.contact->pointA.y();
    out.point_a_z = record.contact->pointA.z();
    out.point_b_x = record.contact->pointB.x();
    out.point_b_y = record.contact->pointB.y();
    out.point_b_z = record.contact->pointB.z();
  }
  out.query.id = queryId;
  return out;
}

ClashRecord fromOverlapRecord(const OverlapRecord& in)
{
  ClashRecord record;
  record.pair = ClashPair{in.object_a, in.object_b};
  record.classification = classificationFromString(in.classification);
  record.distance = in.distance;
  record.startTime = in.start_time;
  record.endTime = in.end_time;
  record.startSample = in.start_sample;
  record.endSample = in.end_sample;
  record.overlappingTriangles = in.overlapping_triangles;
  if (in.has_contact != 0)
  {
    record.contact = ContactLocation{Coordinate{in.point_a_x, in.point_a_y, in.point_a_z},
                                     Coordinate{in.point_b_x, in.point_b_y, in.point_b_z}};
  }
  return record;
}

void checkSampleRange(const ClashRecord& record, size_t sampleCount)
{
  if (record.startSample > record.endSample || record.endSample >= sampleCount)
  {
    throw ReportIOError("Clash record " + record.pair.first() + " / " + record.pair.second() +
                        " spans samples " + std::to_string(record.startSample) + ".." +
                        std::to_string(record.endSample) + " but the report holds " +
                        std::to_string(sampleCount) + " sample time(s)");
  }
}

// DELETE FROM table WHERE column = value on the store's own connection
uint32_t deleteWhere(cpp_sqlite::Database& database,
                     const std::string& table,
                     const std::string& column,
                     uint32_t value)
{
  const std::string sql = "DELETE FROM " + table + " WHERE " + column + " = ?;";

  sqlite3* raw = &database.getRawDB();
  sqlite3_stmt* rawPtr = nullptr;
  if (sqlite3_prepare_v2(raw, sql.c_str(), -1, &rawPtr, nullptr) != SQLITE_OK)
  {
    throw ReportIOError("Cannot prepare '" + sql + "': " + sqlite3_errmsg(raw));
  }
  cpp_sqlite::PreparedSQLStmt stmt{rawPtr, sqlite3_finalize};

  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(value));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
  {
    throw ReportIOError("Failed '" + sql + "': " + sqlite3_errmsg(raw));
  }
  return static_cast<uint32_t>(sqlite3_changes(raw));
}

template <typename Record>
std::vector<Record> selectForQuery(cpp_sqlite::Database& database, uint32_t queryId)
{
  std::vector<Record> rows = database.getDAO<Record>().selectAll();
  std::erase_if(rows, [queryId](const Record& row) { return row.query.id != queryId; });
  std::sort(rows.begin(),
            rows.end(),
            [](const Record& a, const Record& b) { return a.id < b.id; });
  return rows;
}

}  // namespace

ClashDataStore::ClashDataStore(const std::filesystem::path& path)
{
  auto& logger = cpp_sqlite::Logger::getInstance();
  database_ =
    std::make_unique<cpp_sqlite::Database>(path.string(), true, logger.getLogger());

  // Parent table first so foreign keys resolve on flush
  database_->getDAO<QueryRecord>();
  database_->getDAO<OverlapRecord>();
  database_->getDAO<DuplicateRecord>();
  database_->getDAO<WarningRecord>();
  database_->getDAO<SampleTimeRecord>();

  spdlog::info("Opened clash store '{}'", path.string());
}

uint32_t ClashDataStore::saveReport(const ReportDocument& document)
{
  std::scoped_lock lock{mutex_};

  QueryRecord query{};
  query.name = document.config.queryName;
  query.comment = document.config.comment;
  query.mode = std::string{toString(document.config.mode)};
  query.clash_tolerance = document.config.clashTolerance;
  query.clearance_tolerance = document.config.clearanceTolerance;
  query.resolved_at_ms =
    static_cast<double>(document.resolvedAt.time_since_epoch().count());
  query.schema_version = document.schemaVersion;
  query.overlap_count = static_cast<uint32_t>(document.records.size());
  query.config_json = clash_report::configToJson(document.config).dump();

  auto& overlapDAO = database_->getDAO<OverlapRecord>();
  auto& duplicateDAO = database_->getDAO<DuplicateRecord>();
  auto& warningDAO = database_->getDAO<WarningRecord>();
  auto& sampleDAO = database_->getDAO<SampleTimeRecord>();

  uint32_t queryId = 0;
  try
  {
    // The parent row and its children commit or roll back together
    database_->withTransaction(
      [&]()
      {
        database_->getDAO<QueryRecord>().insert(query);
        queryId = static_cast<uint32_t>(query.id);

        for (const auto& record : document.records)
        {
          checkSampleRange(record, document.sampleTimes.size());
          overlapDAO.addToBuffer(toOverlapRecord(record, queryId));
        }

        for (const auto& duplicate : document.duplicates)
        {
          DuplicateRecord row{};
          row.object_a = duplicate.pair.first();
          row.object_b = duplicate.pair.second();
          row.content_hash = std::to_string(duplicate.contentHash);
          row.first_time = duplicate.firstTime;
          row.last_time = duplicate.lastTime;
          row.query.id = queryId;
          duplicateDAO.addToBuffer(row);
        }

        for (size_t i = 0; i < document.warnings.size(); ++i)
        {
          const auto& warning = document.warnings[i];
          WarningRecord row{};
          row.sequence = static_cast<uint32_t>(i);
          row.kind = std::string{toString(warning.kind)};
          row.path = warning.path;
          row.time = warning.time;
          row.message = warning.message;
          row.query.id = queryId;
          warningDAO.addToBuffer(row);
        }

        for (size_t i = 0; i < document.sampleTimes.size(); ++i)
        {
          SampleTimeRecord row{};
          row.sample_index = static_cast<uint32_t>(i);
          row.sample_time = document.sampleTimes[i];
          row.query.id = queryId;
          sampleDAO.addToBuffer(row);
        }

        database_->flushAllDAOs();
      });
  }
  catch (const std::exception& e)
  {
    // Rows buffered for the rolled-back query must not reach the next flush
    overlapDAO.clearBuffer();
    duplicateDAO.clearBuffer();
    warningDAO.clearBuffer();
    sampleDAO.clearBuffer();
    spdlog::error("Failed to store query '{}': {}", query.name, e.what());
    throw;
  }

  spdlog::info("Stored query {} ('{}') with {} clash record(s)",
               queryId,
               query.name,
               document.records.size());
  return queryId;
}

std::optional<ReportDocument> ClashDataStore::loadReport(uint32_t queryId)
{
  std::scoped_lock lock{mutex_};

  auto query = database_->getDAO<QueryRecord>().selectById(queryId);
  if (!query.has_value())
  {
    return std::nullopt;
  }

  if (query->schema_version > ReportDocument::kSchemaVersion)
  {
    spdlog::error("Query {} was stored with schema version {}, newer than supported {}",
                  queryId,
                  query->schema_version,
                  ReportDocument::kSchemaVersion);
    throw ReportIOError("Report schema version " + std::to_string(query->schema_version) +
                        " is newer than supported version " +
                        std::to_string(ReportDocument::kSchemaVersion));
  }

  ReportDocument document;
  try
  {
    document.schemaVersion = query->schema_version;
    document.config =
      clash_report::configFromJson(nlohmann::json::parse(query->config_json));
    document.resolvedAt = ReportTimestamp{
      std::chrono::milliseconds{static_cast<int64_t>(std::llround(query->resolved_at_ms))}};

    auto samples = selectForQuery<SampleTimeRecord>(*database_, queryId);
    std::sort(samples.begin(),
              samples.end(),
              [](const SampleTimeRecord& a, const SampleTimeRecord& b)
              { return a.sample_index < b.sample_index; });
    for (const auto& sample : samples)
    {
      document.sampleTimes.push_back(sample.sample_time);
    }

    for (const auto& row : selectForQuery<OverlapRecord>(*database_, queryId))
    {
      document.records.push_back(fromOverlapRecord(row));
    }

    for (const auto& row : selectForQuery<DuplicateRecord>(*database_, queryId))
    {
      DuplicateGeometry duplicate;
      duplicate.pair = ClashPair{row.object_a, row.object_b};
      duplicate.contentHash = std::stoull(row.content_hash);
      duplicate.firstTime = row.first_time;
      duplicate.lastTime = row.last_time;
      document.duplicates.push_back(std::move(duplicate));
    }

    auto warnings = selectForQuery<WarningRecord>(*database_, queryId);
    std::sort(warnings.begin(),
              warnings.end(),
              [](const WarningRecord& a, const WarningRecord& b)
              { return a.sequence < b.sequence; });
    for (const auto& row : warnings)
    {
      document.warnings.push_back(
        ResolutionWarning{warningKindFromString(row.kind), row.path, row.time, row.message});
    }
  }
  catch (const nlohmann::json::exception& e)
  {
    spdlog::error("Stored config of query {} is malformed: {}", queryId, e.what());
    throw ReportIOError("Stored config of query " + std::to_string(queryId) +
                        " is malformed: " + e.what());
  }
  catch (const std::logic_error& e)
  {
    spdlog::error("Stored rows of query {} are malformed: {}", queryId, e.what());
    throw ReportIOError("Stored rows of query " + std::to_string(queryId) +
                        " are malformed: " + e.what());
  }

  return document;
}

uint32_t ClashDataStore::removeReport(uint32_t queryId)
{
  std::scoped_lock lock{mutex_};

  uint32_t removed = 0;
  database_->withTransaction(
    [&]()
    {
      // Children before the parent so no row is left pointing at a deleted query
      removed += deleteWhere(
        *database_, database_->getDAO<OverlapRecord>().getTableName(), "query_id", queryId);
      removed += deleteWhere(
        *database_, database_->getDAO<DuplicateRecord>().getTableName(), "query_id", queryId);
      removed += deleteWhere(
        *database_, database_->getDAO<WarningRecord>().getTableName(), "query_id", queryId);
      removed += deleteWhere(
        *database_, database_->getDAO<SampleTimeRecord>().getTableName(), "query_id", queryId);
      removed += deleteWhere(
        *database_, database_->getDAO<QueryRecord>().getTableName(), "id", queryId);
    });

  if (removed == 0)
  {
    spdlog::warn("No stored query with id {} to remove", queryId);
  }
  else
  {
    spdlog::info("Removed query {} ({} row(s))", queryId, removed);
  }
  return removed;
}

std::vector<QuerySummary> ClashDataStore::listQueries()
{
  std::scoped_lock lock{mutex_};

  std::vector<QuerySummary> summaries;
  for (const auto& query : database_->getDAO<QueryRecord>().selectAll())
  {
    summaries.push_back(
      QuerySummary{static_cast<uint32_t>(query.id), query.name, query.overlap_count});
  }
  std::sort(summaries.begin(),
            summaries.end(),
            [](const QuerySummary& a, const QuerySummary& b) { return a.id < b.id; });
  return summaries;
}

}  // namespace clash_db
