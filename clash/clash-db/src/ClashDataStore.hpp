// Ticket: 0015_clash_data_store

#ifndef CLASH_DB_CLASH_DATA_STORE_HPP
#define CLASH_DB_CLASH_DATA_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "clash-core/src/Detection/ReportDocument.hpp"

namespace clash_db
{

/**
 * @brief One row of listQueries()
 */
struct QuerySummary
{
  uint32_t id{0};
  std::string name;
  uint32_t overlapCount{0};
};

/**
 * @brief SQLite persistence of detection runs
 *
 * Each saved ReportDocument becomes one QueryRecord plus the overlap,
 * duplicate, warning and sample-time records that reference it. The query
 * row and its records are written in one transaction: a save that throws
 * leaves neither behind. A store may hold any number of runs.
 *
 * Thread safety: all public methods serialise on an internal mutex.
 *
 * @ticket 0015_clash_data_store
 */
class ClashDataStore
{
public:
  /**
   * @brief Open (or create) the database at path
   */
  explicit ClashDataStore(const std::filesystem::path& path);

  ClashDataStore(const ClashDataStore&) = delete;
  ClashDataStore& operator=(const ClashDataStore&) = delete;
  ClashDataStore(ClashDataStore&&) = delete;
  ClashDataStore& operator=(ClashDataStore&&) = delete;
  ~ClashDataStore() = default;

  /**
   * @brief Store document and every record it carries
   * @return Id of the new query record
   * @throws clash_core::ReportIOError if a clash record references a sample
   *         outside document.sampleTimes
   */
  uint32_t saveReport(const clash_core::ReportDocument& document);

  /**
   * @brief Rebuild the document stored under queryId
   * @return std::nullopt if no query has that id
   * @throws clash_core::ReportIOError if the stored rows cannot be decoded or
   *         were written with a newer schema version
   */
  std::optional<clash_core::ReportDocument> loadReport(uint32_t queryId);

  /**
   * @brief Delete the query and every record linked to it
   *
   * One transaction. Other queries are untouched.
   *
   * @return Number of rows removed, 0 if no query has that id
   */
  uint32_t removeReport(uint32_t queryId);

  /**
   * @brief All stored queries in id order
   */
  std::vector<QuerySummary> listQueries();

private:
  std::mutex mutex_;
  std::unique_ptr<cpp_sqlite::Database> database_;
};

}  // namespace clash_db

#endif  // CLASH_DB_CLASH_DATA_STORE_HPP
