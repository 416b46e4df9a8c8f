// Ticket: 0015_clash_data_store
// Test: ClashDataStore persistence

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "clash-core/src/Detection/DetectionErrors.hpp"
#include "clash-db/src/ClashDataStore.hpp"
#include "clash-report/test/ReportFixtures.hpp"

namespace clash_db
{
namespace test
{

class ClashDataStoreTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    dbPath_ = std::filesystem::temp_directory_path() /
              ("clash_data_store_test_" + std::to_string(testCounter_++) + ".db");
    std::filesystem::remove(dbPath_);
  }

  void TearDown() override
  {
    if (std::filesystem::exists(dbPath_))
    {
      std::filesystem::remove(dbPath_);
    }
  }

  std::filesystem::path dbPath_;
  static int testCounter_;
};

int ClashDataStoreTest::testCounter_ = 0;

// ========== Save / Load ==========

TEST_F(ClashDataStoreTest, Constructor_CreatesDatabase)
{
  ClashDataStore store{dbPath_};
  EXPECT_TRUE(std::filesystem::exists(dbPath_));
  EXPECT_TRUE(store.listQueries().empty());
}

TEST_F(ClashDataStoreTest, SaveLoad_RestoresEveryField)
{
  const clash_core::ReportDocument original = clash_report::test::makeSampleReport();

  ClashDataStore store{dbPath_};
  const uint32_t id = store.saveReport(original);

  const auto restored = store.loadReport(id);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(original, *restored);
}

TEST_F(ClashDataStoreTest, SaveLoad_SurvivesReopen)
{
  const clash_core::ReportDocument original = clash_report::test::makeSampleReport();

  uint32_t id = 0;
  {
    ClashDataStore store{dbPath_};
    id = store.saveReport(original);
  }

  ClashDataStore reopened{dbPath_};
  const auto restored = reopened.loadReport(id);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(original, *restored);
}

TEST_F(ClashDataStoreTest, Save_QueriesKeepTheirOwnRecords)
{
  clash_core::ReportDocument first = clash_report::test::makeSampleReport();
  clash_core::ReportDocument second = first;
  second.config.queryName = "second";
  second.records.pop_back();
  second.duplicates.clear();
  second.warnings.clear();

  ClashDataStore store{dbPath_};
  const uint32_t firstId = store.saveReport(first);
  const uint32_t secondId = store.saveReport(second);
  EXPECT_NE(firstId, secondId);

  const auto firstRestored = store.loadReport(firstId);
  const auto secondRestored = store.loadReport(secondId);
  ASSERT_TRUE(firstRestored.has_value());
  ASSERT_TRUE(secondRestored.has_value());
  EXPECT_EQ(first, *firstRestored);
  EXPECT_EQ(second, *secondRestored);
}

TEST_F(ClashDataStoreTest, Save_EmptyReport)
{
  clash_core::ReportDocument empty;
  empty.config.groupA = {"/World"};

  ClashDataStore store{dbPath_};
  const auto restored = store.loadReport(store.saveReport(empty));
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(empty, *restored);
}

TEST_F(ClashDataStoreTest, Save_FailureLeavesNoRows)
{
  clash_core::ReportDocument broken = clash_report::test::makeSampleReport();
  broken.config.queryName = "broken";
  broken.records.back().endSample = 9;  // Only 5 sample times

  const clash_core::ReportDocument good = clash_report::test::makeSampleReport();

  ClashDataStore store{dbPath_};
  EXPECT_THROW(store.saveReport(broken), clash_core::ReportIOError);
  EXPECT_TRUE(store.listQueries().empty());

  // Nothing buffered for the failed save leaks into the next one
  const uint32_t id = store.saveReport(good);
  const auto queries = store.listQueries();
  ASSERT_EQ(1u, queries.size());
  EXPECT_EQ(id, queries[0].id);

  const auto restored = store.loadReport(id);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(good, *restored);
}

TEST_F(ClashDataStoreTest, Save_FailureNotVisibleAfterReopen)
{
  clash_core::ReportDocument broken = clash_report::test::makeSampleReport();
  broken.records.front().startSample = 4;
  broken.records.front().endSample = 2;

  {
    ClashDataStore store{dbPath_};
    EXPECT_THROW(store.saveReport(broken), clash_core::ReportIOError);
  }

  ClashDataStore reopened{dbPath_};
  EXPECT_TRUE(reopened.listQueries().empty());
}

// ========== Load ==========

TEST_F(ClashDataStoreTest, LoadReport_NewerSchemaVersionThrows)
{
  clash_core::ReportDocument future = clash_report::test::makeSampleReport();
  future.schemaVersion = clash_core::ReportDocument::kSchemaVersion + 1;

  ClashDataStore store{dbPath_};
  const uint32_t id = store.saveReport(future);
  EXPECT_THROW(store.loadReport(id), clash_core::ReportIOError);
}

TEST_F(ClashDataStoreTest, LoadReport_CurrentSchemaVersionLoads)
{
  const clash_core::ReportDocument current = clash_report::test::makeSampleReport();

  ClashDataStore store{dbPath_};
  const auto restored = store.loadReport(store.saveReport(current));
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(clash_core::ReportDocument::kSchemaVersion, restored->schemaVersion);
}

// ========== Remove ==========

TEST_F(ClashDataStoreTest, RemoveReport_DeletesQueryAndLinkedRows)
{
  const clash_core::ReportDocument document = clash_report::test::makeSampleReport();

  ClashDataStore store{dbPath_};
  const uint32_t id = store.saveReport(document);

  // 1 query + 2 overlaps + 1 duplicate + 1 warning + 5 sample times
  EXPECT_EQ(10u, store.removeReport(id));
  EXPECT_FALSE(store.loadReport(id).has_value());
  EXPECT_TRUE(store.listQueries().empty());
}

TEST_F(ClashDataStoreTest, RemoveReport_OtherQueriesUntouched)
{
  clash_core::ReportDocument first = clash_report::test::makeSampleReport();
  clash_core::ReportDocument second = first;
  second.config.queryName = "second";
  second.records.pop_back();

  ClashDataStore store{dbPath_};
  const uint32_t firstId = store.saveReport(first);
  const uint32_t secondId = store.saveReport(second);

  EXPECT_EQ(10u, store.removeReport(firstId));

  const auto queries = store.listQueries();
  ASSERT_EQ(1u, queries.size());
  EXPECT_EQ(secondId, queries[0].id);

  const auto restored = store.loadReport(secondId);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(second, *restored);
}

TEST_F(ClashDataStoreTest, RemoveReport_UnknownIdRemovesNothing)
{
  ClashDataStore store{dbPath_};
  const uint32_t id = store.saveReport(clash_report::test::makeSampleReport());

  EXPECT_EQ(0u, store.removeReport(id + 1));
  EXPECT_EQ(1u, store.listQueries().size());
}

TEST_F(ClashDataStoreTest, RemoveReport_SecondRemoveIsNoOp)
{
  ClashDataStore store{dbPath_};
  const uint32_t id = store.saveReport(clash_report::test::makeSampleReport());

  EXPECT_GT(store.removeReport(id), 0u);
  EXPECT_EQ(0u, store.removeReport(id));
}

// ========== Queries ==========

TEST_F(ClashDataStoreTest, ListQueries_InIdOrderWithCounts)
{
  clash_core::ReportDocument first = clash_report::test::makeSampleReport();
  clash_core::ReportDocument second = first;
  second.config.queryName = "only clash";
  second.records.erase(second.records.begin());

  ClashDataStore store{dbPath_};
  const uint32_t firstId = store.saveReport(first);
  const uint32_t secondId = store.saveReport(second);

  const auto queries = store.listQueries();
  ASSERT_EQ(2u, queries.size());
  EXPECT_EQ(firstId, queries[0].id);
  EXPECT_EQ("Level 2 & services", queries[0].name);
  EXPECT_EQ(2u, queries[0].overlapCount);
  EXPECT_EQ(secondId, queries[1].id);
  EXPECT_EQ("only clash", queries[1].name);
  EXPECT_EQ(1u, queries[1].overlapCount);
}

TEST_F(ClashDataStoreTest, LoadReport_UnknownIdIsNullopt)
{
  ClashDataStore store{dbPath_};
  EXPECT_FALSE(store.loadReport(42).has_value());
}

}  // namespace test
}  // namespace clash_db
