// Ticket: 0010_result_aggregator

#include <gtest/gtest.h>

#include <vector>

#include "clash-core/src/Pipeline/ResultAggregator.hpp"

using namespace clash_core;

namespace
{

ClashRecord pointRecord(const ClashPair& pair,
                        Classification classification,
                        uint32_t sample,
                        double distance)
{
  ClashRecord record;
  record.pair = pair;
  record.classification = classification;
  record.distance = distance;
  record.startSample = sample;
  record.endSample = sample;
  record.startTime = static_cast<double>(sample);
  record.endTime = static_cast<double>(sample);
  record.contact = ContactLocation{Coordinate{distance, 0.0, 0.0}, Coordinate{0.0, 0.0, 0.0}};
  return record;
}

const ClashPair kAB{"/A", "/B"};
const ClashPair kAC{"/A", "/C"};

}  // anonymous namespace

TEST(ResultAggregatorTest, Merge_ConsecutiveSamplesFoldIntoInterval)
{
  const auto merged = ResultAggregator::mergeIntervals(
    {pointRecord(kAB, Classification::Clash, 1, -0.1),
     pointRecord(kAB, Classification::Clash, 2, -0.4),
     pointRecord(kAB, Classification::Clash, 3, -0.2)});

  ASSERT_EQ(1u, merged.size());
  EXPECT_EQ(1u, merged[0].startSample);
  EXPECT_EQ(3u, merged[0].endSample);
  EXPECT_DOUBLE_EQ(1.0, merged[0].startTime);
  EXPECT_DOUBLE_EQ(3.0, merged[0].endTime);
  EXPECT_EQ(3u, merged[0].sampleCount());

  // Deepest sample wins, together with its contact
  EXPECT_DOUBLE_EQ(-0.4, merged[0].distance);
  EXPECT_DOUBLE_EQ(-0.4, merged[0].contact->pointA.x());
}

TEST(ResultAggregatorTest, Merge_GapClosesInterval)
{
  const auto merged = ResultAggregator::mergeIntervals(
    {pointRecord(kAB, Classification::Clash, 0, -0.1),
     pointRecord(kAB, Classification::Clash, 2, -0.1)});

  ASSERT_EQ(2u, merged.size());
  EXPECT_EQ(0u, merged[0].startSample);
  EXPECT_EQ(2u, merged[1].startSample);
}

TEST(ResultAggregatorTest, Merge_ClassificationChangeStartsNewInterval)
{
  const auto merged = ResultAggregator::mergeIntervals(
    {pointRecord(kAB, Classification::Clearance, 0, 0.05),
     pointRecord(kAB, Classification::Clash, 1, -0.1),
     pointRecord(kAB, Classification::Clearance, 2, 0.05)});

  ASSERT_EQ(3u, merged.size());
  EXPECT_EQ(Classification::Clearance, merged[0].classification);
  EXPECT_EQ(Classification::Clash, merged[1].classification);
  EXPECT_EQ(Classification::Clearance, merged[2].classification);
}

TEST(ResultAggregatorTest, Merge_PairsStayApart)
{
  const auto merged = ResultAggregator::mergeIntervals(
    {pointRecord(kAC, Classification::Clash, 0, -0.1),
     pointRecord(kAB, Classification::Clash, 1, -0.1),
     pointRecord(kAB, Classification::Clash, 0, -0.1)});

  ASSERT_EQ(2u, merged.size());
  EXPECT_EQ(kAB, merged[0].pair);
  EXPECT_EQ(2u, merged[0].sampleCount());
  EXPECT_EQ(kAC, merged[1].pair);
}

TEST(ResultAggregatorTest, Merge_IsIdempotent)
{
  const std::vector<ClashRecord> points{
    pointRecord(kAB, Classification::Clash, 0, -0.1),
    pointRecord(kAB, Classification::Clash, 1, -0.3),
    pointRecord(kAB, Classification::Clearance, 2, 0.05),
    pointRecord(kAB, Classification::Clash, 4, -0.1),
    pointRecord(kAC, Classification::Clearance, 1, 0.02),
    pointRecord(kAC, Classification::Clearance, 2, 0.01)};

  const auto once = ResultAggregator::mergeIntervals(points);
  const auto twice = ResultAggregator::mergeIntervals(once);
  EXPECT_EQ(once, twice);
}

TEST(ResultAggregatorTest, Merge_ExactRepeatsCollapse)
{
  const auto record = pointRecord(kAB, Classification::Clash, 1, -0.2);
  const auto merged = ResultAggregator::mergeIntervals({record, record});

  ASSERT_EQ(1u, merged.size());
  EXPECT_EQ(record, merged[0]);
}

TEST(ResultAggregatorTest, Finalize_SortsByPairThenTime)
{
  ResultAggregator aggregator;
  aggregator.addRecords({pointRecord(kAC, Classification::Clash, 0, -0.1),
                         pointRecord(kAB, Classification::Clash, 3, -0.1)});
  aggregator.addRecords({pointRecord(kAB, Classification::Clearance, 0, 0.05)});
  EXPECT_EQ(3u, aggregator.recordCount());

  DetectionConfig config;
  config.groupA = {"/A", "/B", "/C"};
  const ReportDocument document =
    aggregator.finalize(config, {0.0, 1.0, 2.0, 3.0}, ReportTimestamp{});

  ASSERT_EQ(3u, document.records.size());
  EXPECT_EQ(kAB, document.records[0].pair);
  EXPECT_DOUBLE_EQ(0.0, document.records[0].startTime);
  EXPECT_EQ(kAB, document.records[1].pair);
  EXPECT_DOUBLE_EQ(3.0, document.records[1].startTime);
  EXPECT_EQ(kAC, document.records[2].pair);
  EXPECT_EQ(config, document.config);
  EXPECT_EQ(4u, document.sampleTimes.size());
}

TEST(ResultAggregatorTest, Duplicates_FoldFirstAndLastTime)
{
  ResultAggregator aggregator;
  aggregator.addDuplicates({DuplicateGeometry{kAB, 99, 1.0, 1.0}});
  aggregator.addDuplicates({DuplicateGeometry{kAB, 99, 2.0, 2.0},
                            DuplicateGeometry{kAC, 42, 2.0, 2.0}});

  const ReportDocument document = aggregator.finalize({}, {}, ReportTimestamp{});

  ASSERT_EQ(2u, document.duplicates.size());
  EXPECT_EQ(kAB, document.duplicates[0].pair);
  EXPECT_DOUBLE_EQ(1.0, document.duplicates[0].firstTime);
  EXPECT_DOUBLE_EQ(2.0, document.duplicates[0].lastTime);
  EXPECT_EQ(kAC, document.duplicates[1].pair);
}

TEST(ResultAggregatorTest, Warnings_KeepFirstSeenOrderWithoutRepeats)
{
  const ResolutionWarning missing{WarningKind::MissingObject, "/X", 0.0, "gone"};
  const ResolutionWarning degenerate{WarningKind::DegenerateGeometry, "/Y", 0.0, "flat"};

  ResultAggregator aggregator;
  aggregator.addWarnings({missing, degenerate});
  aggregator.addWarnings({missing});

  const ReportDocument document = aggregator.finalize({}, {}, ReportTimestamp{});
  ASSERT_EQ(2u, document.warnings.size());
  EXPECT_EQ(missing, document.warnings[0]);
  EXPECT_EQ(degenerate, document.warnings[1]);
}

TEST(ResultAggregatorTest, Clear_ResetsEverything)
{
  ResultAggregator aggregator;
  aggregator.addRecords({pointRecord(kAB, Classification::Clash, 0, -0.1)});
  aggregator.addWarnings({ResolutionWarning{WarningKind::MissingObject, "/X", 0.0, ""}});
  aggregator.clear();

  const ReportDocument document = aggregator.finalize({}, {}, ReportTimestamp{});
  EXPECT_EQ(0u, aggregator.recordCount());
  EXPECT_TRUE(document.records.empty());
  EXPECT_TRUE(document.warnings.empty());
}
