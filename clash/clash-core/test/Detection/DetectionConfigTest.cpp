// Ticket: 0004_detection_config

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <vector>

#include "clash-core/src/Detection/DetectionConfig.hpp"
#include "clash-core/src/Detection/DetectionErrors.hpp"

using namespace clash_core;

namespace
{

DetectionConfig dynamicConfig(double start, double end, double step)
{
  DetectionConfig config;
  config.groupA = {"/World"};
  config.mode = DetectionMode::Dynamic;
  config.startTime = start;
  config.endTime = end;
  config.timeStep = step;
  return config;
}

}  // anonymous namespace

// ============================================================================
// Sample times
// ============================================================================

TEST(DetectionConfigTest, SampleTimes_StaticIsSingleSample)
{
  DetectionConfig config;
  config.groupA = {"/World"};
  config.staticTime = 3.5;
  config.startTime = 0.0;
  config.endTime = 10.0;

  EXPECT_EQ(std::vector<double>{3.5}, config.sampleTimes());
}

TEST(DetectionConfigTest, SampleTimes_EvenStepIncludesEnd)
{
  EXPECT_EQ((std::vector<double>{0.0, 1.0, 2.0, 3.0, 4.0}),
            dynamicConfig(0.0, 4.0, 1.0).sampleTimes());
}

TEST(DetectionConfigTest, SampleTimes_UnevenStepAppendsEnd)
{
  EXPECT_EQ((std::vector<double>{0.0, 1.5, 3.0, 4.0}),
            dynamicConfig(0.0, 4.0, 1.5).sampleTimes());
}

TEST(DetectionConfigTest, SampleTimes_ZeroLengthRangeIsOneSample)
{
  EXPECT_EQ(std::vector<double>{2.0}, dynamicConfig(2.0, 2.0, 0.5).sampleTimes());
}

TEST(DetectionConfigTest, SampleTimes_NoDriftOverManySteps)
{
  const std::vector<double> times = dynamicConfig(0.0, 1.0, 0.1).sampleTimes();

  ASSERT_EQ(11u, times.size());
  EXPECT_DOUBLE_EQ(0.7, times[7]);
  EXPECT_DOUBLE_EQ(1.0, times.back());
}

// ============================================================================
// Validation
// ============================================================================

TEST(DetectionConfigTest, Validate_DefaultsWithGroupAccepted)
{
  DetectionConfig config;
  config.groupA = {"/World/A"};
  EXPECT_NO_THROW(config.validate());
  EXPECT_DOUBLE_EQ(0.0, config.clashTolerance);
  EXPECT_GT(config.clearanceTolerance, config.clashTolerance);
}

TEST(DetectionConfigTest, Validate_ReversedRangeIsInvalidRange)
{
  EXPECT_THROW(dynamicConfig(5.0, 1.0, 1.0).validate(), InvalidRangeError);
  EXPECT_THROW(dynamicConfig(5.0, 1.0, 1.0).sampleTimes(), InvalidRangeError);
}

TEST(DetectionConfigTest, Validate_NonPositiveStepIsInvalidRange)
{
  EXPECT_THROW(dynamicConfig(0.0, 1.0, 0.0).validate(), InvalidRangeError);
  EXPECT_THROW(dynamicConfig(0.0, 1.0, -0.5).validate(), InvalidRangeError);
  EXPECT_THROW(
    dynamicConfig(0.0, 1.0, std::numeric_limits<double>::quiet_NaN()).validate(),
    InvalidRangeError);
}

TEST(DetectionConfigTest, Validate_StaticModeIgnoresRange)
{
  DetectionConfig config = dynamicConfig(5.0, 1.0, 0.0);
  config.mode = DetectionMode::Static;
  EXPECT_NO_THROW(config.validate());
}

TEST(DetectionConfigTest, Validate_EmptyGroupRejected)
{
  DetectionConfig config;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(DetectionConfigTest, Validate_ToleranceOrderingEnforced)
{
  DetectionConfig config;
  config.groupA = {"/World"};

  config.clashTolerance = 0.1;
  config.clearanceTolerance = 0.1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.clashTolerance = -0.01;
  config.clearanceTolerance = 0.1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.clashTolerance = 0.01;
  config.clearanceTolerance = 0.1;
  EXPECT_NO_THROW(config.validate());
  EXPECT_DOUBLE_EQ(0.1, config.maxTolerance());
}

TEST(DetectionConfigTest, Validate_ZeroBatchSizeRejected)
{
  DetectionConfig config;
  config.groupA = {"/World"};
  config.pairBatchSize = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(DetectionConfigTest, Validate_WorkerCountBounded)
{
  DetectionConfig config;
  config.groupA = {"/World"};
  config.workerCount = DetectionConfig::kMaxWorkerCount;
  EXPECT_NO_THROW(config.validate());

  config.workerCount = DetectionConfig::kMaxWorkerCount + 1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  // A wrapped negative count
  config.workerCount = static_cast<size_t>(-1);
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(DetectionConfigTest, Mode_NamesRoundTrip)
{
  EXPECT_EQ(DetectionMode::Dynamic, detectionModeFromString(toString(DetectionMode::Dynamic)));
  EXPECT_EQ(DetectionMode::Static, detectionModeFromString(toString(DetectionMode::Static)));
  EXPECT_THROW(detectionModeFromString("Sometimes"), std::invalid_argument);
}
