#include "clash-core/src/Detection/DetectionConfig.hpp"

#include <cmath>
#include <stdexcept>

#include "clash-core/src/Detection/DetectionErrors.hpp"

namespace clash_core
{

namespace
{

void validateRange(const DetectionConfig& config)
{
  if (!std::isfinite(config.startTime) || !std::isfinite(config.endTime))
  {
    throw InvalidRangeError("Dynamic time range must be finite");
  }
  if (config.endTime < config.startTime)
  {
    throw InvalidRangeError("Dynamic end time " +
                            std::to_string(config.endTime) +
                            " precedes start time " +
                            std::to_string(config.startTime));
  }
  if (!std::isfinite(config.timeStep) || config.timeStep <= 0.0)
  {
    throw InvalidRangeError("Dynamic time step must be positive, got " +
                            std::to_string(config.timeStep));
  }
}

}  // namespace

std::string_view toString(DetectionMode mode)
{
  return mode == DetectionMode::Dynamic ? "Dynamic" : "Static";
}

DetectionMode detectionModeFromString(std::string_view name)
{
  if (name == "Static")
  {
    return DetectionMode::Static;
  }
  if (name == "Dynamic")
  {
    return DetectionMode::Dynamic;
  }
  throw std::invalid_argument("Unknown detection mode: " + std::string{name});
}

void DetectionConfig::validate() const
{
  if (mode == DetectionMode::Dynamic)
  {
    validateRange(*this);
  }

  if (groupA.empty())
  {
    throw std::invalid_argument("DetectionConfig: group A is empty");
  }
  if (!std::isfinite(clashTolerance) || clashTolerance < 0.0)
  {
    throw std::invalid_argument(
      "DetectionConfig: clash tolerance must be finite and >= 0");
  }
  if (!std::isfinite(clearanceTolerance) ||
      clearanceTolerance <= clashTolerance)
  {
    throw std::invalid_argument(
      "DetectionConfig: clearance tolerance must be greater than the clash "
      "tolerance");
  }
  if (pairBatchSize == 0)
  {
    throw std::invalid_argument("DetectionConfig: pair batch size must be > 0");
  }
  if (workerCount > kMaxWorkerCount)
  {
    throw std::invalid_argument("DetectionConfig: worker count " +
                                std::to_string(workerCount) + " exceeds " +
                                std::to_string(kMaxWorkerCount));
  }
}

std::vector<double> DetectionConfig::sampleTimes() const
{
  if (mode == DetectionMode::Static)
  {
    return {staticTime};
  }

  validateRange(*this);

  // Times are computed from the index, not accumulated, to avoid drift
  std::vector<double> times;
  const double closeEnough = 1e-9 * timeStep;
  for (uint64_t i = 0;; ++i)
  {
    const double t = startTime + static_cast<double>(i) * timeStep;
    if (t >= endTime - closeEnough)
    {
      break;
    }
    times.push_back(t);
  }
  times.push_back(endTime);
  return times;
}

}  // namespace clash_core
